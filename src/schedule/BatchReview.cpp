#include "custody/schedule/BatchReview.hpp"

#include "custody/core/Logging.hpp"

namespace custody {
namespace schedule {

using core::ErrorCode;
using core::ScheduleError;

QString reviewStateName(ReviewState state)
{
    switch (state) {
    case ReviewState::Proposed:
        return QStringLiteral("proposed");
    case ReviewState::Approved:
        return QStringLiteral("approved");
    case ReviewState::Rejected:
        return QStringLiteral("rejected");
    case ReviewState::Applied:
        return QStringLiteral("applied");
    case ReviewState::ApplyFailed:
        return QStringLiteral("apply-failed");
    case ReviewState::Discarded:
        return QStringLiteral("discarded");
    }
    return QStringLiteral("unknown");
}

bool isTerminal(ReviewState state)
{
    return state == ReviewState::Rejected || state == ReviewState::Applied || state == ReviewState::Discarded;
}

BatchReview::BatchReview(ChangeBatch batch)
    : m_batch(std::move(batch))
{
}

const ChangeBatch &BatchReview::batch() const
{
    return m_batch;
}

ReviewState BatchReview::state() const
{
    return m_state;
}

const std::optional<ApplyOutcome> &BatchReview::lastOutcome() const
{
    return m_lastOutcome;
}

const QDateTime &BatchReview::settledAt() const
{
    return m_settledAt;
}

TransitionResult BatchReview::approve()
{
    if (m_state != ReviewState::Proposed && m_state != ReviewState::ApplyFailed) {
        return refuse("approve");
    }
    return moveTo(ReviewState::Approved);
}

TransitionResult BatchReview::reject()
{
    if (m_state != ReviewState::Proposed) {
        return refuse("reject");
    }
    return moveTo(ReviewState::Rejected);
}

TransitionResult BatchReview::discard()
{
    if (m_state != ReviewState::Proposed && m_state != ReviewState::ApplyFailed) {
        return refuse("discard");
    }
    return moveTo(ReviewState::Discarded);
}

TransitionResult BatchReview::apply(data::TimeBlockStore &store, const BatchApplier &applier)
{
    if (m_state != ReviewState::Approved) {
        return refuse("apply");
    }

    ApplyOutcome outcome = applier.apply(m_batch, store);
    m_lastOutcome = outcome;
    if (outcome.ok()) {
        return moveTo(ReviewState::Applied);
    }

    TransitionResult result;
    result.ok = false;
    if (outcome.error && outcome.error->code == ErrorCode::StoreBusy) {
        // Still approved; the caller may retry once the store is free.
        result.state = m_state;
        result.error = outcome.error;
        return result;
    }

    m_state = ReviewState::ApplyFailed;
    result.state = m_state;
    ScheduleError error = ScheduleError::make(
        ErrorCode::ApplyFailed,
        QStringLiteral("Batch could not be applied: %1").arg(outcome.error ? outcome.error->toString() : QString()));
    if (outcome.error) {
        error.proposalIndex = outcome.error->proposalIndex;
        error.proposalId = outcome.error->proposalId;
    }
    result.error = std::move(error);
    qCInfo(lcWorkflow) << "Batch" << m_batch.id << "moved to" << reviewStateName(m_state);
    return result;
}

TransitionResult BatchReview::refuse(const char *action) const
{
    TransitionResult result;
    result.state = m_state;
    result.error = ScheduleError::make(ErrorCode::InvalidTransition,
                                       QStringLiteral("Cannot %1 a batch that is %2")
                                           .arg(QLatin1String(action), reviewStateName(m_state)));
    qCDebug(lcWorkflow) << "Refused" << action << "for batch" << m_batch.id << "in state" << reviewStateName(m_state);
    return result;
}

TransitionResult BatchReview::moveTo(ReviewState state)
{
    qCDebug(lcWorkflow) << "Batch" << m_batch.id << reviewStateName(m_state) << "->" << reviewStateName(state);
    m_state = state;
    if (isTerminal(m_state)) {
        m_settledAt = QDateTime::currentDateTimeUtc();
    }
    TransitionResult result;
    result.ok = true;
    result.state = m_state;
    return result;
}

} // namespace schedule
} // namespace custody
