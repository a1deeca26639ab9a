#include "custody/schedule/ReviewQueue.hpp"

#include <QMutexLocker>
#include <algorithm>

#include "custody/core/Logging.hpp"

namespace custody {
namespace schedule {

ReviewQueue::ReviewQueue() = default;

void ReviewQueue::add(ChangeBatch batch)
{
    QMutexLocker locker(&m_mutex);
    qCDebug(lcWorkflow) << "Queued batch" << batch.id << "with" << batch.changeCount() << "changes";
    m_reviews.emplace_back(std::move(batch));
}

std::optional<BatchReview> ReviewQueue::find(const QUuid &batchId) const
{
    QMutexLocker locker(&m_mutex);
    for (const auto &review : m_reviews) {
        if (review.batch().id == batchId) {
            return review;
        }
    }
    return std::nullopt;
}

std::vector<BatchReview> ReviewQueue::reviews() const
{
    QMutexLocker locker(&m_mutex);
    return m_reviews;
}

std::vector<BatchReview> ReviewQueue::pending() const
{
    QMutexLocker locker(&m_mutex);
    std::vector<BatchReview> result;
    for (const auto &review : m_reviews) {
        if (!isTerminal(review.state())) {
            result.push_back(review);
        }
    }
    return result;
}

std::size_t ReviewQueue::size() const
{
    QMutexLocker locker(&m_mutex);
    return m_reviews.size();
}

TransitionResult ReviewQueue::approve(const QUuid &batchId)
{
    QMutexLocker locker(&m_mutex);
    BatchReview *review = lookup(batchId);
    return review ? review->approve() : unknown(batchId);
}

TransitionResult ReviewQueue::reject(const QUuid &batchId)
{
    QMutexLocker locker(&m_mutex);
    BatchReview *review = lookup(batchId);
    return review ? review->reject() : unknown(batchId);
}

TransitionResult ReviewQueue::discard(const QUuid &batchId)
{
    QMutexLocker locker(&m_mutex);
    BatchReview *review = lookup(batchId);
    return review ? review->discard() : unknown(batchId);
}

TransitionResult ReviewQueue::apply(const QUuid &batchId,
                                    data::TimeBlockStore &store,
                                    const core::ScheduleSettings &settings)
{
    QMutexLocker locker(&m_mutex);
    BatchReview *review = lookup(batchId);
    if (!review) {
        return unknown(batchId);
    }
    const BatchApplier applier(settings.careWindow, BatchApplier::policyFor(review->batch(), settings));
    return review->apply(store, applier);
}

std::vector<BatchResult> ReviewQueue::approveAll()
{
    QMutexLocker locker(&m_mutex);
    std::vector<BatchResult> results;
    for (auto &review : m_reviews) {
        if (review.state() == ReviewState::Proposed) {
            results.push_back(BatchResult{ review.batch().id, review.approve() });
        }
    }
    return results;
}

std::vector<BatchResult> ReviewQueue::rejectAll()
{
    QMutexLocker locker(&m_mutex);
    std::vector<BatchResult> results;
    for (auto &review : m_reviews) {
        if (review.state() == ReviewState::Proposed) {
            results.push_back(BatchResult{ review.batch().id, review.reject() });
        }
    }
    return results;
}

std::vector<BatchResult> ReviewQueue::applyAllApproved(data::TimeBlockStore &store,
                                                       const core::ScheduleSettings &settings)
{
    QMutexLocker locker(&m_mutex);
    std::vector<BatchResult> results;
    for (auto &review : m_reviews) {
        if (review.state() != ReviewState::Approved) {
            continue;
        }
        const BatchApplier applier(settings.careWindow, BatchApplier::policyFor(review.batch(), settings));
        results.push_back(BatchResult{ review.batch().id, review.apply(store, applier) });
    }
    return results;
}

std::vector<QUuid> ReviewQueue::pruneSettled(const QDateTime &settledBefore)
{
    QMutexLocker locker(&m_mutex);
    std::vector<QUuid> pruned;
    const auto settled = [&settledBefore](const BatchReview &review) {
        return isTerminal(review.state()) && review.settledAt() < settledBefore;
    };
    for (const auto &review : m_reviews) {
        if (settled(review)) {
            pruned.push_back(review.batch().id);
        }
    }
    m_reviews.erase(std::remove_if(m_reviews.begin(), m_reviews.end(), settled), m_reviews.end());
    if (!pruned.empty()) {
        qCDebug(lcWorkflow) << "Pruned" << pruned.size() << "settled reviews";
    }
    return pruned;
}

BatchReview *ReviewQueue::lookup(const QUuid &batchId)
{
    for (auto &review : m_reviews) {
        if (review.batch().id == batchId) {
            return &review;
        }
    }
    return nullptr;
}

TransitionResult ReviewQueue::unknown(const QUuid &batchId)
{
    TransitionResult result;
    result.error = core::ScheduleError::make(core::ErrorCode::InvalidTransition,
                                             QStringLiteral("No batch %1 under review").arg(batchId.toString()));
    return result;
}

} // namespace schedule
} // namespace custody
