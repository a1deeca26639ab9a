#include "custody/schedule/BatchApplier.hpp"

#include <QHash>
#include <QSet>
#include <algorithm>
#include <cmath>

#include "custody/core/Logging.hpp"
#include "custody/data/StoreTransaction.hpp"
#include "custody/data/TimeBlockStore.hpp"

namespace custody {
namespace schedule {

using core::CareWindowPolicy;
using core::ErrorCode;
using core::OverlapPolicy;
using core::ScheduleError;
using core::SlotClock;
using data::StoreTransaction;
using data::TimeBlock;

namespace {

using HoursByProvider = std::map<data::CareProvider, double>;

// Runs one proposal against the open transaction. Touched block ids map to the
// index of the last proposal that wrote them.
struct ApplyStep
{
    StoreTransaction &transaction;
    const core::CareWindow &window;
    CareWindowPolicy windowPolicy;
    int index;
    QUuid proposalId;
    QHash<QUuid, int> &touched;

    ScheduleError fail(ErrorCode code, const QString &message) const
    {
        return ScheduleError::forProposal(code, message, index, proposalId);
    }

    std::optional<ScheduleError> checkCurrent(const TimeBlock &original) const
    {
        const auto current = transaction.findById(original.id);
        if (!current) {
            return fail(ErrorCode::StaleReference,
                        QStringLiteral("%1 is no longer scheduled").arg(data::describeBlock(original)));
        }
        if (*current != original) {
            return fail(ErrorCode::StaleReference,
                        QStringLiteral("%1 changed since the proposal was made").arg(data::describeBlock(original)));
        }
        return std::nullopt;
    }

    std::optional<ScheduleError> fit(TimeBlock &block) const
    {
        if (SlotClock::isWithinCareWindow(block.startSlot, block.endSlot, window)) {
            return std::nullopt;
        }
        if (windowPolicy == CareWindowPolicy::Reject) {
            return fail(ErrorCode::OutOfCareWindow,
                        QStringLiteral("%1 is outside the care window %2")
                            .arg(data::describeBlock(block), SlotClock::formatSlotRange(window.start, window.end)));
        }
        const auto clamped = SlotClock::clampToCareWindow(block.startSlot, block.endSlot, window);
        if (!clamped) {
            return fail(ErrorCode::OutOfCareWindow,
                        QStringLiteral("%1 does not overlap the care window").arg(data::describeBlock(block)));
        }
        qCDebug(lcApply) << "Clamped" << data::describeBlock(block) << "to"
                         << SlotClock::formatSlotRange(clamped->start, clamped->end);
        block.startSlot = clamped->start;
        block.endSlot = clamped->end;
        return std::nullopt;
    }

    std::optional<ScheduleError> write(TimeBlock block)
    {
        if (auto error = fit(block)) {
            return error;
        }
        const QUuid id = block.id;
        if (!transaction.replace(block)) {
            return fail(ErrorCode::StaleReference, QStringLiteral("Block %1 vanished during the batch").arg(id.toString()));
        }
        touched.insert(id, index);
        return std::nullopt;
    }

    std::optional<ScheduleError> operator()(const RetimeChange &change)
    {
        if (auto error = checkCurrent(change.original)) {
            return error;
        }
        return write(change.proposed);
    }

    std::optional<ScheduleError> operator()(const SwapChange &change)
    {
        if (auto error = checkCurrent(change.first.original)) {
            return error;
        }
        if (auto error = checkCurrent(change.second.original)) {
            return error;
        }
        if (auto error = write(change.first.proposed)) {
            return error;
        }
        return write(change.second.proposed);
    }

    std::optional<ScheduleError> operator()(const AddChange &change)
    {
        if (transaction.findById(change.proposed.id)) {
            return fail(ErrorCode::StaleReference,
                        QStringLiteral("Block %1 already exists").arg(change.proposed.id.toString()));
        }
        TimeBlock block = change.proposed;
        if (auto error = fit(block)) {
            return error;
        }
        const QUuid id = block.id;
        transaction.insert(std::move(block));
        touched.insert(id, index);
        return std::nullopt;
    }

    std::optional<ScheduleError> operator()(const RemoveChange &change)
    {
        if (auto error = checkCurrent(change.original)) {
            return error;
        }
        transaction.remove(change.original.id);
        touched.remove(change.original.id);
        return std::nullopt;
    }

    std::optional<ScheduleError> operator()(const ReassignChange &change)
    {
        if (auto error = checkCurrent(change.original)) {
            return error;
        }
        return write(change.proposed);
    }
};

HoursByProvider hoursOnDates(const std::vector<TimeBlock> &blocks, const QSet<QDate> &dates)
{
    HoursByProvider hours;
    for (const auto &block : blocks) {
        if (dates.contains(block.date)) {
            hours[block.provider] += block.durationHours();
        }
    }
    return hours;
}

HoursByProvider difference(const HoursByProvider &before, const HoursByProvider &after)
{
    HoursByProvider delta;
    for (auto provider : data::AllCareProviders) {
        const auto b = before.find(provider);
        const auto a = after.find(provider);
        const double value = (a == after.end() ? 0.0 : a->second) - (b == before.end() ? 0.0 : b->second);
        if (std::abs(value) > 1e-9) {
            delta[provider] = value;
        }
    }
    return delta;
}

} // namespace

BatchApplier::BatchApplier(core::CareWindow window, ApplyPolicy policy)
    : m_window(window)
    , m_policy(policy)
{
}

ApplyPolicy BatchApplier::policyFor(const ChangeBatch &batch, const core::ScheduleSettings &settings)
{
    ApplyPolicy policy;
    policy.careWindow = batch.isAssistantSuggested() ? settings.assistantCareWindowPolicy
                                                     : settings.manualCareWindowPolicy;
    policy.overlap = settings.overlapPolicy;
    return policy;
}

const core::CareWindow &BatchApplier::careWindow() const
{
    return m_window;
}

const ApplyPolicy &BatchApplier::policy() const
{
    return m_policy;
}

OverlapResolution BatchApplier::resolveOverlaps(StoreTransaction &transaction,
                                                const std::vector<QDate> &dates,
                                                const QSet<QUuid> &touched,
                                                OverlapPolicy policy)
{
    OverlapResolution resolution;
    if (policy == OverlapPolicy::Allow) {
        return resolution;
    }
    for (const auto &date : dates) {
        const auto dayBlocks = transaction.blocksForDate(date);
        for (const auto &block : dayBlocks) {
            if (!touched.contains(block.id)) {
                continue;
            }
            for (const auto &other : dayBlocks) {
                if (other.id == block.id || !block.overlaps(other)) {
                    continue;
                }
                if (policy == OverlapPolicy::Displace && !touched.contains(other.id)) {
                    const bool known = std::any_of(resolution.displaced.begin(), resolution.displaced.end(),
                                                   [&other](const TimeBlock &b) { return b.id == other.id; });
                    if (!known) {
                        resolution.displaced.push_back(other);
                    }
                    continue;
                }
                resolution.conflict = std::make_pair(block, other);
                resolution.displaced.clear();
                return resolution;
            }
        }
    }
    for (const auto &block : resolution.displaced) {
        qCDebug(lcApply) << "Displacing" << data::describeBlock(block);
        transaction.remove(block.id);
    }
    return resolution;
}

ApplyOutcome BatchApplier::apply(const ChangeBatch &batch, data::TimeBlockStore &store, int timeoutMs) const
{
    ApplyOutcome outcome;
    outcome.affectedDates = batch.impactedDates();

    if (auto error = batch.validate()) {
        qCWarning(lcApply) << "Batch" << batch.id << "is invalid:" << error->toString();
        outcome.error = std::move(error);
        return outcome;
    }
    if (batch.isEmpty()) {
        qCDebug(lcApply) << "Batch" << batch.id << "is empty, nothing to apply";
        outcome.success = true;
        return outcome;
    }

    auto transaction = store.beginTransaction(timeoutMs);
    if (!transaction) {
        outcome.error = ScheduleError::make(ErrorCode::StoreBusy, QStringLiteral("Another change is being applied"));
        return outcome;
    }

    QSet<QDate> dates;
    for (const auto &date : outcome.affectedDates) {
        dates.insert(date);
    }
    const HoursByProvider before = hoursOnDates(transaction->blocks(), dates);

    const auto failWith = [&](ScheduleError error) {
        transaction->rollback();
        qCWarning(lcApply) << "Batch" << batch.id << "rolled back:" << error.toString();
        outcome.error = std::move(error);
        return outcome;
    };

    QHash<QUuid, int> touched;
    for (std::size_t i = 0; i < batch.changes.size(); ++i) {
        const auto &proposal = batch.changes[i];
        ApplyStep step{ *transaction, m_window, m_policy.careWindow, static_cast<int>(i), proposal.id(), touched };
        if (auto error = std::visit(step, proposal.kind())) {
            return failWith(std::move(*error));
        }
    }

    QSet<QUuid> touchedIds;
    for (auto it = touched.cbegin(); it != touched.cend(); ++it) {
        touchedIds.insert(it.key());
    }
    OverlapResolution overlaps = resolveOverlaps(*transaction, outcome.affectedDates, touchedIds, m_policy.overlap);
    if (!overlaps.ok()) {
        const TimeBlock &block = overlaps.conflict->first;
        const int index = touched.value(block.id);
        return failWith(ScheduleError::forProposal(
            ErrorCode::OverlappingBlocks,
            QStringLiteral("%1 overlaps %2").arg(data::describeBlock(block), data::describeBlock(overlaps.conflict->second)),
            index,
            batch.changes[static_cast<std::size_t>(index)].id()));
    }
    outcome.displaced = std::move(overlaps.displaced);

    for (auto it = touched.cbegin(); it != touched.cend(); ++it) {
        const auto block = transaction->findById(it.key());
        if (!block) {
            continue;
        }
        if (!block->isValid() || !SlotClock::isWithinCareWindow(block->startSlot, block->endSlot, m_window)) {
            qCCritical(lcApply) << "Invariant violated by batch" << batch.id << "for" << data::describeBlock(*block);
            return failWith(ScheduleError::forProposal(
                ErrorCode::InvariantViolation,
                QStringLiteral("%1 breaks the schedule invariants").arg(data::describeBlock(*block)),
                it.value(),
                batch.changes[static_cast<std::size_t>(it.value())].id()));
        }
    }

    outcome.hoursDelta = difference(before, hoursOnDates(transaction->blocks(), dates));
    transaction->commit();

    outcome.success = true;
    outcome.appliedCount = static_cast<int>(batch.changeCount());
    qCDebug(lcApply) << "Applied batch" << batch.id << "with" << outcome.appliedCount << "changes";
    return outcome;
}

} // namespace schedule
} // namespace custody
