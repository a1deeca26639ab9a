#include "custody/schedule/ScheduleEngine.hpp"

#include <QDateTime>
#include <QFuture>
#include <QMutexLocker>
#include <QSet>
#include <QStringList>
#include <algorithm>

#include "custody/core/Logging.hpp"
#include "custody/data/ActivityJournal.hpp"
#include "custody/data/ScheduleRepository.hpp"
#include "custody/data/StoreTransaction.hpp"
#include "custody/data/TimeBlockStore.hpp"
#include "custody/schedule/ProposalSource.hpp"

namespace custody {
namespace schedule {

using core::ErrorCode;
using core::ScheduleError;

ScheduleEngine::ScheduleEngine(data::ScheduleRepository &repository, core::ScheduleSettings settings, QObject *parent)
    : QObject(parent)
    , m_repository(repository)
    , m_store(std::make_unique<data::TimeBlockStore>(repository.loadBlocks()))
    , m_journal(std::make_unique<data::ActivityJournal>(repository.loadJournal()))
{
    qRegisterMetaType<custody::schedule::AppliedChangeEvent>();

    if (auto error = settings.validate()) {
        qCWarning(lcEngine) << "Invalid settings, using defaults:" << error->toString();
        settings = core::ScheduleSettings();
    }
    m_settings = settings;
    m_balance.setWeeklyThresholdHours(m_settings.weeklyBalanceThresholdHours);

    qCDebug(lcEngine) << "Loaded" << m_store->size() << "blocks and" << m_journal->size() << "journal entries";
}

ScheduleEngine::~ScheduleEngine() = default;

const data::TimeBlockStore &ScheduleEngine::store() const
{
    return *m_store;
}

const data::ActivityJournal &ScheduleEngine::journal() const
{
    return *m_journal;
}

const ReviewQueue &ScheduleEngine::reviews() const
{
    return m_reviews;
}

core::ScheduleSettings ScheduleEngine::settings() const
{
    QMutexLocker locker(&m_settingsMutex);
    return m_settings;
}

std::optional<ScheduleError> ScheduleEngine::setSettings(const core::ScheduleSettings &settings)
{
    if (auto error = settings.validate()) {
        qCWarning(lcEngine) << "Rejected settings:" << error->toString();
        return error;
    }
    {
        QMutexLocker locker(&m_settingsMutex);
        m_settings = settings;
    }
    m_balance.setWeeklyThresholdHours(settings.weeklyBalanceThresholdHours);
    return std::nullopt;
}

std::optional<ScheduleError> ScheduleEngine::submit(ChangeBatch batch)
{
    if (auto error = batch.validate()) {
        qCWarning(lcEngine) << "Refusing batch" << batch.id << error->toString();
        return error;
    }
    if (m_reviews.find(batch.id)) {
        return ScheduleError::make(ErrorCode::InvalidProposal,
                                   QStringLiteral("Batch %1 is already under review").arg(batch.id.toString()));
    }
    m_reviews.add(std::move(batch));
    return std::nullopt;
}

TransitionResult ScheduleEngine::approve(const QUuid &batchId)
{
    return m_reviews.approve(batchId);
}

TransitionResult ScheduleEngine::reject(const QUuid &batchId)
{
    return m_reviews.reject(batchId);
}

TransitionResult ScheduleEngine::discard(const QUuid &batchId)
{
    return m_reviews.discard(batchId);
}

TransitionResult ScheduleEngine::apply(const QUuid &batchId, const QString &actorName, data::CareProvider actorRole)
{
    TransitionResult result = m_reviews.apply(batchId, *m_store, settings());
    if (!result.ok) {
        if (result.error) {
            qCWarning(lcEngine) << "Apply of batch" << batchId << "failed:" << result.error->toString();
        }
        return result;
    }
    const auto review = m_reviews.find(batchId);
    if (review) {
        recordApplied(*review, actorName, actorRole);
    }
    return result;
}

TransitionResult ScheduleEngine::approveAndApply(const QUuid &batchId,
                                                 const QString &actorName,
                                                 data::CareProvider actorRole)
{
    TransitionResult approved = approve(batchId);
    if (!approved.ok) {
        return approved;
    }
    return apply(batchId, actorName, actorRole);
}

std::vector<BatchResult> ScheduleEngine::approveAll()
{
    return m_reviews.approveAll();
}

std::vector<BatchResult> ScheduleEngine::rejectAll()
{
    return m_reviews.rejectAll();
}

std::optional<QUuid> ScheduleEngine::proposeUndo(const QUuid &batchId)
{
    const auto review = m_reviews.find(batchId);
    if (!review || review->state() != ReviewState::Applied) {
        qCWarning(lcEngine) << "Only applied batches can be undone, batch" << batchId;
        return std::nullopt;
    }
    const std::vector<data::TimeBlock> displaced =
        review->lastOutcome() ? review->lastOutcome()->displaced : std::vector<data::TimeBlock>();
    ChangeBatch inverse = review->batch().compensating(displaced);
    const QUuid inverseId = inverse.id;
    if (submit(std::move(inverse))) {
        return std::nullopt;
    }
    return inverseId;
}

std::size_t ScheduleEngine::pruneSettled(const QDateTime &settledBefore)
{
    const std::vector<QUuid> pruned = m_reviews.pruneSettled(settledBefore);
    for (auto it = m_requestBatches.begin(); it != m_requestBatches.end();) {
        if (std::find(pruned.begin(), pruned.end(), it.value()) != pruned.end()) {
            it = m_requestBatches.erase(it);
        } else {
            ++it;
        }
    }
    return pruned.size();
}

QUuid ScheduleEngine::requestProposal(ProposalSource &source,
                                      const QString &instruction,
                                      const QString &requestedBy,
                                      data::CareProvider requesterRole)
{
    ProposalRequest request;
    request.instruction = instruction;
    request.context = m_store->blocks();
    request.requestedBy = requestedBy;
    request.requesterRole = requesterRole;

    const QUuid requestId = QUuid::createUuid();
    auto *watcher = new QFutureWatcher<ChangeBatch>(this);
    m_pending.insert(requestId, PendingRequest{ watcher, false });
    connect(watcher, &QFutureWatcher<ChangeBatch>::finished, this, [this, requestId]() {
        handleReply(requestId);
    });
    watcher->setFuture(source.requestBatch(request));

    qCDebug(lcEngine) << "Requested proposal" << requestId << "for" << requestedBy;
    return requestId;
}

bool ScheduleEngine::cancelRequest(const QUuid &requestId)
{
    auto pending = m_pending.find(requestId);
    if (pending != m_pending.end()) {
        pending->cancelled = true;
        qCDebug(lcEngine) << "Cancelled in-flight request" << requestId;
        return true;
    }
    const auto batch = m_requestBatches.constFind(requestId);
    if (batch == m_requestBatches.constEnd()) {
        return false;
    }
    return m_reviews.discard(batch.value()).ok;
}

bool ScheduleEngine::isRequestPending(const QUuid &requestId) const
{
    return m_pending.contains(requestId);
}

std::optional<QUuid> ScheduleEngine::batchForRequest(const QUuid &requestId) const
{
    const auto it = m_requestBatches.constFind(requestId);
    if (it == m_requestBatches.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

MaterializeResult ScheduleEngine::materialize(const RecurrencePattern &pattern, const QDate &from, const QDate &to)
{
    MaterializeResult result;
    if (auto error = RecurrenceExpander::validate(pattern)) {
        result.error = std::move(error);
        return result;
    }
    const core::ScheduleSettings current = settings();
    if (!core::SlotClock::isWithinCareWindow(pattern.startSlot, pattern.endSlot, current.careWindow)) {
        result.error = ScheduleError::make(ErrorCode::OutOfCareWindow,
                                           QStringLiteral("Pattern %1 is outside the care window")
                                               .arg(core::SlotClock::formatSlotRange(pattern.startSlot, pattern.endSlot)));
        return result;
    }

    auto transaction = m_store->beginTransaction();
    if (!transaction) {
        result.error = ScheduleError::make(ErrorCode::StoreBusy, QStringLiteral("Another change is being applied"));
        return result;
    }
    result = RecurrenceExpander::materialize(*transaction, pattern, from, to);
    if (!result.ok()) {
        transaction->rollback();
        return result;
    }

    QSet<QUuid> series;
    std::vector<QDate> dates;
    for (const auto &block : transaction->blocks()) {
        if (block.seriesId != pattern.id || block.date < from || block.date > to) {
            continue;
        }
        series.insert(block.id);
        if (std::find(dates.begin(), dates.end(), block.date) == dates.end()) {
            dates.push_back(block.date);
        }
    }
    std::sort(dates.begin(), dates.end());

    OverlapResolution overlaps = BatchApplier::resolveOverlaps(*transaction, dates, series, current.overlapPolicy);
    if (!overlaps.ok()) {
        transaction->rollback();
        MaterializeResult failed;
        failed.error = ScheduleError::make(ErrorCode::OverlappingBlocks,
                                           QStringLiteral("%1 overlaps %2")
                                               .arg(data::describeBlock(overlaps.conflict->first),
                                                    data::describeBlock(overlaps.conflict->second)));
        qCWarning(lcEngine) << "Materializing pattern" << pattern.id << "failed:" << failed.error->toString();
        return failed;
    }
    result.displaced = std::move(overlaps.displaced);

    const bool changed = transaction->mutationCount() > 0;
    transaction->commit();

    if (changed) {
        persistBlocks();
        emit scheduleChanged();
    }
    return result;
}

CareBalance ScheduleEngine::balance(const QDate &from, const QDate &to) const
{
    return m_balance.balanceFor(*m_store, from, to);
}

void ScheduleEngine::handleReply(const QUuid &requestId)
{
    const auto it = m_pending.find(requestId);
    if (it == m_pending.end()) {
        return;
    }
    const PendingRequest pending = it.value();
    m_pending.erase(it);
    pending.watcher->deleteLater();

    if (pending.cancelled) {
        qCDebug(lcEngine) << "Dropping reply for cancelled request" << requestId;
        return;
    }

    const QFuture<ChangeBatch> future = pending.watcher->future();
    if (future.isCanceled() || future.resultCount() == 0) {
        qCWarning(lcEngine) << "Request" << requestId << "finished without a batch";
        emit proposalFailed(requestId, QStringLiteral("The assistant returned no proposal"));
        return;
    }

    ChangeBatch batch = future.result();
    const QUuid batchId = batch.id;
    if (auto error = submit(std::move(batch))) {
        emit proposalFailed(requestId, error->toString());
        return;
    }
    m_requestBatches.insert(requestId, batchId);
    emit batchProposed(requestId, batchId);
}

void ScheduleEngine::recordApplied(const BatchReview &review, const QString &actorName, data::CareProvider actorRole)
{
    const ChangeBatch &batch = review.batch();
    const ApplyOutcome outcome = review.lastOutcome().value_or(ApplyOutcome());

    data::ScheduleChangeEntry entry;
    entry.timestamp = QDateTime::currentDateTimeUtc();
    entry.actorName = actorName;
    entry.actorRole = actorRole;
    entry.batchId = batch.id;
    entry.title = QStringLiteral("%1 updated the schedule").arg(actorName);
    entry.narration = batch.originalCommand;
    if (batch.isAssistantSuggested()) {
        entry.aiSummary = batch.summarize();
    }
    entry.changesApplied = outcome.appliedCount;
    entry.datesImpacted = outcome.affectedDates;
    entry.careTimeDelta = outcome.hoursDelta;
    QStringList breakdown;
    if (!batch.isEmpty()) {
        breakdown << batch.detailedBreakdown();
    }
    for (const auto &block : outcome.displaced) {
        breakdown << QStringLiteral("%1 (displaced)").arg(ChangeProposal::remove(block).breakdownLine());
    }
    entry.breakdown = breakdown.join(QLatin1Char('\n'));

    m_journal->append(entry);
    if (!m_repository.appendJournalEntry(entry)) {
        qCWarning(lcPersistence) << "Could not store journal entry for batch" << batch.id;
        emit persistenceFailed(QStringLiteral("Could not store the activity entry for this change"));
    }
    if (outcome.appliedCount > 0) {
        persistBlocks();
        emit scheduleChanged();
    }

    AppliedChangeEvent event;
    event.batchId = batch.id;
    event.summary = batch.summarize();
    event.affectedDates = outcome.affectedDates;
    event.careTimeDelta = outcome.hoursDelta;
    emit batchApplied(event);
}

bool ScheduleEngine::persistBlocks()
{
    if (m_repository.saveBlocks(m_store->blocks())) {
        return true;
    }
    qCWarning(lcPersistence) << "Could not save the schedule";
    emit persistenceFailed(QStringLiteral("Could not save the schedule"));
    return false;
}

} // namespace schedule
} // namespace custody
