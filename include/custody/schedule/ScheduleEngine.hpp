#pragma once

#include <QDate>
#include <QDateTime>
#include <QFutureWatcher>
#include <QHash>
#include <QMetaType>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QUuid>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "custody/core/ScheduleError.hpp"
#include "custody/core/ScheduleSettings.hpp"
#include "custody/data/CareProvider.hpp"
#include "custody/schedule/CareBalance.hpp"
#include "custody/schedule/ChangeBatch.hpp"
#include "custody/schedule/RecurrenceExpander.hpp"
#include "custody/schedule/ReviewQueue.hpp"

namespace custody {
namespace data {
class ActivityJournal;
class ScheduleRepository;
class TimeBlockStore;
}

namespace schedule {

class ProposalSource;

struct AppliedChangeEvent
{
    QUuid batchId;
    QString summary;
    std::vector<QDate> affectedDates;
    std::map<data::CareProvider, double> careTimeDelta;
};

// Single owner of the live schedule. Everything that changes blocks goes
// through here so the journal, the repository and listeners stay in step.
class ScheduleEngine : public QObject
{
    Q_OBJECT

public:
    explicit ScheduleEngine(data::ScheduleRepository &repository,
                            core::ScheduleSettings settings = {},
                            QObject *parent = nullptr);
    ~ScheduleEngine() override;

    const data::TimeBlockStore &store() const;
    const data::ActivityJournal &journal() const;
    const ReviewQueue &reviews() const;

    core::ScheduleSettings settings() const;
    std::optional<core::ScheduleError> setSettings(const core::ScheduleSettings &settings);

    // Queues a batch as Proposed after checking it.
    std::optional<core::ScheduleError> submit(ChangeBatch batch);

    TransitionResult approve(const QUuid &batchId);
    TransitionResult reject(const QUuid &batchId);
    TransitionResult discard(const QUuid &batchId);
    TransitionResult apply(const QUuid &batchId, const QString &actorName, data::CareProvider actorRole);
    TransitionResult approveAndApply(const QUuid &batchId, const QString &actorName, data::CareProvider actorRole);
    std::vector<BatchResult> approveAll();
    std::vector<BatchResult> rejectAll();

    // Queues the compensating batch for an applied one; returns its id.
    std::optional<QUuid> proposeUndo(const QUuid &batchId);

    // Forgets reviews that settled before the cutoff, along with their request
    // mappings. Pruned applied batches can no longer be undone. The journal keeps
    // its entries.
    std::size_t pruneSettled(const QDateTime &settledBefore);

    // Asks the source for a batch without blocking. Returns the request id used
    // by cancelRequest() and the proposal signals.
    QUuid requestProposal(ProposalSource &source,
                          const QString &instruction,
                          const QString &requestedBy,
                          data::CareProvider requesterRole = data::CareProvider::Unassigned);
    // In flight: the reply will be dropped. Already queued and still Proposed: discarded.
    bool cancelRequest(const QUuid &requestId);
    bool isRequestPending(const QUuid &requestId) const;
    std::optional<QUuid> batchForRequest(const QUuid &requestId) const;

    MaterializeResult materialize(const RecurrencePattern &pattern, const QDate &from, const QDate &to);

    CareBalance balance(const QDate &from, const QDate &to) const;

signals:
    void batchProposed(const QUuid &requestId, const QUuid &batchId);
    void proposalFailed(const QUuid &requestId, const QString &message);
    void batchApplied(const custody::schedule::AppliedChangeEvent &event);
    void scheduleChanged();
    void persistenceFailed(const QString &message);

private:
    struct PendingRequest
    {
        QFutureWatcher<ChangeBatch> *watcher = nullptr;
        bool cancelled = false;
    };

    void handleReply(const QUuid &requestId);
    void recordApplied(const BatchReview &review, const QString &actorName, data::CareProvider actorRole);
    bool persistBlocks();

    data::ScheduleRepository &m_repository;
    std::unique_ptr<data::TimeBlockStore> m_store;
    std::unique_ptr<data::ActivityJournal> m_journal;
    ReviewQueue m_reviews;
    CareBalanceAggregator m_balance;

    mutable QMutex m_settingsMutex;
    core::ScheduleSettings m_settings;

    QHash<QUuid, PendingRequest> m_pending;
    QHash<QUuid, QUuid> m_requestBatches;
};

} // namespace schedule
} // namespace custody

Q_DECLARE_METATYPE(custody::schedule::AppliedChangeEvent)
