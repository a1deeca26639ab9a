#pragma once

#include <QDateTime>
#include <QMutex>
#include <QUuid>
#include <optional>
#include <vector>

#include "custody/core/ScheduleSettings.hpp"
#include "custody/schedule/BatchReview.hpp"

namespace custody {
namespace data {
class TimeBlockStore;
}

namespace schedule {

struct BatchResult
{
    QUuid batchId;
    TransitionResult result;
};

// Independent reviews, one per batch, kept in submission order.
class ReviewQueue
{
public:
    ReviewQueue();

    void add(ChangeBatch batch);
    std::optional<BatchReview> find(const QUuid &batchId) const;
    std::vector<BatchReview> reviews() const;
    std::vector<BatchReview> pending() const;
    std::size_t size() const;

    TransitionResult approve(const QUuid &batchId);
    TransitionResult reject(const QUuid &batchId);
    TransitionResult discard(const QUuid &batchId);
    TransitionResult apply(const QUuid &batchId, data::TimeBlockStore &store, const core::ScheduleSettings &settings);

    std::vector<BatchResult> approveAll();
    std::vector<BatchResult> rejectAll();
    // Applies approved batches in submission order; each one stands alone.
    std::vector<BatchResult> applyAllApproved(data::TimeBlockStore &store, const core::ScheduleSettings &settings);

    // Drops reviews that settled before the cutoff. Returns the dropped batch ids.
    std::vector<QUuid> pruneSettled(const QDateTime &settledBefore);

private:
    BatchReview *lookup(const QUuid &batchId);
    static TransitionResult unknown(const QUuid &batchId);

    mutable QMutex m_mutex;
    std::vector<BatchReview> m_reviews;
};

} // namespace schedule
} // namespace custody
