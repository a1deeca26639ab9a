#pragma once

#include <QReadWriteLock>
#include <QtGlobal>
#include <memory>
#include <optional>
#include <vector>

#include "custody/data/TimeBlock.hpp"

namespace custody {
namespace data {

class StoreTransaction;

struct BlockOverlap
{
    TimeBlock first;
    TimeBlock second;
};

// Owns every scheduled TimeBlock. Reads copy under a shared lock and never see a
// half-applied transaction; all mutation goes through a StoreTransaction.
class TimeBlockStore
{
public:
    TimeBlockStore();
    explicit TimeBlockStore(std::vector<TimeBlock> blocks);
    ~TimeBlockStore();

    TimeBlockStore(const TimeBlockStore &) = delete;
    TimeBlockStore &operator=(const TimeBlockStore &) = delete;

    std::vector<TimeBlock> blocks() const;
    std::vector<TimeBlock> blocksForDate(const QDate &date) const;
    std::vector<TimeBlock> blocksForProvider(CareProvider provider) const;
    std::vector<TimeBlock> blocksInRange(const QDate &from, const QDate &to) const;
    std::optional<TimeBlock> findById(const QUuid &id) const;
    std::size_t size() const;

    std::vector<BlockOverlap> findOverlaps(const QDate &date, CareProvider provider) const;
    std::vector<BlockOverlap> findOverlaps(const QDate &date) const;

    // Incremented by every commit that changed something.
    quint64 revision() const;

    // Returns nullptr when another mutation holds the store for longer than timeoutMs.
    std::unique_ptr<StoreTransaction> beginTransaction(int timeoutMs = 0);

    static double totalHours(const std::vector<TimeBlock> &blocks);
    // Stable: blocks starting at the same slot keep their relative order.
    static std::vector<TimeBlock> sortedByStart(std::vector<TimeBlock> blocks);
    static std::vector<BlockOverlap> overlapsAmong(const std::vector<TimeBlock> &blocks);

private:
    friend class StoreTransaction;

    mutable QReadWriteLock m_lock;
    std::vector<TimeBlock> m_blocks;
    quint64 m_revision = 0;
};

} // namespace data
} // namespace custody
