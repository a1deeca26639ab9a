#pragma once

#include <optional>
#include <vector>

#include "custody/core/MutationLog.hpp"
#include "custody/data/TimeBlock.hpp"

namespace custody {
namespace data {

class TimeBlockStore;

// Exclusive write access to a TimeBlockStore. Every mutation is logged; an
// uncommitted transaction is rolled back when destroyed, restoring the store
// exactly (content and order).
class StoreTransaction
{
public:
    ~StoreTransaction();

    StoreTransaction(const StoreTransaction &) = delete;
    StoreTransaction &operator=(const StoreTransaction &) = delete;

    const std::vector<TimeBlock> &blocks() const;
    std::optional<TimeBlock> findById(const QUuid &id) const;
    std::vector<TimeBlock> blocksForDate(const QDate &date) const;

    // Mutations fail (return false) once the transaction is finished.
    bool insert(TimeBlock block);
    bool replace(const TimeBlock &block);
    bool remove(const QUuid &id);
    bool replaceAll(std::vector<TimeBlock> blocks);

    std::size_t mutationCount() const;
    bool isFinished() const;

    void commit();
    void rollback();

private:
    friend class TimeBlockStore;

    explicit StoreTransaction(TimeBlockStore &store);

    int indexOf(const QUuid &id) const;
    void finish();

    TimeBlockStore &m_store;
    core::MutationLog m_log;
    bool m_finished = false;
};

} // namespace data
} // namespace custody
