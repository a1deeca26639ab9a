#include "custody/data/TimeBlockStore.hpp"

#include <QReadLocker>
#include <algorithm>

#include "custody/core/Logging.hpp"
#include "custody/data/StoreTransaction.hpp"

namespace custody {
namespace data {

namespace {
bool byDateThenStart(const TimeBlock &lhs, const TimeBlock &rhs)
{
    if (lhs.date == rhs.date) {
        return lhs.startSlot < rhs.startSlot;
    }
    return lhs.date < rhs.date;
}
} // namespace

TimeBlockStore::TimeBlockStore() = default;

TimeBlockStore::TimeBlockStore(std::vector<TimeBlock> blocks)
    : m_blocks(std::move(blocks))
{
}

TimeBlockStore::~TimeBlockStore() = default;

std::vector<TimeBlock> TimeBlockStore::blocks() const
{
    QReadLocker locker(&m_lock);
    return m_blocks;
}

std::vector<TimeBlock> TimeBlockStore::blocksForDate(const QDate &date) const
{
    std::vector<TimeBlock> result;
    {
        QReadLocker locker(&m_lock);
        for (const auto &block : m_blocks) {
            if (block.date == date) {
                result.push_back(block);
            }
        }
    }
    return sortedByStart(std::move(result));
}

std::vector<TimeBlock> TimeBlockStore::blocksForProvider(CareProvider provider) const
{
    std::vector<TimeBlock> result;
    {
        QReadLocker locker(&m_lock);
        for (const auto &block : m_blocks) {
            if (block.provider == provider) {
                result.push_back(block);
            }
        }
    }
    std::stable_sort(result.begin(), result.end(), byDateThenStart);
    return result;
}

std::vector<TimeBlock> TimeBlockStore::blocksInRange(const QDate &from, const QDate &to) const
{
    std::vector<TimeBlock> result;
    {
        QReadLocker locker(&m_lock);
        for (const auto &block : m_blocks) {
            if (block.date < from || block.date > to) {
                continue;
            }
            result.push_back(block);
        }
    }
    std::stable_sort(result.begin(), result.end(), byDateThenStart);
    return result;
}

std::optional<TimeBlock> TimeBlockStore::findById(const QUuid &id) const
{
    QReadLocker locker(&m_lock);
    const auto it = std::find_if(m_blocks.cbegin(), m_blocks.cend(), [&id](const TimeBlock &block) {
        return block.id == id;
    });
    if (it == m_blocks.cend()) {
        return std::nullopt;
    }
    return *it;
}

std::size_t TimeBlockStore::size() const
{
    QReadLocker locker(&m_lock);
    return m_blocks.size();
}

std::vector<BlockOverlap> TimeBlockStore::findOverlaps(const QDate &date, CareProvider provider) const
{
    std::vector<TimeBlock> candidates;
    for (auto &block : blocksForDate(date)) {
        if (block.provider == provider) {
            candidates.push_back(std::move(block));
        }
    }
    return overlapsAmong(candidates);
}

std::vector<BlockOverlap> TimeBlockStore::findOverlaps(const QDate &date) const
{
    return overlapsAmong(blocksForDate(date));
}

quint64 TimeBlockStore::revision() const
{
    QReadLocker locker(&m_lock);
    return m_revision;
}

std::unique_ptr<StoreTransaction> TimeBlockStore::beginTransaction(int timeoutMs)
{
    if (!m_lock.tryLockForWrite(timeoutMs)) {
        qCWarning(lcStore) << "Store is busy, transaction refused";
        return nullptr;
    }
    return std::unique_ptr<StoreTransaction>(new StoreTransaction(*this));
}

double TimeBlockStore::totalHours(const std::vector<TimeBlock> &blocks)
{
    double total = 0.0;
    for (const auto &block : blocks) {
        total += block.durationHours();
    }
    return total;
}

std::vector<TimeBlock> TimeBlockStore::sortedByStart(std::vector<TimeBlock> blocks)
{
    std::stable_sort(blocks.begin(), blocks.end(), [](const TimeBlock &lhs, const TimeBlock &rhs) {
        return lhs.startSlot < rhs.startSlot;
    });
    return blocks;
}

std::vector<BlockOverlap> TimeBlockStore::overlapsAmong(const std::vector<TimeBlock> &blocks)
{
    std::vector<BlockOverlap> overlaps;
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        for (std::size_t j = i + 1; j < blocks.size(); ++j) {
            if (blocks[i].overlaps(blocks[j])) {
                overlaps.push_back(BlockOverlap{ blocks[i], blocks[j] });
            }
        }
    }
    return overlaps;
}

} // namespace data
} // namespace custody
