#include "custody/data/StoreTransaction.hpp"

#include "custody/core/Logging.hpp"
#include "custody/core/MutationCommand.hpp"
#include "custody/data/TimeBlockStore.hpp"

namespace custody {
namespace data {

namespace {

using Blocks = std::vector<TimeBlock>;

class InsertBlockCommand : public core::MutationCommand
{
public:
    InsertBlockCommand(Blocks &blocks, TimeBlock block)
        : m_blocks(blocks)
        , m_block(std::move(block))
    {
    }

    void apply() override { m_blocks.push_back(m_block); }
    void revert() override { m_blocks.pop_back(); }

private:
    Blocks &m_blocks;
    TimeBlock m_block;
};

class ReplaceBlockCommand : public core::MutationCommand
{
public:
    ReplaceBlockCommand(Blocks &blocks, std::size_t index, TimeBlock block)
        : m_blocks(blocks)
        , m_index(index)
        , m_block(std::move(block))
    {
    }

    void apply() override
    {
        m_previous = m_blocks[m_index];
        m_blocks[m_index] = m_block;
    }

    void revert() override { m_blocks[m_index] = m_previous; }

private:
    Blocks &m_blocks;
    std::size_t m_index;
    TimeBlock m_block;
    TimeBlock m_previous;
};

class RemoveBlockCommand : public core::MutationCommand
{
public:
    RemoveBlockCommand(Blocks &blocks, std::size_t index)
        : m_blocks(blocks)
        , m_index(index)
    {
    }

    void apply() override
    {
        m_removed = m_blocks[m_index];
        m_blocks.erase(m_blocks.begin() + static_cast<long>(m_index));
    }

    void revert() override { m_blocks.insert(m_blocks.begin() + static_cast<long>(m_index), m_removed); }

private:
    Blocks &m_blocks;
    std::size_t m_index;
    TimeBlock m_removed;
};

class ReplaceAllCommand : public core::MutationCommand
{
public:
    ReplaceAllCommand(Blocks &blocks, Blocks replacement)
        : m_blocks(blocks)
        , m_other(std::move(replacement))
    {
    }

    void apply() override { m_blocks.swap(m_other); }
    void revert() override { m_blocks.swap(m_other); }

private:
    Blocks &m_blocks;
    Blocks m_other;
};

} // namespace

StoreTransaction::StoreTransaction(TimeBlockStore &store)
    : m_store(store)
{
}

StoreTransaction::~StoreTransaction()
{
    if (!m_finished) {
        rollback();
    }
}

const std::vector<TimeBlock> &StoreTransaction::blocks() const
{
    return m_store.m_blocks;
}

std::optional<TimeBlock> StoreTransaction::findById(const QUuid &id) const
{
    const int index = indexOf(id);
    if (index < 0) {
        return std::nullopt;
    }
    return m_store.m_blocks[static_cast<std::size_t>(index)];
}

std::vector<TimeBlock> StoreTransaction::blocksForDate(const QDate &date) const
{
    std::vector<TimeBlock> result;
    for (const auto &block : m_store.m_blocks) {
        if (block.date == date) {
            result.push_back(block);
        }
    }
    return TimeBlockStore::sortedByStart(std::move(result));
}

bool StoreTransaction::insert(TimeBlock block)
{
    if (m_finished) {
        qCWarning(lcStore) << "Insert after transaction finished ignored";
        return false;
    }
    m_log.push(std::make_unique<InsertBlockCommand>(m_store.m_blocks, std::move(block)));
    return true;
}

bool StoreTransaction::replace(const TimeBlock &block)
{
    if (m_finished) {
        qCWarning(lcStore) << "Replace after transaction finished ignored";
        return false;
    }
    const int index = indexOf(block.id);
    if (index < 0) {
        return false;
    }
    m_log.push(std::make_unique<ReplaceBlockCommand>(m_store.m_blocks, static_cast<std::size_t>(index), block));
    return true;
}

bool StoreTransaction::remove(const QUuid &id)
{
    if (m_finished) {
        qCWarning(lcStore) << "Remove after transaction finished ignored";
        return false;
    }
    const int index = indexOf(id);
    if (index < 0) {
        return false;
    }
    m_log.push(std::make_unique<RemoveBlockCommand>(m_store.m_blocks, static_cast<std::size_t>(index)));
    return true;
}

bool StoreTransaction::replaceAll(std::vector<TimeBlock> blocks)
{
    if (m_finished) {
        qCWarning(lcStore) << "Replace-all after transaction finished ignored";
        return false;
    }
    m_log.push(std::make_unique<ReplaceAllCommand>(m_store.m_blocks, std::move(blocks)));
    return true;
}

std::size_t StoreTransaction::mutationCount() const
{
    return m_log.count();
}

bool StoreTransaction::isFinished() const
{
    return m_finished;
}

void StoreTransaction::commit()
{
    if (m_finished) {
        return;
    }
    if (!m_log.isEmpty()) {
        ++m_store.m_revision;
        qCDebug(lcStore) << "Committed" << m_log.count() << "mutations, revision" << m_store.m_revision;
    }
    m_log.clear();
    finish();
}

void StoreTransaction::rollback()
{
    if (m_finished) {
        return;
    }
    if (!m_log.isEmpty()) {
        qCDebug(lcStore) << "Rolling back" << m_log.count() << "mutations";
    }
    m_log.rollback();
    finish();
}

int StoreTransaction::indexOf(const QUuid &id) const
{
    const auto &blocks = m_store.m_blocks;
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        if (blocks[i].id == id) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

void StoreTransaction::finish()
{
    m_finished = true;
    m_store.m_lock.unlock();
}

} // namespace data
} // namespace custody
