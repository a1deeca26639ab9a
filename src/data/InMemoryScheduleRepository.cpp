#include "custody/data/InMemoryScheduleRepository.hpp"

namespace custody {
namespace data {

InMemoryScheduleRepository::InMemoryScheduleRepository() = default;

InMemoryScheduleRepository::InMemoryScheduleRepository(std::vector<TimeBlock> blocks)
    : m_blocks(std::move(blocks))
{
}

InMemoryScheduleRepository::~InMemoryScheduleRepository() = default;

std::vector<TimeBlock> InMemoryScheduleRepository::loadBlocks() const
{
    return m_blocks;
}

bool InMemoryScheduleRepository::saveBlocks(const std::vector<TimeBlock> &blocks)
{
    if (!m_writable) {
        return false;
    }
    m_blocks = blocks;
    ++m_saveCount;
    return true;
}

std::vector<ScheduleChangeEntry> InMemoryScheduleRepository::loadJournal() const
{
    return m_journal;
}

bool InMemoryScheduleRepository::appendJournalEntry(const ScheduleChangeEntry &entry)
{
    if (!m_writable) {
        return false;
    }
    m_journal.push_back(entry);
    return true;
}

void InMemoryScheduleRepository::setWritable(bool writable)
{
    m_writable = writable;
}

int InMemoryScheduleRepository::saveCount() const
{
    return m_saveCount;
}

} // namespace data
} // namespace custody
