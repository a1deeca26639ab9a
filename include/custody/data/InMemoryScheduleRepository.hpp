#pragma once

#include "custody/data/ScheduleRepository.hpp"

namespace custody {
namespace data {

class InMemoryScheduleRepository : public ScheduleRepository
{
public:
    InMemoryScheduleRepository();
    explicit InMemoryScheduleRepository(std::vector<TimeBlock> blocks);
    ~InMemoryScheduleRepository() override;

    std::vector<TimeBlock> loadBlocks() const override;
    bool saveBlocks(const std::vector<TimeBlock> &blocks) override;
    std::vector<ScheduleChangeEntry> loadJournal() const override;
    bool appendJournalEntry(const ScheduleChangeEntry &entry) override;

    // Makes subsequent writes fail, for exercising persistence errors.
    void setWritable(bool writable);
    int saveCount() const;

private:
    std::vector<TimeBlock> m_blocks;
    std::vector<ScheduleChangeEntry> m_journal;
    bool m_writable = true;
    int m_saveCount = 0;
};

} // namespace data
} // namespace custody
