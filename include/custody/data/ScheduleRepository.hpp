#pragma once

#include <vector>

#include "custody/data/ScheduleChangeEntry.hpp"
#include "custody/data/TimeBlock.hpp"

namespace custody {
namespace data {

// Persistence collaborator. Each call is treated as atomic by the engine.
class ScheduleRepository
{
public:
    virtual ~ScheduleRepository() = default;

    virtual std::vector<TimeBlock> loadBlocks() const = 0;
    virtual bool saveBlocks(const std::vector<TimeBlock> &blocks) = 0;
    virtual std::vector<ScheduleChangeEntry> loadJournal() const = 0;
    virtual bool appendJournalEntry(const ScheduleChangeEntry &entry) = 0;
};

} // namespace data
} // namespace custody
