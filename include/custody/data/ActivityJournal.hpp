#pragma once

#include <QMutex>
#include <cstddef>
#include <vector>

#include "custody/data/ScheduleChangeEntry.hpp"

namespace custody {
namespace data {

// Append-only record of applied batches. Entries are never edited or removed.
class ActivityJournal
{
public:
    ActivityJournal();
    explicit ActivityJournal(std::vector<ScheduleChangeEntry> entries);

    void append(ScheduleChangeEntry entry);

    // Newest first, at most limit entries (0 = all).
    std::vector<ScheduleChangeEntry> entries(std::size_t limit = 0) const;
    std::size_t size() const;

private:
    mutable QMutex m_mutex;
    std::vector<ScheduleChangeEntry> m_entries;
};

} // namespace data
} // namespace custody
