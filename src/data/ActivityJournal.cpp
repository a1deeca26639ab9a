#include "custody/data/ActivityJournal.hpp"

#include <QMutexLocker>

namespace custody {
namespace data {

ActivityJournal::ActivityJournal() = default;

ActivityJournal::ActivityJournal(std::vector<ScheduleChangeEntry> entries)
    : m_entries(std::move(entries))
{
}

void ActivityJournal::append(ScheduleChangeEntry entry)
{
    QMutexLocker locker(&m_mutex);
    m_entries.push_back(std::move(entry));
}

std::vector<ScheduleChangeEntry> ActivityJournal::entries(std::size_t limit) const
{
    QMutexLocker locker(&m_mutex);
    std::vector<ScheduleChangeEntry> result(m_entries.rbegin(), m_entries.rend());
    if (limit > 0 && result.size() > limit) {
        result.resize(limit);
    }
    return result;
}

std::size_t ActivityJournal::size() const
{
    QMutexLocker locker(&m_mutex);
    return m_entries.size();
}

} // namespace data
} // namespace custody
