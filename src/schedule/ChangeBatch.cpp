#include "custody/schedule/ChangeBatch.hpp"

#include <QStringList>
#include <algorithm>

namespace custody {
namespace schedule {

bool ChangeBatch::isAssistantSuggested() const
{
    return std::any_of(changes.begin(), changes.end(), [](const ChangeProposal &proposal) {
        return proposal.wasAISuggested();
    });
}

std::vector<QDate> ChangeBatch::impactedDates() const
{
    std::vector<QDate> dates;
    for (const auto &proposal : changes) {
        const auto proposalDates = proposal.impactedDates();
        dates.insert(dates.end(), proposalDates.begin(), proposalDates.end());
    }
    std::sort(dates.begin(), dates.end());
    dates.erase(std::unique(dates.begin(), dates.end()), dates.end());
    return dates;
}

QString ChangeBatch::summarize() const
{
    if (!summary.trimmed().isEmpty()) {
        return summary;
    }
    if (changes.empty()) {
        return QStringLiteral("No changes");
    }
    if (changes.size() == 1) {
        return changes.front().description();
    }
    QStringList parts;
    for (const auto &proposal : changes) {
        parts << proposal.description();
    }
    return QStringLiteral("%1 changes: %2").arg(changes.size()).arg(parts.join(QStringLiteral("; ")));
}

QString ChangeBatch::detailedBreakdown() const
{
    QStringList lines;
    for (const auto &proposal : changes) {
        lines << proposal.breakdownLine();
    }
    return lines.join(QLatin1Char('\n'));
}

std::optional<core::ScheduleError> ChangeBatch::validate() const
{
    for (std::size_t i = 0; i < changes.size(); ++i) {
        if (auto error = schedule::validate(changes[i])) {
            error->proposalIndex = static_cast<int>(i);
            error->message = QStringLiteral("Change %1: %2").arg(i + 1).arg(error->message);
            return error;
        }
    }
    return std::nullopt;
}

ChangeBatch ChangeBatch::compensating(const std::vector<data::TimeBlock> &displaced) const
{
    ChangeBatch inverse;
    inverse.changes.reserve(changes.size() + displaced.size());
    for (auto it = changes.rbegin(); it != changes.rend(); ++it) {
        inverse.changes.push_back(it->inverted());
    }
    for (const auto &block : displaced) {
        inverse.changes.push_back(ChangeProposal::add(block));
    }
    inverse.summary = QStringLiteral("Undo: %1").arg(summarize());
    inverse.originalCommand = originalCommand;
    return inverse;
}

} // namespace schedule
} // namespace custody
