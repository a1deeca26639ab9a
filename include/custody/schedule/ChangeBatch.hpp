#pragma once

#include <QString>
#include <QUuid>
#include <optional>
#include <vector>

#include "custody/core/ScheduleError.hpp"
#include "custody/schedule/ChangeProposal.hpp"

namespace custody {
namespace schedule {

// Proposals reviewed and committed together, all or nothing.
struct ChangeBatch
{
    QUuid id = QUuid::createUuid();
    std::vector<ChangeProposal> changes;
    QString summary;
    QString originalCommand;

    std::size_t changeCount() const { return changes.size(); }
    bool isEmpty() const { return changes.empty(); }
    bool isAssistantSuggested() const;

    // Sorted, without duplicates, across every proposal.
    std::vector<QDate> impactedDates() const;

    // The supplied summary, or one built from the proposal descriptions.
    QString summarize() const;
    QString detailedBreakdown() const;

    // First structurally invalid proposal, with its index.
    std::optional<core::ScheduleError> validate() const;

    // Undoes this batch once applied: inverse proposals in reverse order, then
    // an Add for every block the batch displaced.
    ChangeBatch compensating(const std::vector<data::TimeBlock> &displaced = {}) const;
};

} // namespace schedule
} // namespace custody
