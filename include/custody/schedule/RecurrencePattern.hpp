#pragma once

#include <QDate>
#include <QString>
#include <QUuid>
#include <optional>
#include <set>

#include "custody/data/CareProvider.hpp"

namespace custody {
namespace schedule {

enum class RecurrenceFrequency
{
    Daily,
    // On the listed weekdays.
    Weekly,
    // On the day of month of effectiveFrom; months without that day are skipped.
    Monthly,
    // On the month and day of effectiveFrom; Feb 29 only occurs in leap years.
    Yearly,
};

QString recurrenceFrequencyKey(RecurrenceFrequency frequency);

// Coverage rule. Never stored as a block itself; expanded on demand.
struct RecurrencePattern
{
    QUuid id = QUuid::createUuid();
    RecurrenceFrequency frequency = RecurrenceFrequency::Weekly;
    // ISO weekdays, 1 = Monday .. 7 = Sunday. Weekly patterns only.
    std::set<int> weekdays;
    int startSlot = 0;
    int endSlot = 0;
    data::CareProvider provider = data::CareProvider::Unassigned;
    QDate effectiveFrom;
    std::optional<QDate> effectiveUntil;
    // Every n-th day, week, month or year counted from effectiveFrom. Weeks count
    // from the week containing effectiveFrom, so 2 gives alternating weeks.
    int interval = 1;
    QString note;

    bool occursOn(const QDate &date) const;
};

} // namespace schedule
} // namespace custody
