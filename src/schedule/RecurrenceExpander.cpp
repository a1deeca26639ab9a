#include "custody/schedule/RecurrenceExpander.hpp"

#include <QSet>
#include <algorithm>

#include "custody/core/Logging.hpp"
#include "custody/core/SlotClock.hpp"
#include "custody/data/StoreTransaction.hpp"

namespace custody {
namespace schedule {

using core::ErrorCode;
using core::ScheduleError;
using data::TimeBlock;

namespace {
QDate weekStart(const QDate &date)
{
    return date.addDays(1 - date.dayOfWeek());
}
} // namespace

QString recurrenceFrequencyKey(RecurrenceFrequency frequency)
{
    switch (frequency) {
    case RecurrenceFrequency::Daily:
        return QStringLiteral("daily");
    case RecurrenceFrequency::Weekly:
        return QStringLiteral("weekly");
    case RecurrenceFrequency::Monthly:
        return QStringLiteral("monthly");
    case RecurrenceFrequency::Yearly:
        return QStringLiteral("yearly");
    }
    return QStringLiteral("weekly");
}

bool RecurrencePattern::occursOn(const QDate &date) const
{
    if (!date.isValid() || !effectiveFrom.isValid() || date < effectiveFrom) {
        return false;
    }
    if (effectiveUntil && date > *effectiveUntil) {
        return false;
    }
    const int step = std::max(interval, 1);
    switch (frequency) {
    case RecurrenceFrequency::Daily:
        return effectiveFrom.daysTo(date) % step == 0;
    case RecurrenceFrequency::Weekly: {
        if (weekdays.count(date.dayOfWeek()) == 0) {
            return false;
        }
        const qint64 weeks = weekStart(effectiveFrom).daysTo(weekStart(date)) / 7;
        return weeks % step == 0;
    }
    case RecurrenceFrequency::Monthly: {
        if (date.day() != effectiveFrom.day()) {
            return false;
        }
        const int months = (date.year() - effectiveFrom.year()) * 12 + date.month() - effectiveFrom.month();
        return months % step == 0;
    }
    case RecurrenceFrequency::Yearly:
        if (date.month() != effectiveFrom.month() || date.day() != effectiveFrom.day()) {
            return false;
        }
        return (date.year() - effectiveFrom.year()) % step == 0;
    }
    return false;
}

std::optional<ScheduleError> RecurrenceExpander::validate(const RecurrencePattern &pattern)
{
    if (!core::SlotClock::isValidRange(pattern.startSlot, pattern.endSlot)) {
        return ScheduleError::make(ErrorCode::InvalidPattern,
                                   QStringLiteral("Pattern slot range %1-%2 is invalid")
                                       .arg(pattern.startSlot)
                                       .arg(pattern.endSlot));
    }
    if (!pattern.effectiveFrom.isValid()) {
        return ScheduleError::make(ErrorCode::InvalidPattern, QStringLiteral("Pattern has no start date"));
    }
    if (pattern.effectiveUntil && (!pattern.effectiveUntil->isValid() || *pattern.effectiveUntil < pattern.effectiveFrom)) {
        return ScheduleError::make(ErrorCode::InvalidPattern, QStringLiteral("Pattern ends before it starts"));
    }
    if (pattern.interval < 1) {
        return ScheduleError::make(ErrorCode::InvalidPattern,
                                   QStringLiteral("Interval must be at least 1, got %1").arg(pattern.interval));
    }
    for (int weekday : pattern.weekdays) {
        if (weekday < Qt::Monday || weekday > Qt::Sunday) {
            return ScheduleError::make(ErrorCode::InvalidPattern,
                                       QStringLiteral("Weekday %1 is outside 1..7").arg(weekday));
        }
    }
    return std::nullopt;
}

ExpansionResult RecurrenceExpander::expand(const RecurrencePattern &pattern, const QDate &from, const QDate &to)
{
    ExpansionResult result;
    if (auto error = validate(pattern)) {
        qCWarning(lcRecurrence) << "Refusing to expand pattern" << pattern.id << error->message;
        result.error = std::move(error);
        return result;
    }
    if (!from.isValid() || !to.isValid()) {
        return result;
    }
    if (pattern.frequency == RecurrenceFrequency::Weekly && pattern.weekdays.empty()) {
        return result;
    }

    QDate first = std::max(from, pattern.effectiveFrom);
    QDate last = to;
    if (pattern.effectiveUntil) {
        last = std::min(last, *pattern.effectiveUntil);
    }

    for (QDate date = first; date <= last; date = date.addDays(1)) {
        if (!pattern.occursOn(date)) {
            continue;
        }
        TimeBlock block;
        block.id = occurrenceId(pattern.id, date);
        block.date = date;
        block.startSlot = pattern.startSlot;
        block.endSlot = pattern.endSlot;
        block.provider = pattern.provider;
        block.note = pattern.note;
        block.seriesId = pattern.id;
        result.blocks.push_back(std::move(block));
    }
    return result;
}

MaterializeResult RecurrenceExpander::materialize(data::StoreTransaction &transaction,
                                                  const RecurrencePattern &pattern,
                                                  const QDate &from,
                                                  const QDate &to)
{
    MaterializeResult result;
    ExpansionResult expansion = expand(pattern, from, to);
    if (!expansion.ok()) {
        result.error = expansion.error;
        return result;
    }

    QSet<QUuid> expandedIds;
    for (const auto &block : expansion.blocks) {
        expandedIds.insert(block.id);
    }

    std::vector<QUuid> stale;
    for (const auto &existing : transaction.blocks()) {
        if (existing.seriesId != pattern.id || existing.date < from || existing.date > to) {
            continue;
        }
        if (!expandedIds.contains(existing.id)) {
            stale.push_back(existing.id);
        }
    }
    for (const auto &id : stale) {
        if (transaction.remove(id)) {
            ++result.removed;
        }
    }

    for (auto &block : expansion.blocks) {
        const auto existing = transaction.findById(block.id);
        if (!existing) {
            transaction.insert(std::move(block));
            ++result.inserted;
        } else if (*existing != block) {
            transaction.replace(block);
            ++result.replaced;
        }
    }

    qCDebug(lcRecurrence) << "Materialized pattern" << pattern.id << "inserted" << result.inserted
                          << "replaced" << result.replaced << "removed" << result.removed;
    return result;
}

QUuid RecurrenceExpander::occurrenceId(const QUuid &patternId, const QDate &date)
{
    return QUuid::createUuidV5(patternId, date.toString(Qt::ISODate));
}

} // namespace schedule
} // namespace custody
