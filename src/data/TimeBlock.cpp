#include "custody/data/TimeBlock.hpp"

#include <QLocale>

#include "custody/core/SlotClock.hpp"

namespace custody {
namespace data {

using core::SlotClock;

bool TimeBlock::isValid() const
{
    return date.isValid() && SlotClock::isValidRange(startSlot, endSlot);
}

int TimeBlock::durationMinutes() const
{
    return SlotClock::durationMinutes(startSlot, endSlot);
}

double TimeBlock::durationHours() const
{
    return SlotClock::durationHours(startSlot, endSlot);
}

bool TimeBlock::overlaps(const TimeBlock &other) const
{
    if (date != other.date) {
        return false;
    }
    return startSlot < other.endSlot && endSlot > other.startSlot;
}

bool TimeBlock::contains(int slot) const
{
    return slot >= startSlot && slot < endSlot;
}

bool TimeBlock::operator==(const TimeBlock &other) const
{
    return id == other.id
        && date == other.date
        && startSlot == other.startSlot
        && endSlot == other.endSlot
        && provider == other.provider
        && note == other.note
        && seriesId == other.seriesId;
}

QString describeBlock(const TimeBlock &block)
{
    return QStringLiteral("%1 on %2 %3")
        .arg(defaultDisplayName(block.provider),
             QLocale::c().toString(block.date, QStringLiteral("ddd, MMM d")),
             SlotClock::formatSlotRange(block.startSlot, block.endSlot));
}

} // namespace data
} // namespace custody
