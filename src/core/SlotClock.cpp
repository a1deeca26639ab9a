#include "custody/core/SlotClock.hpp"

#include <algorithm>

namespace custody {
namespace core {

bool CareWindow::isValid() const
{
    return SlotClock::isValidRange(start, end);
}

bool CareWindow::contains(int startSlot, int endSlot) const
{
    return SlotClock::isWithinCareWindow(startSlot, endSlot, *this);
}

double CareWindow::hours() const
{
    return SlotClock::durationHours(start, end);
}

int SlotClock::slotFromTime(int hour, int minute)
{
    return (hour * 60 + minute) / MinutesPerSlot;
}

int SlotClock::slotFromTime(const QTime &time)
{
    return slotFromTime(time.hour(), time.minute());
}

SlotTime SlotClock::timeFromSlot(int slot)
{
    const int clamped = std::clamp(slot, 0, SlotsPerDay);
    const int totalMinutes = clamped * MinutesPerSlot;
    return SlotTime{ totalMinutes / 60, totalMinutes % 60 };
}

int SlotClock::roundedSlot(int hour, int minute)
{
    const int roundedMinute = ((minute + 7) / MinutesPerSlot) * MinutesPerSlot;
    const int adjustedHour = hour + roundedMinute / 60;
    return slotFromTime(adjustedHour, roundedMinute % 60);
}

int SlotClock::roundedSlot(const QTime &time)
{
    return roundedSlot(time.hour(), time.minute());
}

bool SlotClock::isValidSlot(int slot)
{
    return slot >= 0 && slot <= SlotsPerDay;
}

bool SlotClock::isValidRange(int start, int end)
{
    return isValidSlot(start) && isValidSlot(end) && start < end;
}

int SlotClock::durationMinutes(int start, int end)
{
    if (!isValidRange(start, end)) {
        return 0;
    }
    return (end - start) * MinutesPerSlot;
}

double SlotClock::durationHours(int start, int end)
{
    return static_cast<double>(durationMinutes(start, end)) / 60.0;
}

QString SlotClock::formatSlot(int slot)
{
    const SlotTime time = timeFromSlot(slot);
    const int hour = time.hour % 24;
    const int displayHour = hour == 0 ? 12 : (hour > 12 ? hour - 12 : hour);
    const QString period = hour < 12 ? QStringLiteral("AM") : QStringLiteral("PM");
    return QStringLiteral("%1:%2 %3")
        .arg(displayHour)
        .arg(time.minute, 2, 10, QLatin1Char('0'))
        .arg(period);
}

QString SlotClock::formatSlotRange(int start, int end)
{
    return QStringLiteral("%1 - %2").arg(formatSlot(start), formatSlot(end));
}

bool SlotClock::isWithinCareWindow(int start, int end, const CareWindow &window)
{
    return start >= window.start && end <= window.end;
}

std::optional<SlotRange> SlotClock::clampToCareWindow(int start, int end, const CareWindow &window)
{
    const int clampedStart = std::max(start, window.start);
    const int clampedEnd = std::min(end, window.end);
    if (clampedStart >= clampedEnd) {
        return std::nullopt;
    }
    return SlotRange{ clampedStart, clampedEnd };
}

} // namespace core
} // namespace custody
