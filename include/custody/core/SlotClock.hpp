#pragma once

#include <QString>
#include <QTime>
#include <optional>

namespace custody {
namespace core {

struct SlotTime
{
    int hour = 0;
    int minute = 0;
};

struct SlotRange
{
    int start = 0;
    int end = 0;

    bool operator==(const SlotRange &other) const { return start == other.start && end == other.end; }
    bool operator!=(const SlotRange &other) const { return !(*this == other); }
};

// Daily bounds outside which nothing may be scheduled. Defaults to 7:00 AM - 7:30 PM.
struct CareWindow
{
    int start = 28;
    int end = 78;

    bool isValid() const;
    bool contains(int startSlot, int endSlot) const;
    double hours() const;

    bool operator==(const CareWindow &other) const { return start == other.start && end == other.end; }
    bool operator!=(const CareWindow &other) const { return !(*this == other); }
};

// Converts between wall-clock time and the 96 slots of a day.
// Slot 0 is 00:00, slot 96 is the exclusive end of the day.
class SlotClock
{
public:
    static constexpr int SlotsPerDay = 96;
    static constexpr int MinutesPerSlot = 15;

    // No bounds check on hour/minute; callers validate wall-clock input.
    static int slotFromTime(int hour, int minute);
    static int slotFromTime(const QTime &time);

    // Out-of-range slots are clamped to [0, 96] before conversion.
    static SlotTime timeFromSlot(int slot);

    static int roundedSlot(int hour, int minute);
    static int roundedSlot(const QTime &time);

    static bool isValidSlot(int slot);
    static bool isValidRange(int start, int end);

    // Both return 0 when the range is not valid.
    static int durationMinutes(int start, int end);
    static double durationHours(int start, int end);

    static QString formatSlot(int slot);
    static QString formatSlotRange(int start, int end);

    static bool isWithinCareWindow(int start, int end, const CareWindow &window);
    static std::optional<SlotRange> clampToCareWindow(int start, int end, const CareWindow &window);
};

} // namespace core
} // namespace custody
