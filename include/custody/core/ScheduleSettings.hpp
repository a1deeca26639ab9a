#pragma once

#include <QString>
#include <optional>

#include "custody/core/ScheduleError.hpp"
#include "custody/core/SlotClock.hpp"

class QSettings;

namespace custody {
namespace core {

enum class CareWindowPolicy
{
    Reject,
    Clamp,
};

enum class OverlapPolicy
{
    Allow,
    Reject,
    // Incoming blocks evict the untouched blocks they overlap on the same date.
    Displace,
};

QString careWindowPolicyKey(CareWindowPolicy policy);
std::optional<CareWindowPolicy> careWindowPolicyFromKey(const QString &key);
QString overlapPolicyKey(OverlapPolicy policy);
std::optional<OverlapPolicy> overlapPolicyFromKey(const QString &key);

struct ScheduleSettings
{
    CareWindow careWindow;
    double weeklyBalanceThresholdHours = 4.0;
    CareWindowPolicy manualCareWindowPolicy = CareWindowPolicy::Clamp;
    CareWindowPolicy assistantCareWindowPolicy = CareWindowPolicy::Reject;
    OverlapPolicy overlapPolicy = OverlapPolicy::Reject;

    std::optional<ScheduleError> validate() const;

    // Invalid stored values fall back to the defaults.
    static ScheduleSettings load(QSettings &settings);
    void save(QSettings &settings) const;
};

} // namespace core
} // namespace custody
