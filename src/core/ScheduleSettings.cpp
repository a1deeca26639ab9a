#include "custody/core/ScheduleSettings.hpp"

#include <QSettings>

#include "custody/core/Logging.hpp"

namespace custody {
namespace core {

namespace {
const auto KEY_WINDOW_START = QStringLiteral("careWindow/start");
const auto KEY_WINDOW_END = QStringLiteral("careWindow/end");
const auto KEY_THRESHOLD = QStringLiteral("balance/weeklyThresholdHours");
const auto KEY_MANUAL_POLICY = QStringLiteral("policy/manualCareWindow");
const auto KEY_ASSISTANT_POLICY = QStringLiteral("policy/assistantCareWindow");
const auto KEY_OVERLAP_POLICY = QStringLiteral("policy/overlap");

CareWindowPolicy readCareWindowPolicy(QSettings &settings, const QString &key, CareWindowPolicy fallback)
{
    if (!settings.contains(key)) {
        return fallback;
    }
    const QString stored = settings.value(key).toString();
    const auto policy = careWindowPolicyFromKey(stored);
    if (!policy) {
        qCWarning(lcEngine) << "Ignoring unknown care window policy" << stored << "for" << key;
        return fallback;
    }
    return *policy;
}
} // namespace

QString careWindowPolicyKey(CareWindowPolicy policy)
{
    switch (policy) {
    case CareWindowPolicy::Clamp:
        return QStringLiteral("clamp");
    case CareWindowPolicy::Reject:
        return QStringLiteral("reject");
    }
    return QStringLiteral("reject");
}

std::optional<CareWindowPolicy> careWindowPolicyFromKey(const QString &key)
{
    const QString normalized = key.trimmed().toLower();
    if (normalized == QLatin1String("clamp")) {
        return CareWindowPolicy::Clamp;
    }
    if (normalized == QLatin1String("reject")) {
        return CareWindowPolicy::Reject;
    }
    return std::nullopt;
}

QString overlapPolicyKey(OverlapPolicy policy)
{
    switch (policy) {
    case OverlapPolicy::Allow:
        return QStringLiteral("allow");
    case OverlapPolicy::Reject:
        return QStringLiteral("reject");
    case OverlapPolicy::Displace:
        return QStringLiteral("displace");
    }
    return QStringLiteral("reject");
}

std::optional<OverlapPolicy> overlapPolicyFromKey(const QString &key)
{
    const QString normalized = key.trimmed().toLower();
    if (normalized == QLatin1String("allow")) {
        return OverlapPolicy::Allow;
    }
    if (normalized == QLatin1String("reject")) {
        return OverlapPolicy::Reject;
    }
    if (normalized == QLatin1String("displace")) {
        return OverlapPolicy::Displace;
    }
    return std::nullopt;
}

std::optional<ScheduleError> ScheduleSettings::validate() const
{
    if (!careWindow.isValid()) {
        return ScheduleError::make(ErrorCode::InvalidRange,
                                   QStringLiteral("Care window %1-%2 is not a valid slot range")
                                       .arg(careWindow.start)
                                       .arg(careWindow.end));
    }
    if (weeklyBalanceThresholdHours < 0.0) {
        return ScheduleError::make(ErrorCode::InvalidRange,
                                   QStringLiteral("Balance threshold must not be negative"));
    }
    return std::nullopt;
}

ScheduleSettings ScheduleSettings::load(QSettings &settings)
{
    ScheduleSettings loaded;

    CareWindow window;
    window.start = settings.value(KEY_WINDOW_START, loaded.careWindow.start).toInt();
    window.end = settings.value(KEY_WINDOW_END, loaded.careWindow.end).toInt();
    if (window.isValid()) {
        loaded.careWindow = window;
    } else {
        qCWarning(lcEngine) << "Stored care window" << window.start << window.end
                            << "is invalid, using default";
    }

    bool ok = false;
    const double threshold = settings.value(KEY_THRESHOLD, loaded.weeklyBalanceThresholdHours).toDouble(&ok);
    if (ok && threshold >= 0.0) {
        loaded.weeklyBalanceThresholdHours = threshold;
    } else {
        qCWarning(lcEngine) << "Stored balance threshold is invalid, using default";
    }

    loaded.manualCareWindowPolicy = readCareWindowPolicy(settings, KEY_MANUAL_POLICY, loaded.manualCareWindowPolicy);
    loaded.assistantCareWindowPolicy =
        readCareWindowPolicy(settings, KEY_ASSISTANT_POLICY, loaded.assistantCareWindowPolicy);

    if (settings.contains(KEY_OVERLAP_POLICY)) {
        const QString stored = settings.value(KEY_OVERLAP_POLICY).toString();
        if (const auto policy = overlapPolicyFromKey(stored)) {
            loaded.overlapPolicy = *policy;
        } else {
            qCWarning(lcEngine) << "Ignoring unknown overlap policy" << stored;
        }
    }
    return loaded;
}

void ScheduleSettings::save(QSettings &settings) const
{
    settings.setValue(KEY_WINDOW_START, careWindow.start);
    settings.setValue(KEY_WINDOW_END, careWindow.end);
    settings.setValue(KEY_THRESHOLD, weeklyBalanceThresholdHours);
    settings.setValue(KEY_MANUAL_POLICY, careWindowPolicyKey(manualCareWindowPolicy));
    settings.setValue(KEY_ASSISTANT_POLICY, careWindowPolicyKey(assistantCareWindowPolicy));
    settings.setValue(KEY_OVERLAP_POLICY, overlapPolicyKey(overlapPolicy));
}

} // namespace core
} // namespace custody
