#pragma once

#include <QDate>
#include <QSet>
#include <QUuid>
#include <map>
#include <optional>
#include <utility>
#include <vector>

#include "custody/core/ScheduleError.hpp"
#include "custody/core/ScheduleSettings.hpp"
#include "custody/core/SlotClock.hpp"
#include "custody/data/CareProvider.hpp"
#include "custody/schedule/ChangeBatch.hpp"

namespace custody {
namespace data {
class StoreTransaction;
class TimeBlockStore;
}

namespace schedule {

struct ApplyPolicy
{
    core::CareWindowPolicy careWindow = core::CareWindowPolicy::Reject;
    core::OverlapPolicy overlap = core::OverlapPolicy::Reject;
};

struct ApplyOutcome
{
    bool success = false;
    int appliedCount = 0;
    std::optional<core::ScheduleError> error;
    std::vector<QDate> affectedDates;
    // Hours gained (positive) or lost per provider on the affected dates.
    std::map<data::CareProvider, double> hoursDelta;

    bool ok() const { return success; }
};

// Applies a batch as one transaction. Either every proposal lands or the store
// is left exactly as it was.
class BatchApplier
{
public:
    BatchApplier(core::CareWindow window, ApplyPolicy policy);

    // Policy for a batch given where it came from: assistant or manual.
    static ApplyPolicy policyFor(const ChangeBatch &batch, const core::ScheduleSettings &settings);

    ApplyOutcome apply(const ChangeBatch &batch, data::TimeBlockStore &store, int timeoutMs = 0) const;

    // Checks the touched blocks on the given dates against everything else on
    // those dates. Under Displace the untouched blocks they overlap are removed
    // from the transaction; on a conflict nothing is removed.
    static OverlapResolution resolveOverlaps(data::StoreTransaction &transaction,
                                             const std::vector<QDate> &dates,
                                             const QSet<QUuid> &touched,
                                             core::OverlapPolicy policy);

    const core::CareWindow &careWindow() const;
    const ApplyPolicy &policy() const;

private:
    core::CareWindow m_window;
    ApplyPolicy m_policy;
};

} // namespace schedule
} // namespace custody
