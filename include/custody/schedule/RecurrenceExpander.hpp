#pragma once

#include <optional>
#include <vector>

#include "custody/core/ScheduleError.hpp"
#include "custody/data/TimeBlock.hpp"
#include "custody/schedule/RecurrencePattern.hpp"

namespace custody {
namespace data {
class StoreTransaction;
}

namespace schedule {

struct ExpansionResult
{
    std::vector<data::TimeBlock> blocks;
    std::optional<core::ScheduleError> error;

    bool ok() const { return !error.has_value(); }
};

struct MaterializeResult
{
    int inserted = 0;
    int replaced = 0;
    int removed = 0;
    // Other blocks evicted by new occurrences under the Displace policy.
    std::vector<data::TimeBlock> displaced;
    std::optional<core::ScheduleError> error;

    bool ok() const { return !error.has_value(); }
};

class RecurrenceExpander
{
public:
    static std::optional<core::ScheduleError> validate(const RecurrencePattern &pattern);

    // Deterministic: the same pattern and range always yield equal blocks.
    static ExpansionResult expand(const RecurrencePattern &pattern, const QDate &from, const QDate &to);

    // Replaces the pattern's series inside [from, to] with a fresh expansion.
    // Series blocks that no longer occur are removed, missing ones inserted.
    static MaterializeResult materialize(data::StoreTransaction &transaction,
                                         const RecurrencePattern &pattern,
                                         const QDate &from,
                                         const QDate &to);

    static QUuid occurrenceId(const QUuid &patternId, const QDate &date);
};

} // namespace schedule
} // namespace custody
