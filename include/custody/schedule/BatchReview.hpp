#pragma once

#include <QDateTime>
#include <QString>
#include <optional>

#include "custody/core/ScheduleError.hpp"
#include "custody/schedule/BatchApplier.hpp"
#include "custody/schedule/ChangeBatch.hpp"

namespace custody {
namespace data {
class TimeBlockStore;
}

namespace schedule {

enum class ReviewState
{
    Proposed,
    Approved,
    Rejected,
    Applied,
    ApplyFailed,
    Discarded,
};

QString reviewStateName(ReviewState state);
bool isTerminal(ReviewState state);

struct TransitionResult
{
    bool ok = false;
    ReviewState state = ReviewState::Proposed;
    std::optional<core::ScheduleError> error;
};

// Approval state machine for a single batch.
//
//   Proposed --approve--> Approved --apply--> Applied
//      |                     |
//      |                     +--apply fails--> ApplyFailed --approve--> Approved
//      +--reject--> Rejected
//   Proposed / ApplyFailed --discard--> Discarded
//
// Anything else is an InvalidTransition and leaves the state untouched.
class BatchReview
{
public:
    explicit BatchReview(ChangeBatch batch);

    const ChangeBatch &batch() const;
    ReviewState state() const;
    // Set after every apply attempt, successful or not.
    const std::optional<ApplyOutcome> &lastOutcome() const;
    // When the review reached a terminal state; invalid until then.
    const QDateTime &settledAt() const;

    TransitionResult approve();
    TransitionResult reject();
    TransitionResult discard();
    TransitionResult apply(data::TimeBlockStore &store, const BatchApplier &applier);

private:
    TransitionResult refuse(const char *action) const;
    TransitionResult moveTo(ReviewState state);

    ChangeBatch m_batch;
    ReviewState m_state = ReviewState::Proposed;
    std::optional<ApplyOutcome> m_lastOutcome;
    QDateTime m_settledAt;
};

} // namespace schedule
} // namespace custody
