#pragma once

#include <QString>
#include <QUuid>

namespace custody {
namespace core {

enum class ErrorCode
{
    InvalidRange,
    InvalidPattern,
    InvalidProposal,
    StaleReference,
    OutOfCareWindow,
    OverlappingBlocks,
    InvalidTransition,
    StoreBusy,
    ApplyFailed,
    InvariantViolation,
    PersistenceFailed,
};

QString errorCodeName(ErrorCode code);

struct ScheduleError
{
    ErrorCode code = ErrorCode::InvalidProposal;
    QString message;
    // Position of the offending proposal inside its batch, -1 when not tied to one.
    int proposalIndex = -1;
    QUuid proposalId;

    static ScheduleError make(ErrorCode code, QString message);
    static ScheduleError forProposal(ErrorCode code, QString message, int index, const QUuid &proposalId);

    QString toString() const;
};

} // namespace core
} // namespace custody
