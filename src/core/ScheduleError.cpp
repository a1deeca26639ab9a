#include "custody/core/ScheduleError.hpp"

namespace custody {
namespace core {

QString errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::InvalidRange:
        return QStringLiteral("InvalidRange");
    case ErrorCode::InvalidPattern:
        return QStringLiteral("InvalidPattern");
    case ErrorCode::InvalidProposal:
        return QStringLiteral("InvalidProposal");
    case ErrorCode::StaleReference:
        return QStringLiteral("StaleReference");
    case ErrorCode::OutOfCareWindow:
        return QStringLiteral("OutOfCareWindow");
    case ErrorCode::OverlappingBlocks:
        return QStringLiteral("OverlappingBlocks");
    case ErrorCode::InvalidTransition:
        return QStringLiteral("InvalidTransition");
    case ErrorCode::StoreBusy:
        return QStringLiteral("StoreBusy");
    case ErrorCode::ApplyFailed:
        return QStringLiteral("ApplyFailed");
    case ErrorCode::InvariantViolation:
        return QStringLiteral("InvariantViolation");
    case ErrorCode::PersistenceFailed:
        return QStringLiteral("PersistenceFailed");
    }
    return QStringLiteral("Unknown");
}

ScheduleError ScheduleError::make(ErrorCode code, QString message)
{
    ScheduleError error;
    error.code = code;
    error.message = std::move(message);
    return error;
}

ScheduleError ScheduleError::forProposal(ErrorCode code, QString message, int index, const QUuid &proposalId)
{
    ScheduleError error = make(code, std::move(message));
    error.proposalIndex = index;
    error.proposalId = proposalId;
    return error;
}

QString ScheduleError::toString() const
{
    if (proposalIndex >= 0) {
        return QStringLiteral("%1 (change #%2): %3").arg(errorCodeName(code)).arg(proposalIndex + 1).arg(message);
    }
    return QStringLiteral("%1: %2").arg(errorCodeName(code), message);
}

} // namespace core
} // namespace custody
