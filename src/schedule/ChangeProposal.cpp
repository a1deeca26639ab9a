#include "custody/schedule/ChangeProposal.hpp"

#include <QLocale>
#include <algorithm>

#include "custody/core/SlotClock.hpp"

namespace custody {
namespace schedule {

using core::ErrorCode;
using core::ScheduleError;
using core::SlotClock;
using data::TimeBlock;

namespace {

QString shortDate(const QDate &date)
{
    return QLocale::c().toString(date, QStringLiteral("ddd, MMM d"));
}

QString name(const TimeBlock &block)
{
    return data::defaultDisplayName(block.provider);
}

QString range(const TimeBlock &block)
{
    return SlotClock::formatSlotRange(block.startSlot, block.endSlot);
}

bool sameTiming(const TimeBlock &lhs, const TimeBlock &rhs)
{
    return lhs.date == rhs.date && lhs.startSlot == rhs.startSlot && lhs.endSlot == rhs.endSlot;
}

struct TypeOf
{
    ChangeType operator()(const RetimeChange &) const { return ChangeType::Retime; }
    ChangeType operator()(const SwapChange &) const { return ChangeType::Swap; }
    ChangeType operator()(const AddChange &) const { return ChangeType::Add; }
    ChangeType operator()(const RemoveChange &) const { return ChangeType::Remove; }
    ChangeType operator()(const ReassignChange &) const { return ChangeType::Reassign; }
};

struct Describe
{
    QString operator()(const RetimeChange &change) const
    {
        QString text = QStringLiteral("Move %1's block from %2 to %3")
                           .arg(name(change.original), range(change.original), range(change.proposed));
        if (change.original.date != change.proposed.date) {
            text += QStringLiteral(" on %1").arg(shortDate(change.proposed.date));
        }
        return text;
    }

    QString operator()(const SwapChange &change) const
    {
        return QStringLiteral("Swap %1 (%2) with %3 (%4)")
            .arg(shortDate(change.first.original.date),
                 name(change.first.original),
                 shortDate(change.second.original.date),
                 name(change.second.original));
    }

    QString operator()(const AddChange &change) const
    {
        return QStringLiteral("Add %1 on %2 from %3")
            .arg(name(change.proposed), shortDate(change.proposed.date), range(change.proposed));
    }

    QString operator()(const RemoveChange &change) const
    {
        return QStringLiteral("Remove %1's block at %2 on %3")
            .arg(name(change.original), range(change.original), shortDate(change.original.date));
    }

    QString operator()(const ReassignChange &change) const
    {
        return QStringLiteral("Reassign %1 %2 from %3 to %4")
            .arg(shortDate(change.original.date), range(change.original), name(change.original), name(change.proposed));
    }
};

struct BreakdownLine
{
    QString operator()(const RetimeChange &change) const
    {
        return QStringLiteral("~ %1: %2 -> %3 on %4")
            .arg(name(change.original), range(change.original), range(change.proposed), shortDate(change.proposed.date));
    }

    QString operator()(const SwapChange &change) const
    {
        return QStringLiteral("<> %1 (%2) <-> %3 (%4)")
            .arg(shortDate(change.first.original.date),
                 name(change.first.original),
                 shortDate(change.second.original.date),
                 name(change.second.original));
    }

    QString operator()(const AddChange &change) const
    {
        return QStringLiteral("+ %1: %2 %3").arg(name(change.proposed), shortDate(change.proposed.date), range(change.proposed));
    }

    QString operator()(const RemoveChange &change) const
    {
        return QStringLiteral("- %1: %2 %3").arg(name(change.original), shortDate(change.original.date), range(change.original));
    }

    QString operator()(const ReassignChange &change) const
    {
        return QStringLiteral("~ %1 %2: %3 -> %4")
            .arg(shortDate(change.original.date), range(change.original), name(change.original), name(change.proposed));
    }
};

struct Originals
{
    std::vector<TimeBlock> operator()(const RetimeChange &change) const { return { change.original }; }
    std::vector<TimeBlock> operator()(const SwapChange &change) const
    {
        return { change.first.original, change.second.original };
    }
    std::vector<TimeBlock> operator()(const AddChange &) const { return {}; }
    std::vector<TimeBlock> operator()(const RemoveChange &change) const { return { change.original }; }
    std::vector<TimeBlock> operator()(const ReassignChange &change) const { return { change.original }; }
};

struct Proposed
{
    std::vector<TimeBlock> operator()(const RetimeChange &change) const { return { change.proposed }; }
    std::vector<TimeBlock> operator()(const SwapChange &change) const
    {
        return { change.first.proposed, change.second.proposed };
    }
    std::vector<TimeBlock> operator()(const AddChange &change) const { return { change.proposed }; }
    std::vector<TimeBlock> operator()(const RemoveChange &) const { return {}; }
    std::vector<TimeBlock> operator()(const ReassignChange &change) const { return { change.proposed }; }
};

struct Invert
{
    ChangeKind operator()(const RetimeChange &change) const { return RetimeChange{ change.proposed, change.original }; }
    ChangeKind operator()(const SwapChange &change) const
    {
        return SwapChange{ BlockChange{ change.first.proposed, change.first.original },
                           BlockChange{ change.second.proposed, change.second.original } };
    }
    ChangeKind operator()(const AddChange &change) const { return RemoveChange{ change.proposed }; }
    ChangeKind operator()(const RemoveChange &change) const { return AddChange{ change.original }; }
    ChangeKind operator()(const ReassignChange &change) const
    {
        return ReassignChange{ change.proposed, change.original };
    }
};

std::optional<ScheduleError> checkBlock(const TimeBlock &block, const char *role)
{
    if (!block.date.isValid()) {
        return ScheduleError::make(ErrorCode::InvalidProposal, QStringLiteral("%1 block has no date").arg(QLatin1String(role)));
    }
    if (!SlotClock::isValidRange(block.startSlot, block.endSlot)) {
        return ScheduleError::make(ErrorCode::InvalidProposal,
                                   QStringLiteral("%1 block has invalid slot range %2-%3")
                                       .arg(QLatin1String(role))
                                       .arg(block.startSlot)
                                       .arg(block.endSlot));
    }
    return std::nullopt;
}

std::optional<ScheduleError> checkPair(const TimeBlock &original, const TimeBlock &proposed)
{
    if (auto error = checkBlock(original, "Original")) {
        return error;
    }
    if (auto error = checkBlock(proposed, "Proposed")) {
        return error;
    }
    if (original.id != proposed.id) {
        return ScheduleError::make(ErrorCode::InvalidProposal,
                                   QStringLiteral("Proposed block must keep the original id"));
    }
    return std::nullopt;
}

struct Validate
{
    std::optional<ScheduleError> operator()(const RetimeChange &change) const
    {
        if (auto error = checkPair(change.original, change.proposed)) {
            return error;
        }
        if (change.original.provider != change.proposed.provider) {
            return ScheduleError::make(ErrorCode::InvalidProposal, QStringLiteral("Retime must not change the provider"));
        }
        if (sameTiming(change.original, change.proposed)) {
            return ScheduleError::make(ErrorCode::InvalidProposal, QStringLiteral("Retime does not change the timing"));
        }
        return std::nullopt;
    }

    std::optional<ScheduleError> operator()(const SwapChange &change) const
    {
        if (auto error = checkPair(change.first.original, change.first.proposed)) {
            return error;
        }
        if (auto error = checkPair(change.second.original, change.second.proposed)) {
            return error;
        }
        if (change.first.original.id == change.second.original.id) {
            return ScheduleError::make(ErrorCode::InvalidProposal, QStringLiteral("Swap must reference two distinct blocks"));
        }
        return std::nullopt;
    }

    std::optional<ScheduleError> operator()(const AddChange &change) const
    {
        return checkBlock(change.proposed, "Proposed");
    }

    std::optional<ScheduleError> operator()(const RemoveChange &change) const
    {
        return checkBlock(change.original, "Original");
    }

    std::optional<ScheduleError> operator()(const ReassignChange &change) const
    {
        if (auto error = checkPair(change.original, change.proposed)) {
            return error;
        }
        if (!sameTiming(change.original, change.proposed)) {
            return ScheduleError::make(ErrorCode::InvalidProposal, QStringLiteral("Reassign must not change the timing"));
        }
        if (change.original.provider == change.proposed.provider) {
            return ScheduleError::make(ErrorCode::InvalidProposal, QStringLiteral("Reassign does not change the provider"));
        }
        return std::nullopt;
    }
};

} // namespace

QString changeTypeName(ChangeType type)
{
    switch (type) {
    case ChangeType::Retime:
        return QStringLiteral("retime");
    case ChangeType::Swap:
        return QStringLiteral("swap");
    case ChangeType::Add:
        return QStringLiteral("add");
    case ChangeType::Remove:
        return QStringLiteral("remove");
    case ChangeType::Reassign:
        return QStringLiteral("reassign");
    }
    return QStringLiteral("unknown");
}

ChangeProposal::ChangeProposal(ChangeKind kind, QString description, std::optional<QString> rationale, bool aiSuggested)
    : m_id(QUuid::createUuid())
    , m_kind(std::move(kind))
    , m_description(std::move(description))
    , m_rationale(std::move(rationale))
    , m_aiSuggested(aiSuggested)
    , m_createdAt(QDateTime::currentDateTimeUtc())
{
}

ChangeProposal ChangeProposal::retime(const TimeBlock &original, const QDate &date, int startSlot, int endSlot)
{
    TimeBlock proposed = original;
    proposed.date = date;
    proposed.startSlot = startSlot;
    proposed.endSlot = endSlot;
    return ChangeProposal(RetimeChange{ original, proposed });
}

ChangeProposal ChangeProposal::reassign(const TimeBlock &original, data::CareProvider provider)
{
    TimeBlock proposed = original;
    proposed.provider = provider;
    return ChangeProposal(ReassignChange{ original, proposed });
}

ChangeProposal ChangeProposal::swapProviders(const TimeBlock &first, const TimeBlock &second)
{
    TimeBlock firstProposed = first;
    firstProposed.provider = second.provider;
    TimeBlock secondProposed = second;
    secondProposed.provider = first.provider;
    return ChangeProposal(SwapChange{ BlockChange{ first, firstProposed }, BlockChange{ second, secondProposed } });
}

ChangeProposal ChangeProposal::swapTimes(const TimeBlock &first, const TimeBlock &second)
{
    TimeBlock firstProposed = first;
    firstProposed.date = second.date;
    firstProposed.startSlot = second.startSlot;
    firstProposed.endSlot = second.endSlot;
    TimeBlock secondProposed = second;
    secondProposed.date = first.date;
    secondProposed.startSlot = first.startSlot;
    secondProposed.endSlot = first.endSlot;
    return ChangeProposal(SwapChange{ BlockChange{ first, firstProposed }, BlockChange{ second, secondProposed } });
}

ChangeProposal ChangeProposal::add(TimeBlock proposed)
{
    return ChangeProposal(AddChange{ std::move(proposed) });
}

ChangeProposal ChangeProposal::remove(const TimeBlock &original)
{
    return ChangeProposal(RemoveChange{ original });
}

ChangeProposal ChangeProposal::suggestedBy(QString rationale) const
{
    ChangeProposal copy = *this;
    copy.m_rationale = std::move(rationale);
    copy.m_aiSuggested = true;
    return copy;
}

const QUuid &ChangeProposal::id() const
{
    return m_id;
}

const ChangeKind &ChangeProposal::kind() const
{
    return m_kind;
}

ChangeType ChangeProposal::type() const
{
    return std::visit(TypeOf{}, m_kind);
}

QString ChangeProposal::description() const
{
    if (!m_description.isEmpty()) {
        return m_description;
    }
    return std::visit(Describe{}, m_kind);
}

const std::optional<QString> &ChangeProposal::rationale() const
{
    return m_rationale;
}

bool ChangeProposal::wasAISuggested() const
{
    return m_aiSuggested;
}

const QDateTime &ChangeProposal::createdAt() const
{
    return m_createdAt;
}

std::vector<TimeBlock> ChangeProposal::originals() const
{
    return std::visit(Originals{}, m_kind);
}

std::vector<TimeBlock> ChangeProposal::proposedBlocks() const
{
    return std::visit(Proposed{}, m_kind);
}

std::vector<QDate> ChangeProposal::impactedDates() const
{
    std::vector<QDate> dates;
    for (const auto &block : originals()) {
        dates.push_back(block.date);
    }
    for (const auto &block : proposedBlocks()) {
        dates.push_back(block.date);
    }
    std::sort(dates.begin(), dates.end());
    dates.erase(std::unique(dates.begin(), dates.end()), dates.end());
    return dates;
}

QString ChangeProposal::breakdownLine() const
{
    return std::visit(BreakdownLine{}, m_kind);
}

ChangeProposal ChangeProposal::inverted() const
{
    ChangeProposal inverse(std::visit(Invert{}, m_kind));
    inverse.m_rationale = QStringLiteral("Reverts: %1").arg(description());
    return inverse;
}

std::optional<ScheduleError> validate(const ChangeProposal &proposal)
{
    auto error = std::visit(Validate{}, proposal.kind());
    if (error) {
        error->proposalId = proposal.id();
    }
    return error;
}

} // namespace schedule
} // namespace custody
