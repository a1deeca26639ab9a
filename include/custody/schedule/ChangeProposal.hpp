#pragma once

#include <QDateTime>
#include <QString>
#include <QUuid>
#include <optional>
#include <variant>
#include <vector>

#include "custody/core/ScheduleError.hpp"
#include "custody/data/TimeBlock.hpp"

namespace custody {
namespace schedule {

struct BlockChange
{
    data::TimeBlock original;
    data::TimeBlock proposed;
};

// Same block, same provider, new date and/or slots.
struct RetimeChange
{
    data::TimeBlock original;
    data::TimeBlock proposed;
};

// Two blocks exchange provider or timing.
struct SwapChange
{
    BlockChange first;
    BlockChange second;
};

struct AddChange
{
    data::TimeBlock proposed;
};

struct RemoveChange
{
    data::TimeBlock original;
};

// Same block and timing, new provider.
struct ReassignChange
{
    data::TimeBlock original;
    data::TimeBlock proposed;
};

// Every visitor over ChangeKind must handle each alternative; a new kind is a
// compile error until all of them do.
using ChangeKind = std::variant<RetimeChange, SwapChange, AddChange, RemoveChange, ReassignChange>;

enum class ChangeType
{
    Retime,
    Swap,
    Add,
    Remove,
    Reassign,
};

QString changeTypeName(ChangeType type);

// A single proposed mutation. Immutable once built; reviews track state separately.
class ChangeProposal
{
public:
    explicit ChangeProposal(ChangeKind kind,
                            QString description = {},
                            std::optional<QString> rationale = std::nullopt,
                            bool aiSuggested = false);

    static ChangeProposal retime(const data::TimeBlock &original, const QDate &date, int startSlot, int endSlot);
    static ChangeProposal reassign(const data::TimeBlock &original, data::CareProvider provider);
    static ChangeProposal swapProviders(const data::TimeBlock &first, const data::TimeBlock &second);
    static ChangeProposal swapTimes(const data::TimeBlock &first, const data::TimeBlock &second);
    static ChangeProposal add(data::TimeBlock proposed);
    static ChangeProposal remove(const data::TimeBlock &original);

    // Copy carrying the assistant's explanation and flag, with the same id.
    ChangeProposal suggestedBy(QString rationale) const;

    const QUuid &id() const;
    const ChangeKind &kind() const;
    ChangeType type() const;
    QString description() const;
    const std::optional<QString> &rationale() const;
    bool wasAISuggested() const;
    const QDateTime &createdAt() const;

    std::vector<data::TimeBlock> originals() const;
    std::vector<data::TimeBlock> proposedBlocks() const;
    // Sorted, without duplicates.
    std::vector<QDate> impactedDates() const;

    // One line for journal breakdowns, prefixed with + - ~ or <>.
    QString breakdownLine() const;

    // The change that undoes this one once applied.
    ChangeProposal inverted() const;

private:
    QUuid m_id;
    ChangeKind m_kind;
    QString m_description;
    std::optional<QString> m_rationale;
    bool m_aiSuggested = false;
    QDateTime m_createdAt;
};

// Structural checks only; never looks at the store.
std::optional<core::ScheduleError> validate(const ChangeProposal &proposal);

} // namespace schedule
} // namespace custody
