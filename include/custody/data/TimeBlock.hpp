#pragma once

#include <QDate>
#include <QString>
#include <QUuid>

#include "custody/data/CareProvider.hpp"

namespace custody {
namespace data {

// One contiguous coverage interval on a calendar day, [startSlot, endSlot).
struct TimeBlock
{
    QUuid id = QUuid::createUuid();
    QDate date;
    int startSlot = 0;
    int endSlot = 0;
    CareProvider provider = CareProvider::Unassigned;
    QString note;
    // Pattern that materialized this block, null for one-off blocks.
    QUuid seriesId;

    bool isValid() const;
    int durationMinutes() const;
    double durationHours() const;
    bool overlaps(const TimeBlock &other) const;
    bool contains(int slot) const;

    bool operator==(const TimeBlock &other) const;
    bool operator!=(const TimeBlock &other) const { return !(*this == other); }
};

QString describeBlock(const TimeBlock &block);

} // namespace data
} // namespace custody
