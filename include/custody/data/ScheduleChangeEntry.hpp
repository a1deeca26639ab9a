#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QUuid>
#include <map>
#include <vector>

#include "custody/data/CareProvider.hpp"

namespace custody {
namespace data {

// Activity journal record written once when a batch is applied.
struct ScheduleChangeEntry
{
    QUuid id = QUuid::createUuid();
    QDateTime timestamp;
    QString actorName;
    CareProvider actorRole = CareProvider::Unassigned;
    QUuid batchId;
    QString title;
    QString narration;
    QString aiSummary;
    int changesApplied = 0;
    std::vector<QDate> datesImpacted;
    std::map<CareProvider, double> careTimeDelta;
    QString breakdown;
};

} // namespace data
} // namespace custody
