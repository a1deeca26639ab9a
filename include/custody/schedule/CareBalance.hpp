#pragma once

#include <QDate>
#include <QMutex>
#include <QString>
#include <QtGlobal>
#include <map>
#include <optional>
#include <vector>

#include "custody/data/TimeBlock.hpp"

namespace custody {
namespace data {
class TimeBlockStore;
}

namespace schedule {

// A care-time gap expressed as whole care-window days plus leftover hours.
struct CareDays
{
    int fullDays = 0;
    double remainingHours = 0.0;

    // "3 days, 2.5 hrs", "1 care-day" or "2.5 hrs".
    QString format(double totalHours) const;
};

// Derived view over a set of blocks. Fractions and the balance delta only
// consider the two primary parents; Nanny and Unassigned hours are informational.
class CareBalance
{
public:
    CareBalance(std::map<data::CareProvider, double> hoursByProvider, double thresholdHours);

    const std::map<data::CareProvider, double> &hoursByProvider() const;
    double hours(data::CareProvider provider) const;
    double thresholdHours() const;

    double primaryTotal() const;
    // 0.5 each for the primaries when neither has any hours; 0 for others.
    double fraction(data::CareProvider provider) const;
    double balanceDelta() const;
    bool isBalanced() const;

    // Primary parent with more hours; ParentA on a tie.
    data::CareProvider ahead() const;
    data::CareProvider behind() const;

    double informationalHours() const;
    CareDays careDays(double careWindowHours) const;

private:
    std::map<data::CareProvider, double> m_hours;
    double m_thresholdHours = 0.0;
};

class CareBalanceAggregator
{
public:
    static constexpr double DefaultWeeklyThresholdHours = 4.0;

    explicit CareBalanceAggregator(double weeklyThresholdHours = DefaultWeeklyThresholdHours);

    void setWeeklyThresholdHours(double hours);
    double weeklyThresholdHours() const;

    // The threshold scales with the period: weekly * dayCount / 7.
    CareBalance balance(const std::vector<data::TimeBlock> &blocks, int dayCount = 7) const;

    // Over [from, to] inclusive. Cached until the store revision changes.
    CareBalance balanceFor(const data::TimeBlockStore &store, const QDate &from, const QDate &to) const;

private:
    struct CacheEntry
    {
        quint64 revision = 0;
        QDate from;
        QDate to;
        double weeklyThreshold = 0.0;
        CareBalance balance;
    };

    mutable QMutex m_mutex;
    double m_weeklyThresholdHours;
    mutable std::optional<CacheEntry> m_cache;
};

} // namespace schedule
} // namespace custody
