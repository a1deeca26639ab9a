#include "custody/schedule/CareBalance.hpp"

#include <QMutexLocker>
#include <algorithm>
#include <cmath>

#include "custody/data/TimeBlockStore.hpp"

namespace custody {
namespace schedule {

using data::CareProvider;

namespace {
bool isPrimary(CareProvider provider)
{
    return provider == CareProvider::ParentA || provider == CareProvider::ParentB;
}
} // namespace

QString CareDays::format(double totalHours) const
{
    if (fullDays > 0 && remainingHours >= 0.25) {
        return QStringLiteral("%1 day%2, %3 hrs")
            .arg(fullDays)
            .arg(fullDays == 1 ? QString() : QStringLiteral("s"))
            .arg(remainingHours, 0, 'f', 1);
    }
    if (fullDays > 0) {
        return QStringLiteral("%1 care-day%2").arg(fullDays).arg(fullDays == 1 ? QString() : QStringLiteral("s"));
    }
    return QStringLiteral("%1 hrs").arg(totalHours, 0, 'f', 1);
}

CareBalance::CareBalance(std::map<CareProvider, double> hoursByProvider, double thresholdHours)
    : m_hours(std::move(hoursByProvider))
    , m_thresholdHours(thresholdHours)
{
}

const std::map<CareProvider, double> &CareBalance::hoursByProvider() const
{
    return m_hours;
}

double CareBalance::hours(CareProvider provider) const
{
    const auto it = m_hours.find(provider);
    return it == m_hours.end() ? 0.0 : it->second;
}

double CareBalance::thresholdHours() const
{
    return m_thresholdHours;
}

double CareBalance::primaryTotal() const
{
    return hours(CareProvider::ParentA) + hours(CareProvider::ParentB);
}

double CareBalance::fraction(CareProvider provider) const
{
    if (!isPrimary(provider)) {
        return 0.0;
    }
    const double total = primaryTotal();
    if (total <= 0.0) {
        return 0.5;
    }
    return hours(provider) / total;
}

double CareBalance::balanceDelta() const
{
    return std::abs(hours(CareProvider::ParentA) - hours(CareProvider::ParentB));
}

bool CareBalance::isBalanced() const
{
    return balanceDelta() <= m_thresholdHours;
}

CareProvider CareBalance::ahead() const
{
    return hours(CareProvider::ParentA) >= hours(CareProvider::ParentB) ? CareProvider::ParentA
                                                                        : CareProvider::ParentB;
}

CareProvider CareBalance::behind() const
{
    return ahead() == CareProvider::ParentA ? CareProvider::ParentB : CareProvider::ParentA;
}

double CareBalance::informationalHours() const
{
    double total = 0.0;
    for (const auto &entry : m_hours) {
        if (!isPrimary(entry.first)) {
            total += entry.second;
        }
    }
    return total;
}

CareDays CareBalance::careDays(double careWindowHours) const
{
    CareDays days;
    const double delta = balanceDelta();
    if (careWindowHours <= 0.0) {
        days.remainingHours = delta;
        return days;
    }
    days.fullDays = static_cast<int>(std::floor(delta / careWindowHours));
    days.remainingHours = delta - days.fullDays * careWindowHours;
    return days;
}

CareBalanceAggregator::CareBalanceAggregator(double weeklyThresholdHours)
    : m_weeklyThresholdHours(weeklyThresholdHours)
{
}

void CareBalanceAggregator::setWeeklyThresholdHours(double hours)
{
    QMutexLocker locker(&m_mutex);
    m_weeklyThresholdHours = hours;
}

double CareBalanceAggregator::weeklyThresholdHours() const
{
    QMutexLocker locker(&m_mutex);
    return m_weeklyThresholdHours;
}

CareBalance CareBalanceAggregator::balance(const std::vector<data::TimeBlock> &blocks, int dayCount) const
{
    std::map<CareProvider, double> hours;
    for (const auto &block : blocks) {
        hours[block.provider] += block.durationHours();
    }
    const double threshold = weeklyThresholdHours() * std::max(dayCount, 0) / 7.0;
    return CareBalance(std::move(hours), threshold);
}

CareBalance CareBalanceAggregator::balanceFor(const data::TimeBlockStore &store, const QDate &from, const QDate &to) const
{
    const quint64 revision = store.revision();
    const double weekly = weeklyThresholdHours();
    {
        QMutexLocker locker(&m_mutex);
        if (m_cache && m_cache->revision == revision && m_cache->from == from && m_cache->to == to
            && m_cache->weeklyThreshold == weekly) {
            return m_cache->balance;
        }
    }

    const int dayCount = static_cast<int>(from.daysTo(to)) + 1;
    CareBalance result = balance(store.blocksInRange(from, to), dayCount);

    QMutexLocker locker(&m_mutex);
    m_cache = CacheEntry{ revision, from, to, weekly, result };
    return result;
}

} // namespace schedule
} // namespace custody
