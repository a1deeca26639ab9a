#include "custody/data/CareProvider.hpp"

namespace custody {
namespace data {

QString providerKey(CareProvider provider)
{
    switch (provider) {
    case CareProvider::ParentA:
        return QStringLiteral("parent_a");
    case CareProvider::ParentB:
        return QStringLiteral("parent_b");
    case CareProvider::Nanny:
        return QStringLiteral("nanny");
    case CareProvider::Unassigned:
        return QStringLiteral("none");
    }
    return QStringLiteral("none");
}

std::optional<CareProvider> providerFromKey(const QString &key)
{
    const QString normalized = key.trimmed().toLower();
    for (CareProvider provider : AllCareProviders) {
        if (providerKey(provider) == normalized) {
            return provider;
        }
    }
    return std::nullopt;
}

QString defaultDisplayName(CareProvider provider)
{
    switch (provider) {
    case CareProvider::ParentA:
        return QStringLiteral("Caregiver 1");
    case CareProvider::ParentB:
        return QStringLiteral("Caregiver 2");
    case CareProvider::Nanny:
        return QStringLiteral("Nanny");
    case CareProvider::Unassigned:
        return QStringLiteral("Unassigned");
    }
    return QStringLiteral("Unassigned");
}

} // namespace data
} // namespace custody
