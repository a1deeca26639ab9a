#pragma once

#include <QString>
#include <array>
#include <optional>

namespace custody {
namespace data {

enum class CareProvider
{
    ParentA,
    ParentB,
    Nanny,
    Unassigned,
};

inline constexpr std::array<CareProvider, 4> AllCareProviders{
    CareProvider::ParentA,
    CareProvider::ParentB,
    CareProvider::Nanny,
    CareProvider::Unassigned,
};

// Stable key used by storage and the assistant payloads.
QString providerKey(CareProvider provider);
std::optional<CareProvider> providerFromKey(const QString &key);
QString defaultDisplayName(CareProvider provider);

} // namespace data
} // namespace custody
