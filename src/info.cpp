#include "info.hpp"
#include "version.hpp"

#include <sstream>
#include <iomanip>

namespace KoStore {

// ============================================================================
// PackageInfo Constructor
// ============================================================================
PackageInfo::PackageInfo(PackageMetadata package,
                         std::optional<InstalledRecord> installed,
                         bool favorite)
    : package(std::move(package)),
      installed(std::move(installed)),
      favorite(favorite)
{
}

bool PackageInfo::hasUpdate() const
{
    return installed && !installed->installedVersion.empty() &&
           !package.latestVersion.empty() &&
           Version::isNewer(package.latestVersion, installed->installedVersion);
}

std::string formatSize(std::uint64_t bytes)
{
    static const char* const units[] = {"B", "KiB", "MiB", "GiB"};
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 3) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << value << " " << units[unit];
    return out.str();
}

// ============================================================================
// Display package information
// ============================================================================
void PackageInfo::display(std::ostream& out) const
{
    out << "Package:      " << package.id << (favorite ? "  [favorite]" : "") << "\n";
    out << "Name:         " << package.name << "\n";
    out << "Kind:         " << toString(package.kind) << "\n";
    if (!package.owner.empty()) {
        out << "Owner:        " << package.owner << "\n";
    }
    out << "Stars:        " << package.stars << "\n";
    out << "Version:      "
        << (package.latestVersion.empty() ? "(no release, default branch)" : package.latestVersion)
        << "\n";
    if (package.publishedAt) {
        out << "Published:    " << formatTimestamp(*package.publishedAt) << "\n";
    }
    if (package.updatedAt) {
        out << "Updated:      " << formatTimestamp(*package.updatedAt) << "\n";
    }
    out << "Asset:        " << package.assetName;
    if (package.assetSize) {
        out << " (" << formatSize(*package.assetSize) << ")";
    }
    out << "\n";
    if (package.checksum) {
        out << "Checksum:     " << *package.checksum << "\n";
    }
    if (!package.htmlUrl.empty()) {
        out << "Homepage:     " << package.htmlUrl << "\n";
    }
    out << "Description:  " << (package.description.empty() ? "-" : package.description) << "\n";

    if (!installed) {
        out << "Installed:    no\n";
        return;
    }

    out << "Installed:    "
        << (installed->installedVersion.empty() ? "unknown version" : installed->installedVersion)
        << " on " << formatTimestamp(installed->installedAt)
        << (hasUpdate() ? "  (update available)" : "") << "\n";
    out << "Files:\n";
    for (const auto& file : installed->files) {
        out << "  " << file.string() << "\n";
    }
}

} // namespace KoStore
