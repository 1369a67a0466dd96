#include "list.hpp"
#include "version.hpp"

#include <map>
#include <iomanip>

namespace KoStore {

void List::showPackages(std::ostream& out,
                        const std::vector<PackageMetadata>& packages,
                        const std::vector<InstalledRecord>& records,
                        const std::set<std::string>& favorites)
{
    if (packages.empty()) {
        out << "No packages found." << std::endl;
        return;
    }

    std::map<std::string, const InstalledRecord*> installed;
    for (const auto& record : records) {
        installed[record.packageId] = &record;
    }

    for (const auto& package : packages) {
        std::string marker;
        auto it = installed.find(package.id);
        if (it != installed.end()) {
            const InstalledRecord& record = *it->second;
            const bool outdated = !record.installedVersion.empty() &&
                                  !package.latestVersion.empty() &&
                                  Version::isNewer(package.latestVersion, record.installedVersion);
            marker = outdated ? " [update " + record.installedVersion + " -> " +
                                package.latestVersion + "]"
                              : " [installed]";
        }

        out << (favorites.count(package.id) ? "* " : "  ")
            << std::left << std::setw(40) << package.id << " "
            << std::setw(12) << (package.latestVersion.empty() ? "-" : package.latestVersion)
            << " " << std::right << std::setw(6) << package.stars << " stars"
            << marker << "\n";
        if (!package.description.empty()) {
            out << "      " << package.description << "\n";
        }
    }
    out << packages.size() << " package(s)" << std::endl;
}

void List::showInstalledPackages(std::ostream& out, const std::vector<InstalledRecord>& records)
{
    out << "Installed Packages:\n";
    out << "-------------------\n";

    if (records.empty()) {
        out << "No packages are installed." << std::endl;
        return;
    }

    for (const auto& record : records) {
        out << std::left << std::setw(40) << record.packageId << " "
            << std::setw(12) << (record.installedVersion.empty() ? "unknown" : record.installedVersion)
            << " " << std::setw(7) << toString(record.kind)
            << " " << record.installPath.string() << "\n";
    }
    out << std::flush;
}

} // namespace KoStore
