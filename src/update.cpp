#include "update.hpp"
#include "version.hpp"
#include "utils.hpp"

#include <unordered_map>

namespace KoStore {

// ============================================================================
// UpdateChecker::checkForUpdates
// ============================================================================
// Indexes the listing by id, then asks the version comparator about every
// installed record.
std::vector<UpdateInfo> UpdateChecker::checkForUpdates(const std::vector<InstalledRecord>& records,
                                                       const std::vector<PackageMetadata>& packages)
{
    std::unordered_map<std::string, const PackageMetadata*> byId;
    for (const auto& package : packages) {
        byId[package.id] = &package;
    }

    std::vector<UpdateInfo> updates;
    for (const auto& record : records) {
        if (record.installedVersion.empty()) {
            log_debug("Skipping " + record.packageId + ": installed version unknown");
            continue;
        }

        auto it = byId.find(record.packageId);
        if (it == byId.end()) {
            log_debug(record.packageId + " is not in the listing");
            continue;
        }
        const PackageMetadata& package = *it->second;
        if (package.latestVersion.empty()) {
            continue;
        }

        if (Version::isNewer(package.latestVersion, record.installedVersion)) {
            updates.push_back({record.packageId, record.installedVersion,
                               package.latestVersion, package.kind});
        }
    }
    return updates;
}

} // namespace KoStore
