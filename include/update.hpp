#ifndef KOSTORE_UPDATE_HPP
#define KOSTORE_UPDATE_HPP

#include "package.hpp"

#include <string>
#include <vector>

namespace KoStore {

/**
 * @struct UpdateInfo
 * @brief An installed package whose listed release is newer.
 */
struct UpdateInfo
{
    std::string packageId;
    std::string installedVersion;
    std::string latestVersion;
    PackageKind kind = PackageKind::Plugin;
};

/**
 * @class UpdateChecker
 * @brief Compares installed records against listed packages.
 */
class UpdateChecker
{
public:
    /**
     * @brief Returns one UpdateInfo per record whose package is listed with
     *        a newer latestVersion, in record order.
     *
     * Records with an unknown (empty) installed version and packages
     * without a release are skipped.
     */
    static std::vector<UpdateInfo> checkForUpdates(const std::vector<InstalledRecord>& records,
                                                   const std::vector<PackageMetadata>& packages);
};

} // namespace KoStore

#endif // KOSTORE_UPDATE_HPP
