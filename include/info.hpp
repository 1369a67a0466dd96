#ifndef KOSTORE_INFO_HPP
#define KOSTORE_INFO_HPP

#include "package.hpp"

#include <string>
#include <optional>
#include <ostream>

namespace KoStore {

/**
 * @class PackageInfo
 * @brief Describes one package for `kostore info`: its remote metadata and,
 *        when a device is known, what is installed.
 */
class PackageInfo
{
public:
    /**
     * @param package   Remote metadata of the package.
     * @param installed Install record on the current device, if any.
     * @param favorite  Whether the user marked the package as favorite.
     */
    PackageInfo(PackageMetadata package,
                std::optional<InstalledRecord> installed,
                bool favorite);

    const PackageMetadata& getPackage() const { return package; }
    const std::optional<InstalledRecord>& getInstalled() const { return installed; }

    /**
     * @return True if installed and the remote release is newer.
     */
    bool hasUpdate() const;

    /**
     * @brief Prints the metadata, the install state and the owned files.
     */
    void display(std::ostream& out) const;

private:
    PackageMetadata package;
    std::optional<InstalledRecord> installed;
    bool favorite;
};

/**
 * @brief Formats a byte count as "512 B", "4.0 KiB", "1.3 MiB".
 */
std::string formatSize(std::uint64_t bytes);

} // namespace KoStore

#endif // KOSTORE_INFO_HPP
