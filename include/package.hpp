#ifndef KOSTORE_PACKAGE_HPP
#define KOSTORE_PACKAGE_HPP

#include "utils.hpp"

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <yaml-cpp/yaml.h>

namespace KoStore {

/**
 * @brief What a package installs as on the device.
 */
enum class PackageKind { Plugin, Patch };

/**
 * @brief Returns "plugin" or "patch".
 */
const char* toString(PackageKind kind);

/**
 * @brief Parses "plugin"/"plugins"/"patch"/"patches" (case-insensitive).
 *
 * @return False if the text names neither kind.
 */
bool parseKind(const std::string& text, PackageKind& out);

/**
 * @struct PackageMetadata
 * @brief One installable unit as published on the remote repository.
 *
 * Records are replaced as a whole on every fetch. Fields the remote did not
 * report stay empty (or std::nullopt) rather than being defaulted.
 */
struct PackageMetadata
{
    std::string id;              ///< "owner/repo", stable and unique
    std::string name;
    std::string description;
    std::string latestVersion;   ///< empty when the repository has no release
    std::string downloadUrl;
    std::string assetName;
    std::optional<std::uint64_t> assetSize;
    std::optional<std::string>   checksum;   ///< "sha256:<hex>"
    std::optional<Timestamp>     publishedAt;
    PackageKind kind = PackageKind::Plugin;

    std::string owner;
    std::string htmlUrl;
    std::string defaultBranch;
    std::uint64_t stars = 0;
    std::optional<Timestamp> updatedAt;

    /**
     * @brief Last path component of the id ("owner/foo.koplugin" -> "foo.koplugin").
     */
    std::string repoName() const;
};

/**
 * @struct InstalledRecord
 * @brief Persisted fact that a package version is installed on a device.
 */
struct InstalledRecord
{
    std::string packageId;
    std::string installedVersion;
    fs::path    installPath;
    Timestamp   installedAt{};
    PackageKind kind = PackageKind::Plugin;
    std::vector<fs::path> files;   ///< every path the install owns
};

/**
 * @struct DevicePath
 * @brief A KOReader root on some mounted filesystem.
 */
struct DevicePath
{
    fs::path rootPath;
    fs::path pluginsDir;
    fs::path patchesDir;
    bool     isValid = false;

    /**
     * @brief Directory packages of the given kind are installed into.
     */
    const fs::path& dirFor(PackageKind kind) const
    {
        return kind == PackageKind::Plugin ? pluginsDir : patchesDir;
    }
};

} // namespace KoStore

// ---------------------------------------------------------------------------
// yaml-cpp conversions used by the cache and the installed-record store
// ---------------------------------------------------------------------------
namespace YAML {

template <>
struct convert<KoStore::PackageMetadata>
{
    static Node encode(const KoStore::PackageMetadata& rhs);
    static bool decode(const Node& node, KoStore::PackageMetadata& rhs);
};

template <>
struct convert<KoStore::InstalledRecord>
{
    static Node encode(const KoStore::InstalledRecord& rhs);
    static bool decode(const Node& node, KoStore::InstalledRecord& rhs);
};

} // namespace YAML

#endif // KOSTORE_PACKAGE_HPP
