#ifndef KOSTORE_DEVICE_HPP
#define KOSTORE_DEVICE_HPP

#include "package.hpp"

#include <string>
#include <vector>
#include <optional>

namespace KoStore {

/**
 * @class DeviceLocator
 * @brief Finds KOReader installations on mounted volumes and validates
 *        user-supplied device paths.
 *
 * Detection is advisory: it never throws and returns whatever candidates
 * pass validation. validate() is strict and reports why a path is unusable.
 */
class DeviceLocator
{
public:
    /**
     * @param volumeRoots Directories whose children are mounted volumes
     *                    (e.g. /media/alice). Each child is probed.
     * @param localPaths  Directories that may directly be a KOReader install
     *                    (e.g. ~/koreader).
     */
    explicit DeviceLocator(std::vector<fs::path> volumeRoots = defaultVolumeRoots(),
                           std::vector<fs::path> localPaths  = defaultLocalPaths());

    /**
     * @brief Returns every valid KOReader root found on the host, without
     *        duplicates, in search order.
     */
    std::vector<DevicePath> detect() const;

    /**
     * @brief Resolves a path to a KOReader root and checks it is usable.
     *
     * The path may be the KOReader directory itself or a volume/folder that
     * contains one in a known location. Missing plugins/ and patches/
     * directories are accepted when the root is writable; the installer
     * creates them on first use.
     *
     * @throws InvalidDeviceError with NotFound, WrongLayout or NotWritable.
     */
    DevicePath validate(const fs::path& path) const;

    /**
     * @brief Returns the firmware revision stored in git-rev, or an empty
     *        string if the file is missing.
     */
    static std::string readFirmwareVersion(const DevicePath& device);

    /**
     * @brief True if dir contains koreader.sh or settings.reader.lua.
     */
    static bool isMarkerDirectory(const fs::path& dir);

    static std::vector<fs::path> defaultVolumeRoots();
    static std::vector<fs::path> defaultLocalPaths();

private:
    std::optional<fs::path> findMarker(const fs::path& path) const;
    std::vector<fs::path> volumes() const;

    std::vector<fs::path> volumeRoots;
    std::vector<fs::path> localPaths;
};

} // namespace KoStore

#endif // KOSTORE_DEVICE_HPP
