#include "device.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <fstream>
#include <cstdlib>
#include <set>

namespace KoStore {

namespace {

    // Where KOReader lives on the various e-reader families, relative to a volume
    const char* const knownLocations[] = {
        "",              // generic: <volume>/koreader
        ".adds",         // Kobo
        "extensions",    // Kindle
        "documents",     // PocketBook style layouts
        ".kobo",
        "applications",  // PocketBook
    };

    const char* userName()
    {
        const char* user = std::getenv("USER");
        if (!user || !*user) {
            user = std::getenv("LOGNAME");
        }
        return (user && *user) ? user : nullptr;
    }

    /**
     * @brief Checks that a file can be created in dir by creating and
     *        deleting a probe file.
     */
    bool isWritableDirectory(const fs::path& dir)
    {
        const fs::path probe = generateTempPath(".kostore-probe", dir);
        {
            std::ofstream out(probe);
            if (!out) {
                return false;
            }
        }
        std::error_code ec;
        fs::remove(probe, ec);
        return true;
    }

    /**
     * @brief A subdirectory is usable if it is a writable directory, or
     *        absent in a writable root.
     */
    bool isUsableSubdirectory(const fs::path& dir, bool rootWritable)
    {
        std::error_code ec;
        if (!fs::exists(dir, ec)) {
            return rootWritable;
        }
        return fs::is_directory(dir, ec) && isWritableDirectory(dir);
    }

    DevicePath makeDevicePath(const fs::path& root)
    {
        DevicePath device;
        device.rootPath   = root;
        device.pluginsDir = root / "plugins";
        device.patchesDir = root / "patches";
        return device;
    }

} // namespace

DeviceLocator::DeviceLocator(std::vector<fs::path> volumeRoots, std::vector<fs::path> localPaths)
    : volumeRoots(std::move(volumeRoots)), localPaths(std::move(localPaths))
{
}

std::vector<fs::path> DeviceLocator::defaultVolumeRoots()
{
    std::vector<fs::path> roots;
#if defined(_WIN32)
    for (char drive = 'E'; drive <= 'Z'; ++drive) {
        roots.emplace_back(std::string(1, drive) + ":\\");
    }
#elif defined(__APPLE__)
    roots.emplace_back("/Volumes");
#else
    const char* user = userName();
    if (user) {
        roots.emplace_back(fs::path("/media") / user);
    }
    roots.emplace_back("/media");
    if (user) {
        roots.emplace_back(fs::path("/run/media") / user);
    }
    roots.emplace_back("/mnt");
#endif
    return roots;
}

std::vector<fs::path> DeviceLocator::defaultLocalPaths()
{
    std::vector<fs::path> paths;
#if defined(__APPLE__)
    paths.emplace_back("/Applications/koreader");
#elif !defined(_WIN32)
    const char* home = std::getenv("HOME");
    if (home && *home) {
        paths.emplace_back(fs::path(home) / "koreader");
    }
    paths.emplace_back("/opt/koreader");
#endif
    return paths;
}

bool DeviceLocator::isMarkerDirectory(const fs::path& dir)
{
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return false;
    }
    return fs::exists(dir / "koreader.sh", ec) || fs::exists(dir / "settings.reader.lua", ec);
}

std::vector<fs::path> DeviceLocator::volumes() const
{
    std::vector<fs::path> result;
    for (const auto& root : volumeRoots) {
        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            continue;
        }
        // A filesystem root (a drive letter) is itself a volume
        if (root == root.root_path()) {
            result.push_back(root);
            continue;
        }
        // increment(ec) instead of range-for: a volume may be unmounted mid-scan
        fs::directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
            std::error_code typeEc;
            if (it->is_directory(typeEc)) {
                result.push_back(it->path());
            }
        }
        if (ec) {
            log_debug("Could not list " + root.string() + ": " + ec.message());
        }
    }
    return result;
}

std::optional<fs::path> DeviceLocator::findMarker(const fs::path& path) const
{
    if (isMarkerDirectory(path)) {
        return path;
    }
    for (const char* location : knownLocations) {
        fs::path candidate = path;
        if (*location) {
            candidate /= location;
        }
        candidate /= "koreader";
        if (isMarkerDirectory(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::vector<DevicePath> DeviceLocator::detect() const
{
    std::vector<fs::path> candidates;
    for (const auto& volume : volumes()) {
        if (auto marker = findMarker(volume)) {
            candidates.push_back(*marker);
        }
    }
    for (const auto& local : localPaths) {
        if (isMarkerDirectory(local)) {
            candidates.push_back(local);
        }
    }

    std::vector<DevicePath> devices;
    std::set<fs::path> seen;
    for (const auto& candidate : candidates) {
        std::error_code ec;
        fs::path canonical = fs::weakly_canonical(candidate, ec);
        if (ec) {
            canonical = candidate.lexically_normal();
        }
        if (!seen.insert(canonical).second) {
            continue;
        }
        try {
            devices.push_back(validate(candidate));
            log_debug("Found KOReader at " + candidate.string());
        } catch (const InvalidDeviceError& e) {
            log_debug("Skipping " + candidate.string() + ": " + e.what());
        }
    }

    if (devices.empty()) {
        log_debug("No KOReader device detected");
    }
    return devices;
}

DevicePath DeviceLocator::validate(const fs::path& path) const
{
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        throw InvalidDeviceError(InvalidDeviceError::Reason::NotFound,
                                 "Device path does not exist: " + path.string());
    }

    auto marker = findMarker(path);
    if (!marker) {
        throw InvalidDeviceError(InvalidDeviceError::Reason::WrongLayout,
                                 "No KOReader installation (koreader.sh or settings.reader.lua) under " +
                                 path.string());
    }

    DevicePath device = makeDevicePath(*marker);
    const bool rootWritable = isWritableDirectory(device.rootPath);
    if (!isUsableSubdirectory(device.pluginsDir, rootWritable)) {
        throw InvalidDeviceError(InvalidDeviceError::Reason::NotWritable,
                                 "Cannot write to " + device.pluginsDir.string());
    }
    if (!isUsableSubdirectory(device.patchesDir, rootWritable)) {
        throw InvalidDeviceError(InvalidDeviceError::Reason::NotWritable,
                                 "Cannot write to " + device.patchesDir.string());
    }

    device.isValid = true;
    return device;
}

std::string DeviceLocator::readFirmwareVersion(const DevicePath& device)
{
    const fs::path revFile = device.rootPath / "git-rev";
    std::ifstream in(revFile);
    if (!in) {
        return "";
    }
    std::string line;
    std::getline(in, line);
    return trim(line);
}

} // namespace KoStore
