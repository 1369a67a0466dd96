#include "cache.hpp"
#include "errors.hpp"

#include <regex>

namespace KoStore {

namespace {

    const char* const entrySuffix    = ".cache.yaml";
    const char* const favoritesFile  = "favorites.yaml";

    std::size_t countItems(const YAML::Node& payload)
    {
        if (payload.IsSequence() || payload.IsMap()) {
            return payload.size();
        }
        return payload.IsNull() ? 0 : 1;
    }

} // namespace

MetadataCache::MetadataCache(fs::path cacheDir, ClockFn clock)
    : cacheDir(std::move(cacheDir)), clock(std::move(clock))
{
    std::error_code ec;
    fs::create_directories(this->cacheDir, ec);
    if (ec) {
        log_warning("Could not create cache directory " + this->cacheDir.string() +
                    ": " + ec.message());
    }
    log_debug("Metadata cache at " + this->cacheDir.string());
}

fs::path MetadataCache::fileFor(const std::string& key) const
{
    return cacheDir / (sanitizeKey(key) + entrySuffix);
}

std::shared_ptr<std::mutex> MetadataCache::fileLockFor(const std::string& key)
{
    std::lock_guard<std::mutex> lock(fileLocksMutex);
    auto& slot = fileLocks[key];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

std::optional<MetadataCache::RawEntry> MetadataCache::getRaw(const std::string& key)
{
    {
        std::shared_lock<std::shared_mutex> lock(entriesMutex);
        auto it = entries.find(key);
        if (it != entries.end()) {
            return it->second;
        }
    }

    const fs::path file = fileFor(key);
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        return std::nullopt;
    }

    std::optional<RawEntry> loaded;
    {
        auto fileLock = fileLockFor(key);
        std::lock_guard<std::mutex> guard(*fileLock);
        loaded = loadFile(key, file);
    }
    if (!loaded) {
        return std::nullopt;
    }

    std::unique_lock<std::shared_mutex> lock(entriesMutex);
    // A concurrent put wins over what we read from disk
    return entries.emplace(key, *loaded).first->second;
}

std::optional<MetadataCache::RawEntry> MetadataCache::loadFile(const std::string& key,
                                                               const fs::path& file)
{
    try {
        YAML::Node root = YAML::LoadFile(file.string());
        if (!root.IsMap() || !root["key"] || !root["fetched_at"] ||
            !root["ttl_seconds"] || !root["payload"]) {
            throw YAML::Exception(YAML::Mark::null_mark(), "missing entry fields");
        }
        if (root["key"].as<std::string>() != key) {
            // Two keys sanitized to the same file name; not ours
            log_debug("Cache file " + file.string() + " belongs to another key");
            return std::nullopt;
        }

        RawEntry entry;
        if (!parseTimestamp(root["fetched_at"].as<std::string>(), entry.fetchedAt)) {
            throw YAML::Exception(YAML::Mark::null_mark(), "bad fetched_at");
        }
        entry.ttl = std::chrono::seconds(root["ttl_seconds"].as<long long>());

        YAML::Emitter out;
        out << root["payload"];
        entry.payload   = out.c_str();
        entry.itemCount = countItems(root["payload"]);
        return entry;
    } catch (const YAML::Exception& e) {
        // Interrupted or foreign write: self-heal by treating it as a miss
        log_warning("Corrupt cache file " + file.string() + " ignored: " + e.what());
        std::error_code ec;
        fs::remove(file, ec);
        return std::nullopt;
    }
}

void MetadataCache::putRaw(const std::string& key, const YAML::Node& payload,
                           std::chrono::seconds ttl)
{
    RawEntry entry;
    entry.fetchedAt = clock();
    entry.ttl       = ttl;
    entry.itemCount = countItems(payload);
    {
        YAML::Emitter payloadOut;
        payloadOut << payload;
        entry.payload = payloadOut.c_str();
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "key" << YAML::Value << key;
    out << YAML::Key << "fetched_at" << YAML::Value << formatTimestamp(entry.fetchedAt);
    out << YAML::Key << "ttl_seconds" << YAML::Value << static_cast<long long>(ttl.count());
    out << YAML::Key << "payload" << YAML::Value << payload;
    out << YAML::EndMap;

    {
        auto fileLock = fileLockFor(key);
        std::lock_guard<std::mutex> guard(*fileLock);
        writeFileAtomically(fileFor(key), std::string(out.c_str()) + "\n");
    }

    {
        std::unique_lock<std::shared_mutex> lock(entriesMutex);
        entries[key] = std::move(entry);
    }
    log_debug("Cached '" + key + "' (" + std::to_string(countItems(payload)) + " item(s))");
}

void MetadataCache::remove(const std::string& key)
{
    {
        std::unique_lock<std::shared_mutex> lock(entriesMutex);
        entries.erase(key);
    }
    auto fileLock = fileLockFor(key);
    std::lock_guard<std::mutex> guard(*fileLock);
    std::error_code ec;
    fs::remove(fileFor(key), ec);
}

void MetadataCache::clear()
{
    {
        std::unique_lock<std::shared_mutex> lock(entriesMutex);
        entries.clear();
    }
    removeFiles(R"(.*\.cache\.yaml$)");
    log_message("Cache cleared");
}

void MetadataCache::removeFiles(const std::string& pattern)
{
    try {
        if (!fs::exists(cacheDir)) {
            return;
        }

        std::regex regexPattern(pattern);

        for (const auto& entry : fs::directory_iterator(cacheDir)) {
            if (fs::is_regular_file(entry)) {
                std::string filename = entry.path().filename().string();
                if (std::regex_match(filename, regexPattern)) {
                    fs::remove(entry);
                    log_debug("Removed: " + entry.path().string());
                }
            }
        }
    } catch (const std::exception& e) {
        log_error("Error cleaning directory " + cacheDir.string() + ": " + e.what());
    }
}

std::vector<CacheStatus> MetadataCache::info()
{
    std::vector<CacheStatus> result;
    std::error_code ec;
    if (!fs::exists(cacheDir, ec)) {
        return result;
    }

    const Timestamp current = clock();
    for (const auto& file : fs::directory_iterator(cacheDir, ec)) {
        const std::string filename = file.path().filename().string();
        if (filename.size() <= std::string(entrySuffix).size() ||
            filename.compare(filename.size() - std::string(entrySuffix).size(),
                             std::string::npos, entrySuffix) != 0) {
            continue;
        }

        std::string key;
        try {
            YAML::Node root = YAML::LoadFile(file.path().string());
            if (root["key"]) {
                key = root["key"].as<std::string>();
            }
        } catch (const YAML::Exception& e) {
            log_warning("Corrupt cache file " + file.path().string() + ": " + e.what());
            continue;
        }
        if (key.empty()) {
            continue;
        }

        auto raw = getRaw(key);
        if (!raw) {
            continue;
        }
        CacheStatus status;
        status.key       = key;
        status.fetchedAt = raw->fetchedAt;
        status.ttl       = raw->ttl;
        status.fresh     = current - raw->fetchedAt < raw->ttl;
        status.ageDays   = static_cast<long>(
            std::chrono::duration_cast<std::chrono::hours>(current - raw->fetchedAt).count() / 24);
        status.itemCount = raw->itemCount;
        result.push_back(status);
    }
    return result;
}

// ============================================================================
// Favorites
// ============================================================================
std::set<std::string> MetadataCache::favorites() const
{
    std::lock_guard<std::mutex> lock(favoritesMutex);
    return loadFavorites();
}

// Callers hold favoritesMutex
std::set<std::string> MetadataCache::loadFavorites() const
{
    std::set<std::string> ids;
    const fs::path file = cacheDir / favoritesFile;
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        return ids;
    }
    try {
        YAML::Node root = YAML::LoadFile(file.string());
        if (root.IsSequence()) {
            for (const auto& item : root) {
                ids.insert(item.as<std::string>());
            }
        }
    } catch (const YAML::Exception& e) {
        log_warning("Ignoring unreadable favorites file " + file.string() + ": " + e.what());
    }
    return ids;
}

// Callers hold favoritesMutex
void MetadataCache::saveFavorites(const std::set<std::string>& ids) const
{
    YAML::Emitter out;
    out << YAML::BeginSeq;
    for (const auto& id : ids) {
        out << id;
    }
    out << YAML::EndSeq;

    writeFileAtomically(cacheDir / favoritesFile, std::string(out.c_str()) + "\n");
}

void MetadataCache::addFavorite(const std::string& packageId)
{
    std::lock_guard<std::mutex> lock(favoritesMutex);
    auto ids = loadFavorites();
    if (ids.insert(packageId).second) {
        saveFavorites(ids);
        log_message("Added " + packageId + " to favorites");
    }
}

void MetadataCache::removeFavorite(const std::string& packageId)
{
    std::lock_guard<std::mutex> lock(favoritesMutex);
    auto ids = loadFavorites();
    if (ids.erase(packageId) > 0) {
        saveFavorites(ids);
        log_message("Removed " + packageId + " from favorites");
    }
}

bool MetadataCache::isFavorite(const std::string& packageId) const
{
    return favorites().count(packageId) > 0;
}

} // namespace KoStore
