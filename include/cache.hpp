#ifndef KOSTORE_CACHE_HPP
#define KOSTORE_CACHE_HPP

#include "utils.hpp"

#include <string>
#include <vector>
#include <set>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <optional>
#include <functional>
#include <unordered_map>
#include <yaml-cpp/yaml.h>

namespace KoStore {

/**
 * @struct CacheEntry
 * @brief A fetched payload stamped with its fetch time and lifetime.
 */
template <typename T>
struct CacheEntry
{
    T payload;
    Timestamp fetchedAt;
    std::chrono::seconds ttl;

    bool isFresh(const Timestamp& now) const
    {
        return now - fetchedAt < ttl;
    }
};

/**
 * @struct CacheStatus
 * @brief Summary of one persisted cache entry, for `kostore cache info`.
 */
struct CacheStatus
{
    std::string key;
    Timestamp fetchedAt;
    std::chrono::seconds ttl;
    bool fresh = false;
    long ageDays = 0;
    std::size_t itemCount = 0;
};

/**
 * @class MetadataCache
 * @brief Keyed, TTL-stamped store of remote metadata persisted as one YAML
 *        file per key.
 *
 * Files are replaced atomically, so a read sees the previous entry or the
 * new one. A file that cannot be parsed is logged, deleted and reported as
 * a miss. Readers share one lock that is only held while the in-memory
 * entry is copied; writers of distinct keys use distinct file locks.
 *
 * Also persists the user's favorite package ids (favorites.yaml).
 */
class MetadataCache
{
public:
    using ClockFn = std::function<Timestamp()>;

    explicit MetadataCache(fs::path cacheDir, ClockFn clock = &Clock::now);

    /**
     * @brief Returns the entry stored under key, fresh or not.
     *
     * Freshness is the caller's decision (see CacheEntry::isFresh).
     */
    template <typename T>
    std::optional<CacheEntry<T>> get(const std::string& key);

    /**
     * @brief Stores payload under key, stamped with the current time.
     *
     * @throws IOError if the entry cannot be persisted.
     */
    template <typename T>
    void put(const std::string& key, const T& payload, std::chrono::seconds ttl);

    /**
     * @brief Drops one entry from memory and disk.
     */
    void remove(const std::string& key);

    /**
     * @brief Removes every cached entry. Favorites are kept.
     */
    void clear();

    /**
     * @brief Describes every entry persisted in the cache directory.
     */
    std::vector<CacheStatus> info();

    Timestamp now() const { return clock(); }

    const fs::path& directory() const { return cacheDir; }

    std::set<std::string> favorites() const;
    void addFavorite(const std::string& packageId);
    void removeFavorite(const std::string& packageId);
    bool isFavorite(const std::string& packageId) const;

private:
    struct RawEntry {
        std::string payload;   // serialized YAML
        Timestamp fetchedAt;
        std::chrono::seconds ttl;
        std::size_t itemCount = 0;
    };

    std::optional<RawEntry> getRaw(const std::string& key);
    void putRaw(const std::string& key, const YAML::Node& payload, std::chrono::seconds ttl);
    std::optional<RawEntry> loadFile(const std::string& key, const fs::path& file);
    std::shared_ptr<std::mutex> fileLockFor(const std::string& key);
    fs::path fileFor(const std::string& key) const;
    std::set<std::string> loadFavorites() const;
    void saveFavorites(const std::set<std::string>& ids) const;

    /**
     * @brief Deletes files in the cache directory whose names match the
     *        given pattern.
     */
    void removeFiles(const std::string& pattern);

    fs::path cacheDir;
    ClockFn clock;

    mutable std::shared_mutex entriesMutex;
    std::unordered_map<std::string, RawEntry> entries;

    std::mutex fileLocksMutex;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> fileLocks;

    mutable std::mutex favoritesMutex;
};

// ---------------------------------------------------------------------------
// Template members
// ---------------------------------------------------------------------------

template <typename T>
std::optional<CacheEntry<T>> MetadataCache::get(const std::string& key)
{
    auto raw = getRaw(key);
    if (!raw) {
        return std::nullopt;
    }

    try {
        YAML::Node node = YAML::Load(raw->payload);
        return CacheEntry<T>{node.as<T>(), raw->fetchedAt, raw->ttl};
    } catch (const YAML::Exception& e) {
        log_warning("Discarding unreadable cache entry '" + key + "': " + e.what());
        remove(key);
        return std::nullopt;
    }
}

template <typename T>
void MetadataCache::put(const std::string& key, const T& payload, std::chrono::seconds ttl)
{
    YAML::Node node;
    node = payload;
    putRaw(key, node, ttl);
}

} // namespace KoStore

#endif // KOSTORE_CACHE_HPP
