#ifndef KOSTORE_REPOSITORY_HPP
#define KOSTORE_REPOSITORY_HPP

#include "package.hpp"
#include "cache.hpp"
#include "http.hpp"

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <nlohmann/json.hpp>

namespace KoStore {

/**
 * @struct StaleDataWarning
 * @brief Non-fatal signal that a cached payload past its TTL was served
 *        because the remote could not be reached.
 */
struct StaleDataWarning
{
    std::string key;
    Timestamp fetchedAt;
    std::string cause;

    std::string describe() const;
};

/**
 * @struct FetchResult
 * @brief Payload returned by the repository client, plus the stale-data
 *        warning when a fallback happened.
 */
template <typename T>
struct FetchResult
{
    T value;
    std::optional<StaleDataWarning> staleWarning;
    bool fromCache = false;
};

/**
 * @struct RepositoryOptions
 * @brief Remote endpoint, credential and limits for RepositoryClient.
 */
struct RepositoryOptions
{
    std::string apiBaseUrl = "https://api.github.com";
    std::string token;   ///< optional bearer credential
    std::string pluginTopic = "koreader-plugin";
    std::string patchTopic  = "koreader-user-patch";
    std::chrono::seconds ttl = std::chrono::hours(24 * 28);
    long connectTimeoutSeconds = 15;
    long requestTimeoutSeconds = 60;
    int perPage  = 100;
    int maxPages = 10;
};

/**
 * @class RepositoryClient
 * @brief Lists packages and resolves release assets from the GitHub API,
 *        consulting the MetadataCache first.
 *
 * Within the TTL a cached value is returned without any network call. On a
 * miss or expiry the remote is queried; if that fails and an expired entry
 * exists it is returned with a StaleDataWarning, otherwise FetchError is
 * thrown. Metadata calls are never retried here.
 */
class RepositoryClient
{
public:
    RepositoryClient(HttpClient& http, MetadataCache& cache, RepositoryOptions options);

    /**
     * @brief Packages of the given kind, in the remote's order, de-duplicated
     *        by id (the last occurrence wins, the first position is kept).
     *
     * @throws FetchError if the remote fails and nothing is cached.
     */
    FetchResult<std::vector<PackageMetadata>> listPackages(PackageKind kind);

    /**
     * @brief Like listPackages, but ignores the TTL of the cached listing.
     */
    FetchResult<std::vector<PackageMetadata>> refresh(PackageKind kind);

    /**
     * @brief Re-resolves the latest release of one package.
     *
     * @throws FetchError if the remote fails and nothing is cached.
     */
    FetchResult<PackageMetadata> getReleaseAsset(const std::string& packageId);

    /**
     * @brief Looks a package up in the cached listings (fresh or stale),
     *        without touching the network.
     */
    std::optional<PackageMetadata> findCached(const std::string& packageId);

    /**
     * @brief Drops every cached listing and release.
     */
    void clearCache();

    const RepositoryOptions& getOptions() const { return options; }

    /**
     * @brief Validates one search hit into PackageMetadata.
     *
     * @return std::nullopt if the item has no usable full_name.
     */
    static std::optional<PackageMetadata> parseRepository(const nlohmann::json& item,
                                                          PackageKind kind);

    /**
     * @brief Fills version, asset and checksum fields from a release object.
     *
     * @throws FetchError if the release has no tag_name.
     */
    static void applyRelease(PackageMetadata& package, const nlohmann::json& release);

    /**
     * @brief Points a package without releases at its default branch's
     *        source archive. Version and size stay unknown.
     */
    static void applySourceFallback(PackageMetadata& package);

private:
    FetchResult<std::vector<PackageMetadata>> listPackages(PackageKind kind, bool ignoreTtl);
    std::vector<PackageMetadata> fetchListing(PackageKind kind);
    PackageMetadata fetchRelease(const PackageMetadata& base);
    PackageMetadata fetchRepository(const std::string& packageId);
    void resolveForListing(PackageMetadata& package);
    nlohmann::json getJson(const std::string& url, long* statusOut = nullptr);
    HttpRequest makeRequest(const std::string& url) const;
    const std::string& topicFor(PackageKind kind) const;

    static std::string listKey(PackageKind kind);
    static std::string releaseKey(const std::string& packageId);

    HttpClient& http;
    MetadataCache& cache;
    RepositoryOptions options;
};

} // namespace KoStore

#endif // KOSTORE_REPOSITORY_HPP
