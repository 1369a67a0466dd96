#include "repository.hpp"
#include "errors.hpp"
#include "version.hpp"

#include <unordered_map>
#include <algorithm>

using json = nlohmann::json;

namespace KoStore {

// ============================================================================
// Helper Functions
// ============================================================================
namespace {

    /**
     * @brief Safely get string value from JSON, handling null and wrong types.
     */
    std::string jsonString(const json& j, const char* key)
    {
        if (!j.is_object() || !j.contains(key)) {
            return "";
        }
        const auto& val = j[key];
        if (val.is_string()) {
            return val.get<std::string>();
        }
        return "";
    }

    /**
     * @brief Non-negative integer field, or std::nullopt if missing/invalid.
     */
    std::optional<std::uint64_t> jsonSize(const json& j, const char* key)
    {
        if (!j.is_object() || !j.contains(key)) {
            return std::nullopt;
        }
        const auto& val = j[key];
        if (val.is_number_unsigned()) {
            return val.get<std::uint64_t>();
        }
        if (val.is_number_integer() && val.get<std::int64_t>() >= 0) {
            return static_cast<std::uint64_t>(val.get<std::int64_t>());
        }
        return std::nullopt;
    }

    std::optional<Timestamp> jsonTimestamp(const json& j, const char* key)
    {
        const std::string text = jsonString(j, key);
        Timestamp ts;
        if (text.empty() || !parseTimestamp(text, ts)) {
            return std::nullopt;
        }
        return ts;
    }

    bool endsWith(const std::string& value, const std::string& suffix)
    {
        return value.size() >= suffix.size() &&
               value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    // Picks the asset matching the package kind; nullptr if none has a URL
    const json* selectAsset(const json& assets, PackageKind kind)
    {
        if (!assets.is_array()) {
            return nullptr;
        }

        std::vector<std::string> preferred;
        if (kind == PackageKind::Plugin) {
            preferred = {".zip"};
        } else {
            preferred = {".lua", ".zip"};
        }

        for (const auto& suffix : preferred) {
            for (const auto& asset : assets) {
                if (jsonString(asset, "browser_download_url").empty()) {
                    continue;
                }
                if (endsWith(toLower(jsonString(asset, "name")), suffix)) {
                    return &asset;
                }
            }
        }
        for (const auto& asset : assets) {
            if (!jsonString(asset, "browser_download_url").empty()) {
                return &asset;
            }
        }
        return nullptr;
    }

    // Percent-encodes a query value (only what topic names can contain)
    std::string encodeQuery(const std::string& value)
    {
        std::string out;
        for (char c : value) {
            if (c == ' ') {
                out += "%20";
            } else if (c == ':') {
                out += "%3A";
            } else {
                out += c;
            }
        }
        return out;
    }

    // Maps a non-2xx GitHub answer to FetchError
    void checkStatus(const HttpResponse& response, const std::string& url, bool anonymous)
    {
        if ((response.status == 403 || response.status == 429) &&
            response.header("X-RateLimit-Remaining") == "0") {
            std::string reset = response.header("X-RateLimit-Reset");
            throw FetchError("GitHub API rate limit exceeded" +
                             (reset.empty() ? std::string() : " (resets at epoch " + reset + ")") +
                             (anonymous ? "; configure a github_token for a higher limit"
                                        : std::string()));
        }
        if (response.status == 401) {
            throw FetchError("GitHub rejected the credentials (HTTP 401); check github_token");
        }
        if (response.status < 200 || response.status >= 300) {
            throw FetchError("HTTP " + std::to_string(response.status) + " from " + url);
        }
    }

} // namespace

std::string StaleDataWarning::describe() const
{
    return "Using cached data for '" + key + "' from " + formatTimestamp(fetchedAt) +
           " (older than its lifetime): " + cause;
}

// ============================================================================
// RepositoryClient
// ============================================================================
RepositoryClient::RepositoryClient(HttpClient& http, MetadataCache& cache,
                                   RepositoryOptions options)
    : http(http), cache(cache), options(std::move(options))
{
    if (this->options.token.empty()) {
        log_debug("No GitHub token configured; using unauthenticated API limits");
    }
}

std::string RepositoryClient::listKey(PackageKind kind)
{
    return std::string("list:") + toString(kind);
}

std::string RepositoryClient::releaseKey(const std::string& packageId)
{
    return "release:" + packageId;
}

const std::string& RepositoryClient::topicFor(PackageKind kind) const
{
    return kind == PackageKind::Plugin ? options.pluginTopic : options.patchTopic;
}

HttpRequest RepositoryClient::makeRequest(const std::string& url) const
{
    HttpRequest request;
    request.url = url;
    request.connectTimeoutSeconds = options.connectTimeoutSeconds;
    request.timeoutSeconds        = options.requestTimeoutSeconds;
    request.headers.emplace_back("Accept", "application/vnd.github+json");
    request.headers.emplace_back("X-GitHub-Api-Version", "2022-11-28");
    if (!options.token.empty()) {
        request.headers.emplace_back("Authorization", "Bearer " + options.token);
    }
    return request;
}

json RepositoryClient::getJson(const std::string& url, long* statusOut)
{
    HttpResponse response;
    try {
        response = http.get(makeRequest(url));
    } catch (const NetworkError& e) {
        throw FetchError(e.what());
    }

    if (statusOut) {
        *statusOut = response.status;
        if (response.status == 404) {
            return json();
        }
    }

    checkStatus(response, url, options.token.empty());

    try {
        return json::parse(response.body);
    } catch (const json::exception& e) {
        throw FetchError("Malformed JSON from " + url + ": " + e.what());
    }
}

std::optional<PackageMetadata> RepositoryClient::parseRepository(const json& item,
                                                                 PackageKind kind)
{
    PackageMetadata package;
    package.id = jsonString(item, "full_name");
    if (package.id.empty() || package.id.find('/') == std::string::npos) {
        return std::nullopt;
    }

    package.kind          = kind;
    package.name          = jsonString(item, "name");
    if (package.name.empty()) {
        package.name = package.repoName();
    }
    package.description   = jsonString(item, "description");
    package.htmlUrl       = jsonString(item, "html_url");
    package.defaultBranch = jsonString(item, "default_branch");
    if (item.contains("owner")) {
        package.owner = jsonString(item["owner"], "login");
    }
    package.stars     = jsonSize(item, "stargazers_count").value_or(0);
    package.updatedAt = jsonTimestamp(item, "updated_at");
    return package;
}

void RepositoryClient::applyRelease(PackageMetadata& package, const json& release)
{
    const std::string tag = jsonString(release, "tag_name");
    if (tag.empty()) {
        throw FetchError("Release of " + package.id + " has no tag_name");
    }

    package.latestVersion = Version::stripPrefix(tag);
    package.publishedAt   = jsonTimestamp(release, "published_at");
    package.checksum.reset();

    const json* asset = release.contains("assets") ? selectAsset(release["assets"], package.kind)
                                                   : nullptr;
    if (asset) {
        package.downloadUrl = jsonString(*asset, "browser_download_url");
        package.assetName   = jsonString(*asset, "name");
        package.assetSize   = jsonSize(*asset, "size");
        const std::string digest = jsonString(*asset, "digest");
        if (digest.rfind("sha256:", 0) == 0 && digest.size() > 7) {
            package.checksum = digest;
        }
    } else {
        package.downloadUrl = jsonString(release, "zipball_url");
        package.assetName   = package.repoName() + "-" + tag + ".zip";
        package.assetSize.reset();
        if (package.downloadUrl.empty()) {
            throw FetchError("Release " + tag + " of " + package.id + " has nothing to download");
        }
    }
}

void RepositoryClient::applySourceFallback(PackageMetadata& package)
{
    const std::string branch = package.defaultBranch.empty() ? "master" : package.defaultBranch;
    const std::string base   = package.htmlUrl.empty() ? "https://github.com/" + package.id
                                                       : package.htmlUrl;
    package.latestVersion.clear();
    package.downloadUrl = base + "/archive/refs/heads/" + branch + ".zip";
    package.assetName   = package.repoName() + "-" + branch + ".zip";
    package.assetSize.reset();
    package.checksum.reset();
    package.publishedAt.reset();
}

// ============================================================================
// Listing
// ============================================================================
FetchResult<std::vector<PackageMetadata>> RepositoryClient::listPackages(PackageKind kind)
{
    return listPackages(kind, false);
}

FetchResult<std::vector<PackageMetadata>> RepositoryClient::refresh(PackageKind kind)
{
    return listPackages(kind, true);
}

FetchResult<std::vector<PackageMetadata>> RepositoryClient::listPackages(PackageKind kind,
                                                                         bool ignoreTtl)
{
    const std::string key = listKey(kind);
    auto cached = cache.get<std::vector<PackageMetadata>>(key);

    if (cached && !ignoreTtl && cached->isFresh(cache.now())) {
        log_debug("Using cached " + std::string(toString(kind)) + " listing");
        return {cached->payload, std::nullopt, true};
    }

    try {
        auto packages = fetchListing(kind);
        try {
            cache.put(key, packages, options.ttl);
        } catch (const IOError& e) {
            log_warning(std::string("Could not persist listing: ") + e.what());
        }
        log_message("Fetched " + std::to_string(packages.size()) + " " + toString(kind) +
                    "(s) from GitHub");
        return {packages, std::nullopt, false};
    } catch (const FetchError& e) {
        if (!cached) {
            throw;
        }
        StaleDataWarning warning{key, cached->fetchedAt, e.getCause()};
        log_warning(warning.describe());
        return {cached->payload, warning, true};
    }
}

std::vector<PackageMetadata> RepositoryClient::fetchListing(PackageKind kind)
{
    std::vector<PackageMetadata> packages;
    std::unordered_map<std::string, std::size_t> positions;

    std::string url = options.apiBaseUrl + "/search/repositories?q=" +
                      encodeQuery("topic:" + topicFor(kind)) +
                      "&per_page=" + std::to_string(options.perPage) + "&page=1";

    for (int page = 1; page <= options.maxPages && !url.empty(); ++page) {
        HttpResponse response;
        try {
            response = http.get(makeRequest(url));
        } catch (const NetworkError& e) {
            throw FetchError(e.what());
        }
        checkStatus(response, url, options.token.empty());

        json body;
        try {
            body = json::parse(response.body);
        } catch (const json::exception& e) {
            throw FetchError("Malformed JSON from " + url + ": " + e.what());
        }

        const json& items = body.is_array() ? body : (body.contains("items") ? body["items"] : json());
        if (!items.is_array()) {
            throw FetchError("Unexpected search response from " + url + ": no items");
        }

        for (const auto& item : items) {
            auto package = parseRepository(item, kind);
            if (!package) {
                log_warning("Skipping search result without a full_name");
                continue;
            }
            auto it = positions.find(package->id);
            if (it != positions.end()) {
                packages[it->second] = std::move(*package);
            } else {
                positions.emplace(package->id, packages.size());
                packages.push_back(std::move(*package));
            }
        }

        // Prefer the Link header; fall back to page numbers while pages are full
        auto next = nextLinkFromHeader(response.header("Link"));
        if (next) {
            url = *next;
        } else if (response.header("Link").empty() &&
                   static_cast<int>(items.size()) >= options.perPage) {
            url = options.apiBaseUrl + "/search/repositories?q=" +
                  encodeQuery("topic:" + topicFor(kind)) +
                  "&per_page=" + std::to_string(options.perPage) +
                  "&page=" + std::to_string(page + 1);
        } else {
            url.clear();
        }
    }

    for (auto& package : packages) {
        resolveForListing(package);
    }
    return packages;
}

void RepositoryClient::resolveForListing(PackageMetadata& package)
{
    const std::string key = releaseKey(package.id);
    auto cached = cache.get<PackageMetadata>(key);
    if (cached && cached->isFresh(cache.now()) && cached->payload.kind == package.kind) {
        PackageMetadata resolved = package;
        resolved.latestVersion = cached->payload.latestVersion;
        resolved.downloadUrl   = cached->payload.downloadUrl;
        resolved.assetName     = cached->payload.assetName;
        resolved.assetSize     = cached->payload.assetSize;
        resolved.checksum      = cached->payload.checksum;
        resolved.publishedAt   = cached->payload.publishedAt;
        package = std::move(resolved);
        return;
    }

    try {
        package = fetchRelease(package);
        try {
            cache.put(key, package, options.ttl);
        } catch (const IOError& e) {
            log_warning(std::string("Could not persist release: ") + e.what());
        }
    } catch (const FetchError& e) {
        // One broken repository must not hide the others
        log_warning("Could not resolve release of " + package.id + ": " + e.getCause());
        if (cached) {
            package.latestVersion = cached->payload.latestVersion;
            package.downloadUrl   = cached->payload.downloadUrl;
            package.assetName     = cached->payload.assetName;
            package.assetSize     = cached->payload.assetSize;
            package.checksum      = cached->payload.checksum;
            package.publishedAt   = cached->payload.publishedAt;
        }
    }
}

// ============================================================================
// Releases
// ============================================================================
FetchResult<PackageMetadata> RepositoryClient::getReleaseAsset(const std::string& packageId)
{
    const std::string key = releaseKey(packageId);
    auto cached = cache.get<PackageMetadata>(key);

    if (cached && cached->isFresh(cache.now())) {
        log_debug("Using cached release of " + packageId);
        return {cached->payload, std::nullopt, true};
    }

    try {
        std::optional<PackageMetadata> base = findCached(packageId);
        if (!base) {
            base = fetchRepository(packageId);
        }
        PackageMetadata resolved = fetchRelease(*base);
        try {
            cache.put(key, resolved, options.ttl);
        } catch (const IOError& e) {
            log_warning(std::string("Could not persist release: ") + e.what());
        }
        return {resolved, std::nullopt, false};
    } catch (const FetchError& e) {
        if (!cached) {
            throw;
        }
        StaleDataWarning warning{key, cached->fetchedAt, e.getCause()};
        log_warning(warning.describe());
        return {cached->payload, warning, true};
    }
}

PackageMetadata RepositoryClient::fetchRepository(const std::string& packageId)
{
    json item = getJson(options.apiBaseUrl + "/repos/" + packageId);

    // Kind is decided by which topic the repository carries
    PackageKind kind = PackageKind::Plugin;
    if (item.contains("topics") && item["topics"].is_array()) {
        for (const auto& topic : item["topics"]) {
            if (topic.is_string() && topic.get<std::string>() == options.patchTopic) {
                kind = PackageKind::Patch;
            }
        }
    }

    auto package = parseRepository(item, kind);
    if (!package) {
        throw FetchError("Repository response for " + packageId + " has no full_name");
    }
    return *package;
}

PackageMetadata RepositoryClient::fetchRelease(const PackageMetadata& base)
{
    PackageMetadata package = base;
    long status = 0;
    json release = getJson(options.apiBaseUrl + "/repos/" + base.id + "/releases/latest", &status);

    if (status == 404) {
        log_debug(base.id + " has no releases; using the default branch archive");
        applySourceFallback(package);
        return package;
    }
    applyRelease(package, release);
    return package;
}

std::optional<PackageMetadata> RepositoryClient::findCached(const std::string& packageId)
{
    for (PackageKind kind : {PackageKind::Plugin, PackageKind::Patch}) {
        auto listing = cache.get<std::vector<PackageMetadata>>(listKey(kind));
        if (!listing) {
            continue;
        }
        auto it = std::find_if(listing->payload.begin(), listing->payload.end(),
                               [&](const PackageMetadata& p) { return p.id == packageId; });
        if (it != listing->payload.end()) {
            return *it;
        }
    }
    return std::nullopt;
}

void RepositoryClient::clearCache()
{
    cache.clear();
}

} // namespace KoStore
