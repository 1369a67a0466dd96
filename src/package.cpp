#include "package.hpp"

namespace KoStore {

const char* toString(PackageKind kind)
{
    return kind == PackageKind::Plugin ? "plugin" : "patch";
}

bool parseKind(const std::string& text, PackageKind& out)
{
    const std::string lower = toLower(trim(text));
    if (lower == "plugin" || lower == "plugins") {
        out = PackageKind::Plugin;
        return true;
    }
    if (lower == "patch" || lower == "patches") {
        out = PackageKind::Patch;
        return true;
    }
    return false;
}

std::string PackageMetadata::repoName() const
{
    auto pos = id.find_last_of('/');
    return pos == std::string::npos ? id : id.substr(pos + 1);
}

} // namespace KoStore

namespace YAML {

namespace {

    void putTimestamp(Node& node, const char* key, const std::optional<KoStore::Timestamp>& value)
    {
        if (value) {
            node[key] = KoStore::formatTimestamp(*value);
        }
    }

    // Missing or unparseable timestamps stay empty
    std::optional<KoStore::Timestamp> getTimestamp(const Node& node, const char* key)
    {
        if (!node[key] || !node[key].IsScalar()) {
            return std::nullopt;
        }
        KoStore::Timestamp ts;
        if (!KoStore::parseTimestamp(node[key].as<std::string>(), ts)) {
            return std::nullopt;
        }
        return ts;
    }

    std::string getString(const Node& node, const char* key)
    {
        if (node[key] && node[key].IsScalar()) {
            return node[key].as<std::string>();
        }
        return "";
    }

} // namespace

Node convert<KoStore::PackageMetadata>::encode(const KoStore::PackageMetadata& rhs)
{
    Node node;
    node["id"]             = rhs.id;
    node["name"]           = rhs.name;
    node["description"]    = rhs.description;
    node["latest_version"] = rhs.latestVersion;
    node["download_url"]   = rhs.downloadUrl;
    node["asset_name"]     = rhs.assetName;
    if (rhs.assetSize) {
        node["asset_size"] = *rhs.assetSize;
    }
    if (rhs.checksum) {
        node["checksum"] = *rhs.checksum;
    }
    putTimestamp(node, "published_at", rhs.publishedAt);
    node["kind"]           = KoStore::toString(rhs.kind);
    node["owner"]          = rhs.owner;
    node["html_url"]       = rhs.htmlUrl;
    node["default_branch"] = rhs.defaultBranch;
    node["stars"]          = rhs.stars;
    putTimestamp(node, "updated_at", rhs.updatedAt);
    return node;
}

bool convert<KoStore::PackageMetadata>::decode(const Node& node, KoStore::PackageMetadata& rhs)
{
    if (!node.IsMap() || !node["id"] || !node["kind"]) {
        return false;
    }

    KoStore::PackageMetadata result;
    result.id = node["id"].as<std::string>();
    if (result.id.empty() || !KoStore::parseKind(node["kind"].as<std::string>(), result.kind)) {
        return false;
    }

    result.name          = getString(node, "name");
    result.description   = getString(node, "description");
    result.latestVersion = getString(node, "latest_version");
    result.downloadUrl   = getString(node, "download_url");
    result.assetName     = getString(node, "asset_name");
    if (node["asset_size"]) {
        result.assetSize = node["asset_size"].as<std::uint64_t>();
    }
    if (node["checksum"]) {
        result.checksum = node["checksum"].as<std::string>();
    }
    result.publishedAt   = getTimestamp(node, "published_at");
    result.owner         = getString(node, "owner");
    result.htmlUrl       = getString(node, "html_url");
    result.defaultBranch = getString(node, "default_branch");
    if (node["stars"]) {
        result.stars = node["stars"].as<std::uint64_t>();
    }
    result.updatedAt     = getTimestamp(node, "updated_at");

    rhs = std::move(result);
    return true;
}

Node convert<KoStore::InstalledRecord>::encode(const KoStore::InstalledRecord& rhs)
{
    Node node;
    node["package_id"]        = rhs.packageId;
    node["installed_version"] = rhs.installedVersion;
    node["install_path"]      = rhs.installPath.string();
    node["installed_at"]      = KoStore::formatTimestamp(rhs.installedAt);
    node["kind"]              = KoStore::toString(rhs.kind);
    Node files(NodeType::Sequence);
    for (const auto& file : rhs.files) {
        files.push_back(file.string());
    }
    node["files"] = files;
    return node;
}

bool convert<KoStore::InstalledRecord>::decode(const Node& node, KoStore::InstalledRecord& rhs)
{
    if (!node.IsMap() || !node["package_id"] || !node["install_path"]) {
        return false;
    }

    KoStore::InstalledRecord result;
    result.packageId        = node["package_id"].as<std::string>();
    result.installedVersion = getString(node, "installed_version");
    result.installPath      = node["install_path"].as<std::string>();
    if (result.packageId.empty() || result.installPath.empty()) {
        return false;
    }

    auto installedAt = getTimestamp(node, "installed_at");
    if (installedAt) {
        result.installedAt = *installedAt;
    }
    if (node["kind"] && !KoStore::parseKind(node["kind"].as<std::string>(), result.kind)) {
        return false;
    }

    if (node["files"] && node["files"].IsSequence()) {
        for (const auto& file : node["files"]) {
            if (file.IsScalar()) {
                result.files.emplace_back(file.as<std::string>());
            }
        }
    }
    if (result.files.empty()) {
        result.files.push_back(result.installPath);
    }

    rhs = std::move(result);
    return true;
}

} // namespace YAML
