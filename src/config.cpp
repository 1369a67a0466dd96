#include "config.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <iostream>
#include <regex>
#include <cstdlib>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace KoStore {

namespace {

    fs::path homeDir()
    {
        const char* home = std::getenv("HOME");
        if (home && *home) {
            return fs::path(home);
        }
        return fs::temp_directory_path();
    }

    fs::path xdgDir(const char* variable, const char* fallback)
    {
        const char* value = std::getenv(variable);
        if (value && *value) {
            return fs::path(value);
        }
        return homeDir() / fallback;
    }

    template <typename T>
    void readScalar(const YAML::Node& root, const char* key, T& target)
    {
        if (root[key]) {
            target = root[key].as<T>();
        }
    }

} // namespace

Config Config::loadFromFile(const fs::path& path)
{
    Config config;
    config.cacheDir = defaultCacheDir();

    if (!fs::exists(path)) {
        log_debug("Configuration file not found, using defaults: " + path.string());
    } else {
        try {
            YAML::Node root = YAML::LoadFile(path.string());
            if (root && !root.IsNull()) {
                if (!root.IsMap()) {
                    throw ConfigError("Configuration file " + path.string() +
                                      " must contain a mapping");
                }

                std::string token;
                readScalar(root, "github_token", token);
                token = trim(token);
                if (!token.empty() && !config.setToken(token)) {
                    log_warning("Ignoring github_token in " + path.string() +
                                ": invalid token format");
                }

                readScalar(root, "api_base_url", config.apiBaseUrl);
                if (root["cache_dir"]) {
                    config.cacheDir = root["cache_dir"].as<std::string>();
                }
                readScalar(root, "cache_ttl_days", config.cacheTtlDays);
                if (root["device_path"]) {
                    config.devicePath = fs::path(root["device_path"].as<std::string>());
                }
                readScalar(root, "plugin_topic", config.pluginTopic);
                readScalar(root, "patch_topic", config.patchTopic);
                readScalar(root, "download_attempts", config.downloadAttempts);
                readScalar(root, "backoff_ms", config.backoffMs);
                readScalar(root, "connect_timeout_seconds", config.connectTimeoutSeconds);
                readScalar(root, "request_timeout_seconds", config.requestTimeoutSeconds);
                readScalar(root, "download_timeout_seconds", config.downloadTimeoutSeconds);
                readScalar(root, "verbose", config.verbose);
            }
        } catch (const YAML::Exception& e) {
            throw ConfigError("Unable to parse configuration file " + path.string() +
                              ": " + e.what());
        }
    }

    if (config.cacheTtlDays <= 0) {
        throw ConfigError("cache_ttl_days must be positive");
    }
    if (config.downloadAttempts < 1) {
        throw ConfigError("download_attempts must be at least 1");
    }

    const char* envToken = std::getenv("GITHUB_TOKEN");
    if (envToken && *envToken) {
        if (!config.setToken(trim(envToken))) {
            log_warning("Ignoring GITHUB_TOKEN: invalid token format");
        }
    }

    return config;
}

void Config::saveToFile(const fs::path& path) const
{
    YAML::Emitter out;
    out << YAML::Comment("KOStore configuration");
    out << YAML::BeginMap;
    if (!githubToken.empty()) {
        out << YAML::Key << "github_token" << YAML::Value << githubToken;
    }
    out << YAML::Key << "api_base_url" << YAML::Value << apiBaseUrl;
    out << YAML::Key << "cache_dir" << YAML::Value << cacheDir.string();
    out << YAML::Key << "cache_ttl_days" << YAML::Value << cacheTtlDays;
    if (devicePath) {
        out << YAML::Key << "device_path" << YAML::Value << devicePath->string();
    }
    out << YAML::Key << "plugin_topic" << YAML::Value << pluginTopic;
    out << YAML::Key << "patch_topic" << YAML::Value << patchTopic;
    out << YAML::Key << "download_attempts" << YAML::Value << downloadAttempts;
    out << YAML::Key << "backoff_ms" << YAML::Value << backoffMs;
    out << YAML::Key << "connect_timeout_seconds" << YAML::Value << connectTimeoutSeconds;
    out << YAML::Key << "request_timeout_seconds" << YAML::Value << requestTimeoutSeconds;
    out << YAML::Key << "download_timeout_seconds" << YAML::Value << downloadTimeoutSeconds;
    out << YAML::Key << "verbose" << YAML::Value << verbose;
    out << YAML::EndMap;

    writeFileAtomically(path, std::string(out.c_str()) + "\n");
}

void Config::print() const
{
    std::cout << "Configuration:" << std::endl;
    std::cout << "  github_token:      "
              << (githubToken.empty() ? "(none)" : githubToken.substr(0, 4) + "********")
              << std::endl;
    std::cout << "  api_base_url:      " << apiBaseUrl << std::endl;
    std::cout << "  cache_dir:         " << cacheDir.string() << std::endl;
    std::cout << "  cache_ttl_days:    " << cacheTtlDays << std::endl;
    std::cout << "  device_path:       " << (devicePath ? devicePath->string() : "(detect)")
              << std::endl;
    std::cout << "  plugin_topic:      " << pluginTopic << std::endl;
    std::cout << "  patch_topic:       " << patchTopic << std::endl;
    std::cout << "  download_attempts: " << downloadAttempts << std::endl;
}

bool Config::setToken(const std::string& token)
{
    if (!isValidToken(token)) {
        return false;
    }
    githubToken = token;
    return true;
}

std::chrono::seconds Config::cacheTtl() const
{
    return std::chrono::hours(24) * cacheTtlDays;
}

bool Config::isValidToken(const std::string& token)
{
    static const std::regex classic(R"(^ghp_[A-Za-z0-9]{36}$)");
    static const std::regex fineGrained(R"(^github_pat_\w{22,}$)");
    return std::regex_match(token, classic) || std::regex_match(token, fineGrained);
}

fs::path Config::defaultPath()
{
    return xdgDir("XDG_CONFIG_HOME", ".config") / "kostore" / "config.yaml";
}

fs::path Config::defaultCacheDir()
{
    return xdgDir("XDG_CACHE_HOME", ".cache") / "kostore";
}

} // namespace KoStore
