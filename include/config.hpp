#ifndef KOSTORE_CONFIG_HPP
#define KOSTORE_CONFIG_HPP

#include <string>
#include <optional>
#include <chrono>
#include <filesystem>

namespace KoStore {

class Config
{
public:
    /**
     * @brief GitHub token used as a bearer credential. Empty means
     *        unauthenticated (lower rate limit).
     */
    std::string githubToken;

    std::string apiBaseUrl = "https://api.github.com";
    std::filesystem::path cacheDir;
    int cacheTtlDays = 28;

    /**
     * @brief Manually chosen device path, still validated before use.
     */
    std::optional<std::filesystem::path> devicePath;

    std::string pluginTopic = "koreader-plugin";
    std::string patchTopic  = "koreader-user-patch";

    int  downloadAttempts       = 3;
    long backoffMs              = 500;
    long connectTimeoutSeconds  = 15;
    long requestTimeoutSeconds  = 60;
    long downloadTimeoutSeconds = 300;

    bool verbose = false;

    /**
     * @brief Loads configuration from a YAML file on disk.
     *
     * A missing file yields the defaults. The GITHUB_TOKEN environment
     * variable, when set, overrides the file's token.
     *
     * @param path Path to the configuration file.
     * @return A fully populated Config instance.
     * @throws ConfigError if the file exists but cannot be parsed.
     */
    static Config loadFromFile(const std::filesystem::path& path);

    /**
     * @brief Saves the current configuration to a file.
     * @param path Path to the file where configuration should be saved.
     * @throws IOError if the file cannot be written.
     */
    void saveToFile(const std::filesystem::path& path) const;

    /**
     * @brief Prints the configuration to standard output, token masked.
     */
    void print() const;

    /**
     * @brief Validates and stores a token.
     *
     * @return False (and leaves the current token untouched) if the token
     *         does not look like a GitHub token.
     */
    bool setToken(const std::string& token);

    /**
     * @brief Cache entry lifetime derived from cacheTtlDays.
     */
    std::chrono::seconds cacheTtl() const;

    /**
     * @brief Accepts "ghp_" + 36 alphanumerics or "github_pat_" + 22 or
     *        more word characters.
     */
    static bool isValidToken(const std::string& token);

    /**
     * @brief $XDG_CONFIG_HOME/kostore/config.yaml, or ~/.config/kostore/config.yaml.
     */
    static std::filesystem::path defaultPath();

    /**
     * @brief $XDG_CACHE_HOME/kostore, or ~/.cache/kostore.
     */
    static std::filesystem::path defaultCacheDir();
};

} // namespace KoStore

#endif // KOSTORE_CONFIG_HPP
