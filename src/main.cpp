#include <iostream>
#include <string>
#include <vector>
#include <csignal>
#include <thread>
#include <chrono>
#include <set>
#include <algorithm>

#include "config.hpp"
#include "errors.hpp"
#include "http.hpp"
#include "cache.hpp"
#include "repository.hpp"
#include "device.hpp"
#include "install.hpp"
#include "update.hpp"
#include "search.hpp"
#include "info.hpp"
#include "list.hpp"
#include "utils.hpp"

using namespace KoStore;

namespace {

    volatile std::sig_atomic_t interrupted = 0;

    void onInterrupt(int)
    {
        interrupted = 1;
    }

    /**
     * @brief Everything a command needs, built once from the configuration.
     */
    struct Context
    {
        explicit Context(const Config& config)
            : config(config),
              cache(config.cacheDir),
              repository(http, cache, repositoryOptions(config)),
              worker(repository, http, installOptions(config))
        {
        }

        static RepositoryOptions repositoryOptions(const Config& config)
        {
            RepositoryOptions options;
            options.apiBaseUrl            = config.apiBaseUrl;
            options.token                 = config.githubToken;
            options.pluginTopic           = config.pluginTopic;
            options.patchTopic            = config.patchTopic;
            options.ttl                   = config.cacheTtl();
            options.connectTimeoutSeconds = config.connectTimeoutSeconds;
            options.requestTimeoutSeconds = config.requestTimeoutSeconds;
            return options;
        }

        static InstallOptions installOptions(const Config& config)
        {
            InstallOptions options;
            options.downloadAttempts       = config.downloadAttempts;
            options.backoffMs              = config.backoffMs;
            options.connectTimeoutSeconds  = config.connectTimeoutSeconds;
            options.downloadTimeoutSeconds = config.downloadTimeoutSeconds;
            return options;
        }

        Config config;
        CurlHttpClient http;
        MetadataCache cache;
        RepositoryClient repository;
        DeviceLocator locator;
        InstallWorker worker;
    };

    void printHelp()
    {
        std::cout << "KOStore\n"
                  << "Usage: kostore [--config PATH] [--verbose] command\n\n"
                  << "KOStore installs KOReader plugins and user patches published on GitHub\n"
                  << "onto a connected e-reader or a local KOReader installation.\n\n"
                  << "Commands:\n"
                  << "  list plugins|patches [--refresh]            List available packages\n"
                  << "  search <query> [--sort stars|updated|name]\n"
                  << "         [--category top-rated|recent]\n"
                  << "         [--kind plugins|patches]             Search packages\n"
                  << "  info <id>                                   Show package details\n"
                  << "  install <id> [--device PATH]                Install a package\n"
                  << "          [--patch FILE]...                   Only these files of a patch package\n"
                  << "  remove <id> [--device PATH]                 Remove a package\n"
                  << "  installed [--device PATH]                   List installed packages\n"
                  << "  update [--check] [--device PATH]            Update installed packages\n"
                  << "  device detect | device validate <path>      Find KOReader devices\n"
                  << "  cache info | cache clear                    Cache maintenance\n"
                  << "  favorite add|remove <id> | favorite list    Manage favorites\n"
                  << "  config show | config set-token <token>      Configuration\n";
    }

    /**
     * @brief Removes "--name value" from args.
     *
     * @throws ConfigError if the flag has no value.
     */
    std::optional<std::string> takeOption(std::vector<std::string>& args, const std::string& name)
    {
        for (auto it = args.begin(); it != args.end(); ++it) {
            if (*it == name) {
                if (it + 1 == args.end()) {
                    throw ConfigError(name + " requires an argument");
                }
                std::string value = *(it + 1);
                args.erase(it, it + 2);
                return value;
            }
        }
        return std::nullopt;
    }

    bool takeFlag(std::vector<std::string>& args, const std::string& name)
    {
        for (auto it = args.begin(); it != args.end(); ++it) {
            if (*it == name) {
                args.erase(it);
                return true;
            }
        }
        return false;
    }

    void reportStale(const std::optional<StaleDataWarning>& warning)
    {
        if (warning) {
            std::cout << "Note: offline, showing cached data from "
                      << formatTimestamp(warning->fetchedAt) << "\n";
        }
    }

    /**
     * @brief --device, then the configured device_path, then the single
     *        detected device.
     *
     * @return std::nullopt (after telling the user why) if no unique device.
     */
    std::optional<DevicePath> resolveDevice(Context& ctx, const std::optional<std::string>& flag,
                                            bool required)
    {
        if (flag) {
            return ctx.locator.validate(*flag);
        }
        if (ctx.config.devicePath) {
            return ctx.locator.validate(*ctx.config.devicePath);
        }

        auto devices = ctx.locator.detect();
        if (devices.size() == 1) {
            log_debug("Using detected device " + devices.front().rootPath.string());
            return devices.front();
        }
        if (required) {
            if (devices.empty()) {
                std::cerr << "Error: No KOReader device found. Connect one or pass --device PATH.\n";
            } else {
                std::cerr << "Error: Several KOReader devices found; pass --device with one of:\n";
                for (const auto& device : devices) {
                    std::cerr << "  " << device.rootPath.string() << "\n";
                }
            }
        }
        return std::nullopt;
    }

    std::vector<PackageMetadata> listBoth(Context& ctx)
    {
        std::vector<PackageMetadata> all;
        for (PackageKind kind : {PackageKind::Plugin, PackageKind::Patch}) {
            auto result = ctx.repository.listPackages(kind);
            reportStale(result.staleWarning);
            all.insert(all.end(), result.value.begin(), result.value.end());
        }
        return all;
    }

    /**
     * @brief Runs one install to completion with a progress bar on stdout.
     *        Ctrl-C cancels the job.
     */
    bool runInstall(InstallHandle handle)
    {
        handle.subscribe([](const JobEvent& event) {
            if (event.status == JobStatus::Downloading) {
                std::cout << "\r" << event.packageId << ": downloading "
                          << formatSize(event.progressBytes);
                if (event.totalBytes && *event.totalBytes > 0) {
                    const int percent = static_cast<int>(std::min<std::uint64_t>(
                        100, event.progressBytes * 100 / *event.totalBytes));
                    const int filled  = percent / 5;
                    std::cout << " [" << std::string(filled, '#') << std::string(20 - filled, ' ')
                              << "] " << percent << "%";
                }
                std::cout << std::flush;
            } else if (event.status != JobStatus::Queued) {
                std::cout << "\r" << event.packageId << ": " << toString(event.status);
                if (!event.message.empty() && isTerminal(event.status)) {
                    std::cout << " - " << event.message;
                }
                std::cout << "\n" << std::flush;
            }
        });

        while (!isTerminal(handle.snapshot().status)) {
            if (interrupted) {
                handle.cancel();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        return handle.wait().status == JobStatus::Completed;
    }

    // -------------------------------------------------------------
    // Commands
    // -------------------------------------------------------------

    int cmdList(Context& ctx, std::vector<std::string> args)
    {
        const bool refresh = takeFlag(args, "--refresh");
        PackageKind kind = PackageKind::Plugin;
        if (args.empty() || !parseKind(args.front(), kind)) {
            std::cerr << "Usage: kostore list plugins|patches [--refresh]\n";
            return 1;
        }

        auto result = refresh ? ctx.repository.refresh(kind) : ctx.repository.listPackages(kind);
        reportStale(result.staleWarning);

        std::vector<InstalledRecord> records;
        if (auto device = resolveDevice(ctx, std::nullopt, false)) {
            records = ctx.worker.installed(*device);
        }
        List::showPackages(std::cout, result.value, records, ctx.cache.favorites());
        return 0;
    }

    int cmdSearch(Context& ctx, std::vector<std::string> args)
    {
        SearchQuery query;
        if (auto sort = takeOption(args, "--sort")) {
            if (!parseSortOrder(*sort, query.sort)) {
                std::cerr << "Error: unknown sort order '" << *sort << "'\n";
                return 1;
            }
        }
        if (auto category = takeOption(args, "--category")) {
            if (!parseCategory(*category, query.category)) {
                std::cerr << "Error: unknown category '" << *category << "'\n";
                return 1;
            }
        }
        std::optional<PackageKind> kind;
        if (auto kindText = takeOption(args, "--kind")) {
            PackageKind parsed;
            if (!parseKind(*kindText, parsed)) {
                std::cerr << "Error: unknown kind '" << *kindText << "'\n";
                return 1;
            }
            kind = parsed;
        }
        if (takeFlag(args, "--favorites")) {
            query.status = StatusFilter::Favorites;
        } else if (takeFlag(args, "--installed")) {
            query.status = StatusFilter::Installed;
        } else if (takeFlag(args, "--not-installed")) {
            query.status = StatusFilter::NotInstalled;
        }
        if (args.empty()) {
            std::cerr << "Usage: kostore search <query> [--sort stars|updated|name] "
                         "[--category top-rated|recent] [--kind plugins|patches] "
                         "[--installed|--not-installed|--favorites]\n";
            return 1;
        }
        query.text = args.front();

        std::vector<PackageMetadata> packages;
        if (kind) {
            auto result = ctx.repository.listPackages(*kind);
            reportStale(result.staleWarning);
            packages = result.value;
        } else {
            packages = listBoth(ctx);
        }

        std::vector<InstalledRecord> records;
        if (auto device = resolveDevice(ctx, std::nullopt, query.status == StatusFilter::Installed ||
                                                           query.status == StatusFilter::NotInstalled)) {
            records = ctx.worker.installed(*device);
        } else if (query.status == StatusFilter::Installed || query.status == StatusFilter::NotInstalled) {
            return 1;
        }
        for (const auto& record : records) {
            query.installedIds.insert(record.packageId);
        }
        query.favoriteIds = ctx.cache.favorites();

        List::showPackages(std::cout, filterPackages(packages, query), records, query.favoriteIds);
        return 0;
    }

    int cmdInfo(Context& ctx, std::vector<std::string> args)
    {
        auto deviceFlag = takeOption(args, "--device");
        if (args.empty()) {
            std::cerr << "Usage: kostore info <id>\n";
            return 1;
        }
        const std::string id = args.front();

        auto result = ctx.repository.getReleaseAsset(id);
        reportStale(result.staleWarning);

        std::optional<InstalledRecord> record;
        if (auto device = resolveDevice(ctx, deviceFlag, false)) {
            record = ctx.worker.findInstalled(id, *device);
        }
        PackageInfo(result.value, record, ctx.cache.isFavorite(id)).display(std::cout);
        return 0;
    }

    int cmdInstall(Context& ctx, std::vector<std::string> args)
    {
        auto deviceFlag = takeOption(args, "--device");
        std::set<std::string> patchFiles;
        while (auto file = takeOption(args, "--patch")) {
            patchFiles.insert(*file);
        }
        if (args.empty()) {
            std::cerr << "Usage: kostore install <id> [--device PATH] [--patch FILE]...\n";
            return 1;
        }
        auto device = resolveDevice(ctx, deviceFlag, true);
        if (!device) {
            return 1;
        }

        bool ok = true;
        for (const auto& id : args) {
            ok = runInstall(ctx.worker.submit(id, *device, patchFiles)) && ok;
            if (interrupted) {
                break;
            }
        }
        return ok ? 0 : 1;
    }

    int cmdRemove(Context& ctx, std::vector<std::string> args)
    {
        auto deviceFlag = takeOption(args, "--device");
        if (args.empty()) {
            std::cerr << "Usage: kostore remove <id> [--device PATH]\n";
            return 1;
        }
        auto device = resolveDevice(ctx, deviceFlag, true);
        if (!device) {
            return 1;
        }
        for (const auto& id : args) {
            if (!ctx.worker.uninstall(id, *device)) {
                std::cout << id << " is not installed.\n";
            }
        }
        return 0;
    }

    int cmdInstalled(Context& ctx, std::vector<std::string> args)
    {
        auto device = resolveDevice(ctx, takeOption(args, "--device"), true);
        if (!device) {
            return 1;
        }
        const std::string firmware = DeviceLocator::readFirmwareVersion(*device);
        std::cout << "Device: " << device->rootPath.string()
                  << (firmware.empty() ? "" : " (KOReader " + firmware + ")") << "\n";
        List::showInstalledPackages(std::cout, ctx.worker.installed(*device));
        return 0;
    }

    int cmdUpdate(Context& ctx, std::vector<std::string> args)
    {
        const bool checkOnly = takeFlag(args, "--check");
        auto device = resolveDevice(ctx, takeOption(args, "--device"), true);
        if (!device) {
            return 1;
        }

        auto updates = UpdateChecker::checkForUpdates(ctx.worker.installed(*device), listBoth(ctx));
        if (updates.empty()) {
            std::cout << "Everything is up to date.\n";
            return 0;
        }
        for (const auto& update : updates) {
            std::cout << "  " << update.packageId << ": " << update.installedVersion
                      << " -> " << update.latestVersion << "\n";
        }
        if (checkOnly) {
            return 0;
        }

        // Different packages install in parallel, one job per id
        std::vector<InstallHandle> handles;
        for (const auto& update : updates) {
            handles.push_back(ctx.worker.submit(update.packageId, *device));
        }
        bool ok = true;
        for (auto& handle : handles) {
            ok = runInstall(handle) && ok;
        }
        return ok ? 0 : 1;
    }

    int cmdDevice(Context& ctx, std::vector<std::string> args)
    {
        if (!args.empty() && args.front() == "detect") {
            auto devices = ctx.locator.detect();
            if (devices.empty()) {
                std::cout << "No KOReader device detected.\n";
                return 0;
            }
            for (const auto& device : devices) {
                const std::string firmware = DeviceLocator::readFirmwareVersion(device);
                std::cout << device.rootPath.string()
                          << (firmware.empty() ? "" : "  (KOReader " + firmware + ")") << "\n";
            }
            return 0;
        }
        if (args.size() >= 2 && args.front() == "validate") {
            DevicePath device = ctx.locator.validate(args[1]);
            std::cout << "Valid KOReader root: " << device.rootPath.string() << "\n"
                      << "  plugins: " << device.pluginsDir.string() << "\n"
                      << "  patches: " << device.patchesDir.string() << "\n";
            return 0;
        }
        std::cerr << "Usage: kostore device detect | kostore device validate <path>\n";
        return 1;
    }

    int cmdCache(Context& ctx, std::vector<std::string> args)
    {
        if (!args.empty() && args.front() == "clear") {
            ctx.repository.clearCache();
            return 0;
        }
        if (!args.empty() && args.front() == "info") {
            auto entries = ctx.cache.info();
            std::cout << "Cache directory: " << ctx.cache.directory().string() << "\n";
            if (entries.empty()) {
                std::cout << "Cache is empty.\n";
            }
            for (const auto& entry : entries) {
                std::cout << "  " << entry.key << ": " << entry.itemCount << " item(s), "
                          << entry.ageDays << " day(s) old, "
                          << (entry.fresh ? "fresh" : "expired") << "\n";
            }
            return 0;
        }
        std::cerr << "Usage: kostore cache info | kostore cache clear\n";
        return 1;
    }

    int cmdFavorite(Context& ctx, std::vector<std::string> args)
    {
        if (args.size() >= 2 && args.front() == "add") {
            ctx.cache.addFavorite(args[1]);
            return 0;
        }
        if (args.size() >= 2 && args.front() == "remove") {
            ctx.cache.removeFavorite(args[1]);
            return 0;
        }
        if (!args.empty() && args.front() == "list") {
            auto favorites = ctx.cache.favorites();
            if (favorites.empty()) {
                std::cout << "No favorites.\n";
            }
            for (const auto& id : favorites) {
                std::cout << id << "\n";
            }
            return 0;
        }
        std::cerr << "Usage: kostore favorite add|remove <id> | kostore favorite list\n";
        return 1;
    }

    int cmdConfig(Config& config, const fs::path& configPath, std::vector<std::string> args)
    {
        if (!args.empty() && args.front() == "show") {
            std::cout << "Config file: " << configPath.string() << "\n";
            config.print();
            return 0;
        }
        if (args.size() >= 2 && args.front() == "set-token") {
            if (!config.setToken(args[1])) {
                std::cerr << "Error: not a GitHub token (expected ghp_... or github_pat_...)\n";
                return 1;
            }
            config.saveToFile(configPath);
            std::cout << "Token saved to " << configPath.string() << "\n";
            return 0;
        }
        std::cerr << "Usage: kostore config show | kostore config set-token <token>\n";
        return 1;
    }

} // namespace

int main(int argc, char* argv[])
{
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        fs::path configPath = Config::defaultPath();
        if (auto path = takeOption(args, "--config")) {
            configPath = *path;
        }
        const bool verbose = takeFlag(args, "--verbose") || takeFlag(args, "-v");

        // If no command is supplied, show the help message
        if (args.empty() || args.front() == "help" || args.front() == "--help") {
            printHelp();
            return 0;
        }

        Config config = Config::loadFromFile(configPath);
        setVerbose(verbose || config.verbose);

        const std::string command = args.front();
        args.erase(args.begin());

        if (command == "config") {
            return cmdConfig(config, configPath, args);
        }

        std::signal(SIGINT, onInterrupt);
        Context ctx(config);

        if (command == "list")      return cmdList(ctx, args);
        if (command == "search")    return cmdSearch(ctx, args);
        if (command == "info")      return cmdInfo(ctx, args);
        if (command == "install")   return cmdInstall(ctx, args);
        if (command == "remove")    return cmdRemove(ctx, args);
        if (command == "installed") return cmdInstalled(ctx, args);
        if (command == "update")    return cmdUpdate(ctx, args);
        if (command == "device")    return cmdDevice(ctx, args);
        if (command == "cache")     return cmdCache(ctx, args);
        if (command == "favorite")  return cmdFavorite(ctx, args);

        std::cerr << "Unknown command: " << command << "\n";
        printHelp();
        return 1;
    } catch (const InvalidDeviceError& e) {
        log_error(std::string(e.what()) + " (" + toString(e.getReason()) + ")");
    } catch (const Error& e) {
        log_error(e.what());
    } catch (const std::exception& e) {
        log_error(std::string("Unexpected error: ") + e.what());
    }
    return 1;
}
