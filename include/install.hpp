#ifndef KOSTORE_INSTALL_HPP
#define KOSTORE_INSTALL_HPP

#include "package.hpp"
#include "records.hpp"
#include "http.hpp"

#include <string>
#include <vector>
#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <thread>
#include <optional>
#include <functional>
#include <cstdint>

namespace KoStore {

class RepositoryClient;

/**
 * @brief Lifecycle of an install job. Completed, Failed and Canceled are
 *        terminal.
 */
enum class JobStatus { Queued, Downloading, Verifying, Extracting, Completed, Failed, Canceled };

/**
 * @brief Why a job ended in Failed or Canceled.
 */
enum class JobError { None, FetchError, IntegrityError, CancellationError, IOError };

const char* toString(JobStatus status);
const char* toString(JobError error);
bool isTerminal(JobStatus status);

/**
 * @struct InstallJob
 * @brief Point-in-time view of one install.
 */
struct InstallJob
{
    std::string packageId;
    fs::path targetPath;   ///< known once the release has been resolved
    std::uint64_t progressBytes = 0;
    std::optional<std::uint64_t> totalBytes;
    JobStatus status = JobStatus::Queued;
    JobError error   = JobError::None;
    std::string message;
};

/**
 * @struct JobEvent
 * @brief One element of a job's progress/status stream.
 */
struct JobEvent
{
    std::string packageId;
    JobStatus status = JobStatus::Queued;
    std::uint64_t progressBytes = 0;
    std::optional<std::uint64_t> totalBytes;
    JobError error = JobError::None;
    std::string message;
};

using JobListener = std::function<void(const JobEvent&)>;

/**
 * @struct InstallOptions
 * @brief Retry and timeout policy of the InstallWorker.
 */
struct InstallOptions
{
    int downloadAttempts = 3;
    long backoffMs = 500;
    long maxBackoffMs = 30000;
    long connectTimeoutSeconds = 15;
    long downloadTimeoutSeconds = 300;
    fs::path tempDir;   ///< empty means the system temp directory
};

namespace detail {
    struct JobState;
}

/**
 * @class InstallHandle
 * @brief Caller's grip on a submitted job: observe it, wait for it or
 *        cancel it. Copies refer to the same job.
 */
class InstallHandle
{
public:
    /**
     * @brief Requests cooperative cancellation. No-op once terminal.
     */
    void cancel();

    /**
     * @brief Replays every event emitted so far to listener, then delivers
     *        new ones as they happen (on the job thread).
     *
     * Listeners must not call subscribe() themselves.
     */
    void subscribe(JobListener listener);

    InstallJob snapshot() const;

    /**
     * @brief Blocks until the job is terminal and returns its final state.
     */
    InstallJob wait() const;

    const std::string& packageId() const;

private:
    friend class InstallWorker;
    explicit InstallHandle(std::shared_ptr<detail::JobState> state);

    std::shared_ptr<detail::JobState> state;
};

/**
 * @class InstallWorker
 * @brief Runs download, verify, extract and record steps for each package
 *        on its own thread.
 *
 * At most one install or uninstall per package id is active at a time;
 * distinct ids proceed in parallel. Nothing becomes visible in the device
 * directories until the final rename, and the InstalledRecord is written
 * only after it. A path owned by one package is never replaced by another.
 *
 * Listeners may call submit() and waitAll().
 */
class InstallWorker
{
public:
    InstallWorker(RepositoryClient& repository, HttpClient& http, InstallOptions options = {});

    /**
     * @brief Cancels and joins every outstanding job.
     */
    ~InstallWorker();

    InstallWorker(const InstallWorker&) = delete;
    InstallWorker& operator=(const InstallWorker&) = delete;

    /**
     * @brief Starts installing the latest release of packageId. The release
     *        is resolved on the job thread.
     *
     * @param patchFiles For a patch package, the file names to install out
     *                   of its .lua files. Empty installs all of them.
     *
     * @throws JobConflictError if a job for packageId is already active.
     * @throws InvalidDeviceError(WrongLayout) if device was not validated.
     */
    InstallHandle submit(const std::string& packageId, const DevicePath& device,
                         const std::set<std::string>& patchFiles = {});

    /**
     * @brief Starts installing an already resolved release.
     *
     * @throws JobConflictError if a job for package.id is already active.
     * @throws InvalidDeviceError(WrongLayout) if device was not validated.
     */
    InstallHandle submit(const PackageMetadata& package, const DevicePath& device,
                         const std::set<std::string>& patchFiles = {});

    /**
     * @brief Removes every file of the install and its record. Calling it
     *        for a package that is not installed does nothing.
     *
     * @return False if nothing was installed.
     * @throws JobConflictError if a job for packageId is active.
     * @throws IOError if a file could not be removed.
     */
    bool uninstall(const std::string& packageId, const DevicePath& device);

    std::vector<InstalledRecord> installed(const DevicePath& device);
    std::optional<InstalledRecord> findInstalled(const std::string& packageId,
                                                 const DevicePath& device);

    /**
     * @brief Blocks until every submitted job has finished. From a job
     *        listener, it does not wait for the calling job itself.
     */
    void waitAll();

private:
    using Resolver = std::function<PackageMetadata()>;

    InstallHandle start(const std::string& packageId, const DevicePath& device, Resolver resolve,
                        std::set<std::string> patchFiles);
    void run(std::shared_ptr<detail::JobState> state, DevicePath device, Resolver resolve,
             std::set<std::string> patchFiles);

    fs::path download(detail::JobState& state, const PackageMetadata& package);
    void verify(detail::JobState& state, const PackageMetadata& package, const fs::path& file);
    InstalledRecord extract(detail::JobState& state, const PackageMetadata& package,
                            const DevicePath& device, const fs::path& file,
                            const std::set<std::string>& patchFiles);
    InstalledRecord installPlugin(detail::JobState& state, const PackageMetadata& package,
                                  const DevicePath& device, const fs::path& file, bool isArchive);
    InstalledRecord installPatch(detail::JobState& state, const PackageMetadata& package,
                                 const DevicePath& device, const fs::path& file, bool isArchive,
                                 const std::set<std::string>& patchFiles);

    void acquire(const std::string& packageId);
    void release(const std::string& packageId);

    /**
     * @brief Reserves install targets for packageId until releaseClaims().
     *
     * @throws IOError if another package's record or running job owns one
     *         of the targets.
     */
    void claim(const std::string& packageId, const std::vector<fs::path>& targets,
               const DevicePath& device);
    void releaseClaims(const std::string& packageId);
    std::shared_ptr<InstalledRecordStore> storeFor(const DevicePath& device);

    RepositoryClient& repository;
    HttpClient& http;
    InstallOptions options;

    std::mutex activeMutex;
    std::set<std::string> active;

    std::mutex storesMutex;
    std::map<fs::path, std::shared_ptr<InstalledRecordStore>> stores;

    std::mutex claimsMutex;
    std::map<fs::path, std::string> claims;   // target path -> package id

    std::mutex jobsMutex;
    std::vector<std::pair<std::thread, std::shared_ptr<detail::JobState>>> jobs;
};

} // namespace KoStore

#endif // KOSTORE_INSTALL_HPP
