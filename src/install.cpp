//============================================================================
// Includes
//============================================================================

#include "install.hpp"         // InstallWorker, InstallHandle, job types
#include "repository.hpp"      // Release resolution on the job thread
#include "errors.hpp"          // Typed errors mapped to JobError
#include "utils.hpp"           // Logging, temp paths, isWithin

#include <atomic>              // Cancellation flag
#include <condition_variable>  // wait() and interruptible backoff
#include <algorithm>           // std::min, std::find
#include <cstdio>              // popen, pclose, fgets, FILE*
#include <sys/wait.h>          // WIFEXITED, WEXITSTATUS (for popen)
#include <archive.h>           // Libarchive main API
#include <archive_entry.h>     // Libarchive entry handling

namespace KoStore {

// ============================================================================
// Job state shared between the worker thread and handles
// ============================================================================
namespace detail {

    struct JobState
    {
        std::mutex mutex;
        std::condition_variable changed;
        InstallJob job;
        std::vector<JobEvent> events;
        std::vector<JobListener> listeners;
        std::atomic<bool> canceled{false};
        bool threadDone = false;   // run() has delivered its last event

        // Serializes listener delivery so subscribe() neither misses nor
        // duplicates an event
        std::mutex deliveryMutex;

        static JobEvent toEvent(const InstallJob& job)
        {
            JobEvent event;
            event.packageId     = job.packageId;
            event.status        = job.status;
            event.progressBytes = job.progressBytes;
            event.totalBytes    = job.totalBytes;
            event.error         = job.error;
            event.message       = job.message;
            return event;
        }

        /**
         * @brief Applies update to the job and delivers the resulting event.
         *
         * Progress events of the same status replace each other in the
         * history, so a late subscriber replays one per state.
         */
        void publish(const std::function<void(InstallJob&)>& update, bool coalesce = false)
        {
            std::lock_guard<std::mutex> delivery(deliveryMutex);
            JobEvent event;
            std::vector<JobListener> targets;
            {
                std::lock_guard<std::mutex> lock(mutex);
                update(job);
                event = toEvent(job);
                if (coalesce && !events.empty() && events.back().status == event.status) {
                    events.back() = event;
                } else {
                    events.push_back(event);
                }
                targets = listeners;
            }
            changed.notify_all();

            for (const auto& listener : targets) {
                try {
                    listener(event);
                } catch (const std::exception& e) {
                    log_warning("Job listener for " + event.packageId + " threw: " + e.what());
                }
            }
        }

        void setStatus(JobStatus status, const std::string& message = {})
        {
            log_debug(job.packageId + ": " + toString(status));
            publish([&](InstallJob& j) {
                j.status  = status;
                j.message = message;
            });
        }

        void throwIfCanceled() const
        {
            if (canceled.load()) {
                throw CancellationError();
            }
        }

        /**
         * @brief Sleeps for delay unless cancel() is called first.
         *
         * @return True if the job was canceled.
         */
        bool sleepUnlessCanceled(std::chrono::milliseconds delay)
        {
            std::unique_lock<std::mutex> lock(mutex);
            return changed.wait_for(lock, delay, [this] { return canceled.load(); });
        }
    };

} // namespace detail

using detail::JobState;

const char* toString(JobStatus status)
{
    switch (status) {
    case JobStatus::Queued:      return "Queued";
    case JobStatus::Downloading: return "Downloading";
    case JobStatus::Verifying:   return "Verifying";
    case JobStatus::Extracting:  return "Extracting";
    case JobStatus::Completed:   return "Completed";
    case JobStatus::Failed:      return "Failed";
    case JobStatus::Canceled:    return "Canceled";
    }
    return "Unknown";
}

const char* toString(JobError error)
{
    switch (error) {
    case JobError::None:              return "None";
    case JobError::FetchError:        return "FetchError";
    case JobError::IntegrityError:    return "IntegrityError";
    case JobError::CancellationError: return "CancellationError";
    case JobError::IOError:           return "IOError";
    }
    return "Unknown";
}

bool isTerminal(JobStatus status)
{
    return status == JobStatus::Completed || status == JobStatus::Failed ||
           status == JobStatus::Canceled;
}

    /**
     * =======================================================================
     * Anonymous Namespace for Internal Helpers
     * =======================================================================
     */
    namespace {

        const char* const stagingPrefix = ".kostore-staging";

        /**
         * -------------------------------------------------------------------
         * StagingDirectory
         *
         * Owns a hidden working directory next to the install target and
         * removes whatever is left of it on scope exit.
         * -------------------------------------------------------------------
         */
        class StagingDirectory {
        public:
            explicit StagingDirectory(const fs::path& parent)
                : path(generateTempPath(stagingPrefix, parent)) {
                std::error_code ec;
                fs::create_directories(path, ec);
                if (ec) {
                    throw IOError("Could not create staging directory " + path.string() +
                                  ": " + ec.message());
                }
            }

            ~StagingDirectory() {
                std::error_code ec;
                fs::remove_all(path, ec);
                if (ec) {
                    log_warning("Could not remove staging directory " + path.string() +
                                ": " + ec.message());
                }
            }

            StagingDirectory(const StagingDirectory&) = delete;
            StagingDirectory& operator=(const StagingDirectory&) = delete;

            const fs::path path;
        };

        bool endsWith(const std::string& value, const std::string& suffix) {
            return value.size() >= suffix.size() &&
                   value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        /**
         * -------------------------------------------------------------------
         * checkEntryPath
         *
         * Rejects archive entries that would land outside the staging root:
         * absolute paths, drive letters and ".." components.
         * -------------------------------------------------------------------
         */
        fs::path checkEntryPath(const std::string& entryPath) {
            fs::path relative(entryPath);
            if (entryPath.front() == '/' || entryPath.front() == '\\' ||
                relative.is_absolute() || relative.has_root_name()) {
                throw IOError("Archive entry has an absolute path: " + entryPath);
            }
            for (const auto& part : relative) {
                if (part == "..") {
                    throw IOError("Archive entry escapes the staging directory: " + entryPath);
                }
            }
            return relative.lexically_normal();
        }

        /**
         * -------------------------------------------------------------------
         * copy_data
         *
         * Copies data blocks from the archive being read to the one being
         * written to disk.
         * -------------------------------------------------------------------
         */
        int copy_data(struct archive* ar, struct archive* aw) {
            const void* buff;
            size_t size;
            la_int64_t offset;
            int r;

            while (true) {
                r = archive_read_data_block(ar, &buff, &size, &offset);
                if (r == ARCHIVE_EOF) {
                    return ARCHIVE_OK;
                }
                if (r == ARCHIVE_RETRY) {
                    continue;
                }
                if (r != ARCHIVE_OK) {
                    return r;
                }
                if (archive_write_data_block(aw, buff, size, offset) < ARCHIVE_OK) {
                    return ARCHIVE_FATAL;
                }
            }
        }

        using ArchivePtr = std::unique_ptr<struct archive, int (*)(struct archive*)>;

        ArchivePtr openArchive(const fs::path& archivePath) {
            ArchivePtr reader(archive_read_new(), archive_read_free);
            if (!reader) {
                throw IOError("archive_read_new failed");
            }
            archive_read_support_filter_all(reader.get());
            archive_read_support_format_all(reader.get());
            if (archive_read_open_filename(reader.get(), archivePath.c_str(), 32768) != ARCHIVE_OK) {
                throw IOError("Error opening archive '" + archivePath.string() + "': " +
                              archive_error_string(reader.get()));
            }
            return reader;
        }

        /**
         * -------------------------------------------------------------------
         * looksLikeArchive
         *
         * True if libarchive recognizes the file's content as an archive.
         * A .lua file or any other single-file asset returns false.
         * -------------------------------------------------------------------
         */
        bool looksLikeArchive(const fs::path& file) {
            ArchivePtr reader(archive_read_new(), archive_read_free);
            if (!reader) {
                return false;
            }
            archive_read_support_filter_all(reader.get());
            archive_read_support_format_all(reader.get());
            if (archive_read_open_filename(reader.get(), file.c_str(), 32768) != ARCHIVE_OK) {
                return false;
            }
            struct archive_entry* entry;
            int r = archive_read_next_header(reader.get(), &entry);
            return r == ARCHIVE_OK || r == ARCHIVE_WARN;
        }

        /**
         * -------------------------------------------------------------------
         * extractArchive
         *
         * Extracts regular files and directories of archivePath under
         * destDir. Links and device nodes are skipped. Cancellation is
         * checked before and after every entry.
         * -------------------------------------------------------------------
         */
        void extractArchive(const fs::path& archivePath, const fs::path& destDir,
                            const JobState& state) {
            ArchivePtr reader = openArchive(archivePath);
            ArchivePtr writer(archive_write_disk_new(), archive_write_free);
            if (!writer) {
                throw IOError("archive_write_disk_new failed");
            }

            // Device filesystems are usually FAT: no owners, ACLs or links
            int extract_flags = ARCHIVE_EXTRACT_TIME |
                                ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                ARCHIVE_EXTRACT_SECURE_SYMLINKS |
                                ARCHIVE_EXTRACT_SECURE_NOABSOLUTEPATHS;
            archive_write_disk_set_options(writer.get(), extract_flags);

            struct archive_entry* entry;
            int r;
            std::size_t extracted = 0;

            while (true) {
                state.throwIfCanceled();
                r = archive_read_next_header(reader.get(), &entry);
                if (r == ARCHIVE_EOF) {
                    break;
                }
                if (r < ARCHIVE_WARN) {
                    throw IOError("Error reading archive header: " +
                                  std::string(archive_error_string(reader.get())));
                }

                const char* rawPath = archive_entry_pathname(entry);
                if (!rawPath || !*rawPath) {
                    archive_read_data_skip(reader.get());
                    continue;
                }
                const fs::path relative = checkEntryPath(rawPath);
                if (relative.empty() || relative == ".") {
                    archive_read_data_skip(reader.get());
                    continue;
                }

                const mode_t type = archive_entry_filetype(entry);
                if (type != AE_IFREG && type != AE_IFDIR) {
                    log_debug("Skipping non-regular archive entry " + std::string(rawPath));
                    archive_read_data_skip(reader.get());
                    continue;
                }

                const fs::path fullDestPath = destDir / relative;
                std::error_code ec;
                fs::create_directories(type == AE_IFDIR ? fullDestPath : fullDestPath.parent_path(), ec);
                if (ec) {
                    throw IOError("Failed to create directory for " + fullDestPath.string() +
                                  ": " + ec.message());
                }

                archive_entry_set_pathname(entry, fullDestPath.string().c_str());
                r = archive_write_header(writer.get(), entry);
                if (r < ARCHIVE_WARN) {
                    throw IOError("Failed to write " + fullDestPath.string() + ": " +
                                  archive_error_string(writer.get()));
                }

                if (type == AE_IFREG && archive_entry_size(entry) > 0) {
                    r = copy_data(reader.get(), writer.get());
                    if (r != ARCHIVE_OK) {
                        throw IOError("Error copying data for " + fullDestPath.string() + ": " +
                                      archive_error_string(writer.get()) + " (read error: " +
                                      archive_error_string(reader.get()) + ")");
                    }
                }

                r = archive_write_finish_entry(writer.get());
                if (r < ARCHIVE_WARN) {
                    throw IOError("Failed to finish " + fullDestPath.string() + ": " +
                                  archive_error_string(writer.get()));
                }
                ++extracted;
                state.throwIfCanceled();
            }

            if (extracted == 0) {
                throw IOError("Archive " + archivePath.filename().string() + " is empty");
            }
        }

        std::vector<fs::path> children(const fs::path& dir) {
            std::vector<fs::path> result;
            for (const auto& entry : fs::directory_iterator(dir)) {
                result.push_back(entry.path());
            }
            std::sort(result.begin(), result.end());
            return result;
        }

        /**
         * -------------------------------------------------------------------
         * findPluginRoot
         *
         * Unwraps a single top-level directory ("repo-main/"), then a single
         * nested "*.koplugin" directory when the content has no main.lua.
         * -------------------------------------------------------------------
         */
        fs::path findPluginRoot(const fs::path& staging) {
            fs::path root = staging;
            auto top = children(root);
            if (top.size() == 1 && fs::is_directory(top.front())) {
                root = top.front();
            }

            if (!fs::exists(root / "main.lua")) {
                std::vector<fs::path> nested;
                for (const auto& child : children(root)) {
                    if (fs::is_directory(child) && endsWith(child.filename().string(), ".koplugin")) {
                        nested.push_back(child);
                    }
                }
                if (nested.size() == 1) {
                    root = nested.front();
                }
            }
            return root;
        }

        std::string pluginDirName(const PackageMetadata& package, const fs::path& root,
                                  const fs::path& staging) {
            if (root != staging && endsWith(root.filename().string(), ".koplugin")) {
                return root.filename().string();
            }
            std::string name = package.repoName();
            if (!endsWith(name, ".koplugin")) {
                name += ".koplugin";
            }
            return name;
        }

        std::string shellQuote(const std::string& value) {
            std::string quoted = "'";
            for (char c : value) {
                if (c == '\'') {
                    quoted += "'\\''";
                } else {
                    quoted += c;
                }
            }
            return quoted + "'";
        }

        /**
         * -------------------------------------------------------------------
         * sha256Of
         *
         * Computes the hex SHA-256 digest of a file with sha256sum.
         * -------------------------------------------------------------------
         */
        std::string sha256Of(const fs::path& file) {
            const std::string command = "sha256sum " + shellQuote(file.string()) + " 2>/dev/null";
            FILE* pipe = popen(command.c_str(), "r");
            if (!pipe) {
                throw IOError("Error running sha256sum on " + file.string());
            }

            char buffer[256];
            std::string output;
            while (fgets(buffer, sizeof(buffer), pipe)) {
                output += buffer;
            }

            int status = pclose(pipe);
            int exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            std::string digest = output.substr(0, output.find_first_of(" \t\n"));
            if (exitCode != 0 || digest.size() != 64) {
                throw IOError("sha256sum failed for " + file.string() +
                              " (exit status: " + std::to_string(exitCode) + ")");
            }
            return toLower(digest);
        }

        std::chrono::milliseconds backoffDelay(const InstallOptions& options, int attempt) {
            long delay = options.backoffMs;
            for (int i = 1; i < attempt && delay < options.maxBackoffMs; ++i) {
                delay *= 2;
            }
            return std::chrono::milliseconds(std::min(delay, options.maxBackoffMs));
        }

        void moveInto(const fs::path& from, const fs::path& to) {
            std::error_code ec;
            fs::rename(from, to, ec);
            if (ec) {
                throw IOError("Failed to move " + from.string() + " to " + to.string() +
                              ": " + ec.message());
            }
        }

        void copySingleFile(const fs::path& from, const fs::path& to) {
            std::error_code ec;
            fs::create_directories(to.parent_path(), ec);
            if (!ec) {
                fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
            }
            if (ec) {
                throw IOError("Failed to copy " + from.string() + " to " + to.string() +
                              ": " + ec.message());
            }
        }

        /**
         * -------------------------------------------------------------------
         * restorePlaced
         *
         * Undoes a partial placement in reverse order: removes each placed
         * target and moves back the file it replaced, if any.
         * -------------------------------------------------------------------
         */
        void restorePlaced(const std::vector<std::pair<fs::path, fs::path>>& placed) {
            for (auto it = placed.rbegin(); it != placed.rend(); ++it) {
                std::error_code ec;
                fs::remove(it->first, ec);
                if (ec) {
                    log_warning("Could not remove " + it->first.string() + ": " + ec.message());
                }
                if (!it->second.empty()) {
                    std::error_code restoreEc;
                    fs::rename(it->second, it->first, restoreEc);
                    if (restoreEc) {
                        log_warning("Could not restore " + it->first.string() + ": " + restoreEc.message());
                    }
                }
            }
        }

        fs::path normalized(const fs::path& path) {
            return fs::absolute(path).lexically_normal();
        }

        /**
         * -------------------------------------------------------------------
         * ActiveJobGuard
         *
         * Releases a package id's slot when the owning scope ends.
         * -------------------------------------------------------------------
         */
        class ActiveJobGuard {
        public:
            explicit ActiveJobGuard(std::function<void()> onRelease)
                : onRelease(std::move(onRelease)) {}
            ~ActiveJobGuard() { onRelease(); }

            ActiveJobGuard(const ActiveJobGuard&) = delete;
            ActiveJobGuard& operator=(const ActiveJobGuard&) = delete;

        private:
            std::function<void()> onRelease;
        };

    } // anonymous namespace

// ============================================================================
// InstallHandle
// ============================================================================
InstallHandle::InstallHandle(std::shared_ptr<JobState> state)
    : state(std::move(state))
{
}

void InstallHandle::cancel()
{
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (isTerminal(state->job.status)) {
            return;
        }
        state->canceled.store(true);
    }
    state->changed.notify_all();
    log_debug("Cancellation requested for " + state->job.packageId);
}

void InstallHandle::subscribe(JobListener listener)
{
    std::lock_guard<std::mutex> delivery(state->deliveryMutex);
    std::vector<JobEvent> history;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        history = state->events;
        state->listeners.push_back(listener);
    }
    for (const auto& event : history) {
        listener(event);
    }
}

InstallJob InstallHandle::snapshot() const
{
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->job;
}

InstallJob InstallHandle::wait() const
{
    std::unique_lock<std::mutex> lock(state->mutex);
    state->changed.wait(lock, [this] { return isTerminal(state->job.status); });
    return state->job;
}

const std::string& InstallHandle::packageId() const
{
    return state->job.packageId;
}

// ============================================================================
// InstallWorker
// ============================================================================
InstallWorker::InstallWorker(RepositoryClient& repository, HttpClient& http, InstallOptions options)
    : repository(repository), http(http), options(std::move(options))
{
    if (this->options.downloadAttempts < 1) {
        this->options.downloadAttempts = 1;
    }
}

InstallWorker::~InstallWorker()
{
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(jobsMutex);
        for (auto& job : jobs) {
            InstallHandle(job.second).cancel();
            threads.push_back(std::move(job.first));
        }
        jobs.clear();
    }
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void InstallWorker::acquire(const std::string& packageId)
{
    std::lock_guard<std::mutex> lock(activeMutex);
    if (!active.insert(packageId).second) {
        throw JobConflictError(packageId);
    }
}

void InstallWorker::release(const std::string& packageId)
{
    std::lock_guard<std::mutex> lock(activeMutex);
    active.erase(packageId);
}

void InstallWorker::claim(const std::string& packageId, const std::vector<fs::path>& targets,
                          const DevicePath& device)
{
    std::lock_guard<std::mutex> lock(claimsMutex);
    const auto records = storeFor(device)->all();
    for (const auto& target : targets) {
        const fs::path path = normalized(target);

        auto claimed = claims.find(path);
        if (claimed != claims.end() && claimed->second != packageId) {
            throw IOError(path.string() + " is being installed by " + claimed->second);
        }
        for (const auto& record : records) {
            if (record.packageId == packageId) {
                continue;
            }
            for (const auto& file : record.files) {
                if (normalized(file) == path) {
                    throw IOError(path.string() + " belongs to " + record.packageId +
                                  "; remove it before installing " + packageId);
                }
            }
        }
    }
    for (const auto& target : targets) {
        claims[normalized(target)] = packageId;
    }
}

void InstallWorker::releaseClaims(const std::string& packageId)
{
    std::lock_guard<std::mutex> lock(claimsMutex);
    for (auto it = claims.begin(); it != claims.end();) {
        if (it->second == packageId) {
            it = claims.erase(it);
        } else {
            ++it;
        }
    }
}

std::shared_ptr<InstalledRecordStore> InstallWorker::storeFor(const DevicePath& device)
{
    const fs::path key = fs::absolute(device.rootPath).lexically_normal();
    std::lock_guard<std::mutex> lock(storesMutex);
    auto& slot = stores[key];
    if (!slot) {
        slot = std::make_shared<InstalledRecordStore>(key);
    }
    return slot;
}

InstallHandle InstallWorker::submit(const std::string& packageId, const DevicePath& device,
                                    const std::set<std::string>& patchFiles)
{
    return start(packageId, device, [this, packageId]() {
        auto result = repository.getReleaseAsset(packageId);
        if (result.staleWarning) {
            log_warning(result.staleWarning->describe());
        }
        return result.value;
    }, patchFiles);
}

InstallHandle InstallWorker::submit(const PackageMetadata& package, const DevicePath& device,
                                    const std::set<std::string>& patchFiles)
{
    return start(package.id, device, [package]() { return package; }, patchFiles);
}

InstallHandle InstallWorker::start(const std::string& packageId, const DevicePath& device,
                                   Resolver resolve, std::set<std::string> patchFiles)
{
    if (!device.isValid) {
        throw InvalidDeviceError(InvalidDeviceError::Reason::WrongLayout,
                                 "Device " + device.rootPath.string() + " has not been validated");
    }
    acquire(packageId);

    auto state = std::make_shared<JobState>();
    state->job.packageId = packageId;
    state->events.push_back(JobState::toEvent(state->job));

    std::vector<std::thread> finished;
    std::string startError;
    {
        std::lock_guard<std::mutex> lock(jobsMutex);

        // Take threads that have returned from run(). A terminal job whose
        // listeners are still running stays in the list
        for (auto it = jobs.begin(); it != jobs.end();) {
            bool done;
            {
                std::lock_guard<std::mutex> jobLock(it->second->mutex);
                done = it->second->threadDone;
            }
            if (done) {
                finished.push_back(std::move(it->first));
                it = jobs.erase(it);
            } else {
                ++it;
            }
        }

        try {
            std::thread worker(&InstallWorker::run, this, state, device, std::move(resolve),
                               std::move(patchFiles));
            jobs.emplace_back(std::move(worker), state);
        } catch (const std::system_error& e) {
            startError = e.what();
        }
    }

    // Joined outside jobsMutex so a listener's own submit() never waits on it
    for (auto& thread : finished) {
        thread.join();
    }
    if (!startError.empty()) {
        release(packageId);
        throw IOError("Could not start install job for " + packageId + ": " + startError);
    }

    log_debug("Queued install of " + packageId);
    return InstallHandle(state);
}

void InstallWorker::run(std::shared_ptr<JobState> statePtr, DevicePath device, Resolver resolve,
                        std::set<std::string> patchFiles)
{
    JobState& state = *statePtr;
    const std::string packageId = state.job.packageId;

    JobStatus outcome = JobStatus::Completed;
    JobError error    = JobError::None;
    std::string message;
    fs::path downloaded;

    try {
        state.throwIfCanceled();
        PackageMetadata package = resolve();
        state.publish([&](InstallJob& job) {
            job.targetPath = device.dirFor(package.kind);
            job.totalBytes = package.assetSize;
        }, true);
        log_message("Installing " + packageId +
                    (package.latestVersion.empty() ? std::string(" (default branch)")
                                                   : " " + package.latestVersion));

        downloaded = download(state, package);
        verify(state, package, downloaded);
        InstalledRecord record = extract(state, package, device, downloaded, patchFiles);

        storeFor(device)->save(record);
        state.publish([&](InstallJob& job) { job.targetPath = record.installPath; }, true);
        message = "Installed " + packageId + " to " + record.installPath.string();
    } catch (const CancellationError& e) {
        outcome = JobStatus::Canceled;
        error   = JobError::CancellationError;
        message = e.what();
    } catch (const IntegrityError& e) {
        outcome = JobStatus::Failed;
        error   = JobError::IntegrityError;
        message = e.what();
    } catch (const FetchError& e) {
        outcome = JobStatus::Failed;
        error   = JobError::FetchError;
        message = e.what();
    } catch (const NetworkError& e) {
        outcome = JobStatus::Failed;
        error   = JobError::FetchError;
        message = e.what();
    } catch (const std::exception& e) {
        // IOError, InvalidDeviceError and std::filesystem errors
        outcome = JobStatus::Failed;
        error   = JobError::IOError;
        message = e.what();
    }

    if (!downloaded.empty()) {
        std::error_code ec;
        fs::remove(downloaded, ec);
    }

    if (outcome == JobStatus::Completed) {
        log_message(message);
    } else if (outcome == JobStatus::Canceled) {
        log_warning("Install of " + packageId + " canceled");
    } else {
        log_error("Install of " + packageId + " failed: " + message);
    }

    // Free the id before observers learn the job is over
    releaseClaims(packageId);
    release(packageId);
    state.publish([&](InstallJob& job) {
        job.status  = outcome;
        job.error   = error;
        job.message = message;
    });

    std::lock_guard<std::mutex> lock(state.mutex);
    state.threadDone = true;
}

fs::path InstallWorker::download(JobState& state, const PackageMetadata& package)
{
    if (package.downloadUrl.empty()) {
        throw FetchError("No download URL for " + package.id);
    }
    state.setStatus(JobStatus::Downloading);

    HttpRequest request;
    request.url = package.downloadUrl;
    request.connectTimeoutSeconds = options.connectTimeoutSeconds;
    request.timeoutSeconds        = options.downloadTimeoutSeconds;

    const fs::path tempFile = generateTempPath("kostore_" + sanitizeKey(package.id), options.tempDir);
    const ProgressCallback progress = [&](std::uint64_t received, std::optional<std::uint64_t> total) {
        if (state.canceled.load()) {
            return false;
        }
        state.publish([&](InstallJob& job) {
            job.progressBytes = received;
            job.totalBytes    = total ? total : package.assetSize;
        }, true);
        return true;
    };

    for (int attempt = 1;; ++attempt) {
        state.throwIfCanceled();
        try {
            http.download(request, tempFile, progress);
            state.throwIfCanceled();
            return tempFile;
        } catch (const NetworkError& e) {
            std::error_code ec;
            fs::remove(tempFile, ec);
            if (!e.isTransient() || attempt >= options.downloadAttempts) {
                throw FetchError("Download of " + package.id + " failed after " +
                                 std::to_string(attempt) + " attempt(s): " + e.what());
            }

            const auto delay = backoffDelay(options, attempt);
            log_warning("Download attempt " + std::to_string(attempt) + "/" +
                        std::to_string(options.downloadAttempts) + " of " + package.id +
                        " failed (" + e.what() + "); retrying in " +
                        std::to_string(delay.count()) + " ms");
            if (state.sleepUnlessCanceled(delay)) {
                throw CancellationError();
            }
            state.publish([](InstallJob& job) { job.progressBytes = 0; }, true);
        } catch (const Error&) {
            std::error_code ec;
            fs::remove(tempFile, ec);
            throw;
        }
    }
}

void InstallWorker::verify(JobState& state, const PackageMetadata& package, const fs::path& file)
{
    state.setStatus(JobStatus::Verifying);
    state.throwIfCanceled();

    std::error_code ec;
    const std::uintmax_t size = fs::file_size(file, ec);
    if (ec) {
        throw IOError("Cannot stat downloaded file " + file.string() + ": " + ec.message());
    }
    if (package.assetSize && size != *package.assetSize) {
        throw IntegrityError("Size mismatch for " + package.id + ": expected " +
                             std::to_string(*package.assetSize) + " bytes, got " +
                             std::to_string(size));
    }

    if (package.checksum) {
        const std::string expected = toLower(package.checksum->substr(package.checksum->find(':') + 1));
        const std::string actual   = sha256Of(file);
        if (expected != actual) {
            throw IntegrityError("Checksum mismatch for " + package.id + ": expected sha256:" +
                                 expected + ", got sha256:" + actual);
        }
        log_debug("Checksum of " + package.id + " verified");
    }
}

InstalledRecord InstallWorker::extract(JobState& state, const PackageMetadata& package,
                                       const DevicePath& device, const fs::path& file,
                                       const std::set<std::string>& patchFiles)
{
    state.setStatus(JobStatus::Extracting);

    const bool isArchive = looksLikeArchive(file);
    log_debug(package.id + ": asset is " + (isArchive ? "an archive" : "a single file"));

    InstalledRecord record = package.kind == PackageKind::Plugin
        ? installPlugin(state, package, device, file, isArchive)
        : installPatch(state, package, device, file, isArchive, patchFiles);

    record.packageId        = package.id;
    record.installedVersion = package.latestVersion;
    record.installedAt      = Clock::now();
    record.kind             = package.kind;

    // A reinstall may have changed names; drop what the old install owned
    if (auto previous = storeFor(device)->find(package.id)) {
        const fs::path root = fs::absolute(device.rootPath);
        for (const auto& old : previous->files) {
            if (std::find(record.files.begin(), record.files.end(), old) != record.files.end()) {
                continue;
            }
            if (old == root || !isWithin(old, root)) {
                continue;
            }
            std::error_code ec;
            fs::remove_all(old, ec);
            if (ec) {
                log_warning("Could not remove stale file " + old.string() + ": " + ec.message());
            }
        }
    }
    return record;
}

InstalledRecord InstallWorker::installPlugin(JobState& state, const PackageMetadata& package,
                                             const DevicePath& device, const fs::path& file,
                                             bool isArchive)
{
    const fs::path pluginsDir = fs::absolute(device.pluginsDir);
    std::error_code ec;
    fs::create_directories(pluginsDir, ec);
    if (ec) {
        throw IOError("Could not create " + pluginsDir.string() + ": " + ec.message());
    }

    StagingDirectory staging(pluginsDir);
    fs::path contentRoot;
    if (isArchive) {
        extractArchive(file, staging.path, state);
        contentRoot = findPluginRoot(staging.path);
    } else {
        contentRoot = staging.path / "content";
        const std::string name = package.assetName.empty() ? "main.lua"
                                                           : fs::path(package.assetName).filename().string();
        copySingleFile(file, contentRoot / name);
    }

    const std::string dirName = pluginDirName(package, contentRoot, staging.path);
    const fs::path finalDir   = pluginsDir / dirName;
    state.throwIfCanceled();
    claim(package.id, {finalDir}, device);

    // Swap the staged tree in; the old install is kept until the rename succeeds
    fs::path backup;
    if (fs::exists(finalDir)) {
        backup = generateTempPath(".kostore-old-" + dirName, pluginsDir);
        moveInto(finalDir, backup);
    }
    fs::rename(contentRoot, finalDir, ec);
    if (ec) {
        if (!backup.empty()) {
            std::error_code restoreEc;
            fs::rename(backup, finalDir, restoreEc);
        }
        throw IOError("Failed to move plugin into " + finalDir.string() + ": " + ec.message());
    }
    if (!backup.empty()) {
        fs::remove_all(backup, ec);
        if (ec) {
            log_warning("Could not remove previous install " + backup.string() + ": " + ec.message());
        }
    }

    InstalledRecord record;
    record.installPath = finalDir;
    record.files       = {finalDir};
    return record;
}

InstalledRecord InstallWorker::installPatch(JobState& state, const PackageMetadata& package,
                                            const DevicePath& device, const fs::path& file,
                                            bool isArchive, const std::set<std::string>& patchFiles)
{
    const fs::path patchesDir = fs::absolute(device.patchesDir);
    std::error_code ec;
    fs::create_directories(patchesDir, ec);
    if (ec) {
        throw IOError("Could not create " + patchesDir.string() + ": " + ec.message());
    }

    StagingDirectory staging(patchesDir);
    std::vector<fs::path> staged;
    if (isArchive) {
        extractArchive(file, staging.path, state);
        std::set<std::string> names;
        for (const auto& entry : fs::recursive_directory_iterator(staging.path)) {
            if (!entry.is_regular_file() || toLower(entry.path().extension().string()) != ".lua") {
                continue;
            }
            if (!names.insert(entry.path().filename().string()).second) {
                log_warning("Ignoring duplicate patch " + entry.path().filename().string() +
                            " in " + package.assetName);
                continue;
            }
            staged.push_back(entry.path());
        }
        if (staged.empty()) {
            throw IOError("Archive of " + package.id + " contains no .lua patch");
        }
        std::sort(staged.begin(), staged.end());
    } else {
        std::string name = fs::path(package.assetName).filename().string();
        if (name.empty()) {
            name = package.repoName() + ".lua";
        }
        copySingleFile(file, staging.path / name);
        staged.push_back(staging.path / name);
    }

    if (!patchFiles.empty()) {
        std::vector<fs::path> selected;
        for (const auto& name : patchFiles) {
            auto match = std::find_if(staged.begin(), staged.end(), [&name](const fs::path& path) {
                return path.filename() == name;
            });
            if (match == staged.end()) {
                throw IOError("Patch " + name + " is not part of " + package.id);
            }
            selected.push_back(*match);
        }
        std::sort(selected.begin(), selected.end());
        staged = selected;
    }

    state.throwIfCanceled();

    std::vector<fs::path> targets;
    for (const auto& source : staged) {
        targets.push_back(patchesDir / source.filename());
    }
    claim(package.id, targets, device);

    // Files being replaced are parked in the staging directory until every
    // patch is in place, so a failure can put them back
    const fs::path replacedDir = staging.path / ".replaced";
    fs::create_directories(replacedDir, ec);
    if (ec) {
        throw IOError("Could not create " + replacedDir.string() + ": " + ec.message());
    }

    std::vector<std::pair<fs::path, fs::path>> placed;   // target, what it replaced
    try {
        for (std::size_t i = 0; i < staged.size(); ++i) {
            const fs::path& target = targets[i];
            if (fs::is_directory(target)) {
                throw IOError("Cannot replace directory " + target.string() + " with a patch");
            }
            fs::path replaced;
            if (fs::exists(target)) {
                replaced = replacedDir / target.filename();
                moveInto(target, replaced);
            }
            placed.emplace_back(target, replaced);
            moveInto(staged[i], target);
        }
    } catch (const std::exception&) {
        restorePlaced(placed);
        throw;
    }

    InstalledRecord record;
    record.files       = targets;
    record.installPath = record.files.size() == 1 ? record.files.front() : patchesDir;
    return record;
}

// ============================================================================
// Uninstall and queries
// ============================================================================
bool InstallWorker::uninstall(const std::string& packageId, const DevicePath& device)
{
    acquire(packageId);
    ActiveJobGuard guard([this, &packageId]() { release(packageId); });

    auto store  = storeFor(device);
    auto record = store->find(packageId);
    if (!record) {
        log_message(packageId + " is not installed on " + device.rootPath.string());
        return false;
    }

    const fs::path root = fs::absolute(device.rootPath).lexically_normal();
    for (const auto& file : record->files) {
        const fs::path target = fs::absolute(file).lexically_normal();
        if (target == root || target == fs::absolute(device.pluginsDir).lexically_normal() ||
            target == fs::absolute(device.patchesDir).lexically_normal() || !isWithin(target, root)) {
            log_warning("Refusing to delete " + target.string() + ": not a package path inside the device root");
            continue;
        }
        std::error_code ec;
        fs::remove_all(target, ec);
        if (ec) {
            throw IOError("Failed to remove " + target.string() + ": " + ec.message());
        }
        log_debug("Removed " + target.string());
    }

    store->remove(packageId);
    log_message("Removed " + packageId);
    return true;
}

std::vector<InstalledRecord> InstallWorker::installed(const DevicePath& device)
{
    return storeFor(device)->all();
}

std::optional<InstalledRecord> InstallWorker::findInstalled(const std::string& packageId,
                                                            const DevicePath& device)
{
    return storeFor(device)->find(packageId);
}

void InstallWorker::waitAll()
{
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(jobsMutex);
        for (auto it = jobs.begin(); it != jobs.end();) {
            // A listener cannot join its own job thread
            if (it->first.get_id() == std::this_thread::get_id()) {
                ++it;
                continue;
            }
            threads.push_back(std::move(it->first));
            it = jobs.erase(it);
        }
    }
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

} // namespace KoStore
