#ifndef KOSTORE_RECORDS_HPP
#define KOSTORE_RECORDS_HPP

#include "package.hpp"

#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace KoStore {

/**
 * @class InstalledRecordStore
 * @brief Persists InstalledRecords of one device, one YAML file per record
 *        under <device root>/.kostore/installed/.
 *
 * Each record is written atomically under its own lock, so writes for
 * different packages never wait on each other. Unreadable files are logged
 * and skipped.
 */
class InstalledRecordStore
{
public:
    explicit InstalledRecordStore(const fs::path& deviceRoot);

    std::optional<InstalledRecord> find(const std::string& packageId);

    /**
     * @brief Every readable record, ordered by package id.
     */
    std::vector<InstalledRecord> all();

    /**
     * @brief Creates or replaces the record of record.packageId.
     *
     * @throws IOError if the file cannot be written.
     */
    void save(const InstalledRecord& record);

    /**
     * @brief Deletes the record of packageId. Missing records are ignored.
     *
     * @throws IOError if an existing file cannot be removed.
     */
    void remove(const std::string& packageId);

    const fs::path& directory() const { return recordsDir; }

private:
    fs::path fileFor(const std::string& packageId) const;
    std::shared_ptr<std::mutex> lockFor(const std::string& packageId);
    std::optional<InstalledRecord> load(const fs::path& file);

    fs::path recordsDir;

    std::mutex locksMutex;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks;
};

} // namespace KoStore

#endif // KOSTORE_RECORDS_HPP
