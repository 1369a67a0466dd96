#include "records.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <algorithm>
#include <yaml-cpp/yaml.h>

namespace KoStore {

InstalledRecordStore::InstalledRecordStore(const fs::path& deviceRoot)
    : recordsDir(deviceRoot / ".kostore" / "installed")
{
}

fs::path InstalledRecordStore::fileFor(const std::string& packageId) const
{
    return recordsDir / (sanitizeKey(packageId) + ".yaml");
}

std::shared_ptr<std::mutex> InstalledRecordStore::lockFor(const std::string& packageId)
{
    std::lock_guard<std::mutex> guard(locksMutex);
    auto& slot = locks[packageId];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

std::optional<InstalledRecord> InstalledRecordStore::load(const fs::path& file)
{
    try {
        YAML::Node node = YAML::LoadFile(file.string());
        return node.as<InstalledRecord>();
    } catch (const YAML::Exception& e) {
        log_warning("Skipping unreadable install record " + file.string() + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<InstalledRecord> InstalledRecordStore::find(const std::string& packageId)
{
    const fs::path file = fileFor(packageId);
    auto lock = lockFor(packageId);
    std::lock_guard<std::mutex> guard(*lock);

    std::error_code ec;
    if (!fs::exists(file, ec)) {
        return std::nullopt;
    }
    auto record = load(file);
    if (record && record->packageId != packageId) {
        return std::nullopt;
    }
    return record;
}

std::vector<InstalledRecord> InstalledRecordStore::all()
{
    std::vector<InstalledRecord> records;
    std::error_code ec;
    if (!fs::is_directory(recordsDir, ec)) {
        return records;
    }

    for (const auto& entry : fs::directory_iterator(recordsDir, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".yaml") {
            continue;
        }
        // Leftover temp files from an interrupted write start with a dot
        if (entry.path().filename().string().front() == '.') {
            continue;
        }
        if (auto record = load(entry.path())) {
            records.push_back(std::move(*record));
        }
    }

    std::sort(records.begin(), records.end(),
              [](const InstalledRecord& a, const InstalledRecord& b) {
                  return a.packageId < b.packageId;
              });
    return records;
}

void InstalledRecordStore::save(const InstalledRecord& record)
{
    YAML::Node node;
    node = record;
    YAML::Emitter out;
    out << node;

    auto lock = lockFor(record.packageId);
    std::lock_guard<std::mutex> guard(*lock);
    writeFileAtomically(fileFor(record.packageId), std::string(out.c_str()) + "\n");
    log_debug("Saved install record of " + record.packageId);
}

void InstalledRecordStore::remove(const std::string& packageId)
{
    auto lock = lockFor(packageId);
    std::lock_guard<std::mutex> guard(*lock);

    std::error_code ec;
    fs::remove(fileFor(packageId), ec);
    if (ec) {
        throw IOError("Failed to remove install record of " + packageId + ": " + ec.message());
    }
}

} // namespace KoStore
