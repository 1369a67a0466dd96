#include "utils.hpp"
#include "errors.hpp"

#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <mutex>
#include <atomic>
#include <random>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace KoStore {

namespace {

    // So output isn't garbled when jobs log from their own threads
    std::mutex logMutex;
    std::atomic<bool> verboseOutput{false};

    void writeLogLine(const char* color, const char* label, const std::string& message)
    {
        std::lock_guard<std::mutex> lock(logMutex);
        std::cerr << color << label << KOSTORE_COLOR_RESET << message << std::endl;
    }

    /**
     * Cross-platform (ish) replacement for timegm() to handle UTC
     * conversions from struct tm.
     */
    std::time_t portable_timegm(std::tm* tm)
    {
    #if defined(_WIN32)
        return _mkgmtime(tm);
    #else
        return timegm(tm);
    #endif
    }

} // namespace

void log_message(const std::string& message)
{
    writeLogLine(KOSTORE_COLOR_INFO, "[INFO] ", message);
}

void log_warning(const std::string& message)
{
    writeLogLine(KOSTORE_COLOR_WARN, "[WARN] ", message);
}

void log_error(const std::string& message)
{
    writeLogLine(KOSTORE_COLOR_ERROR, "[ERROR] ", message);
}

void log_debug(const std::string& message)
{
    if (verboseOutput.load()) {
        writeLogLine(KOSTORE_COLOR_DEBUG, "[DEBUG] ", message);
    }
}

void setVerbose(bool enabled)
{
    verboseOutput.store(enabled);
}

bool isVerbose()
{
    return verboseOutput.load();
}

/**
 * @brief libcurl callback function. Appends downloaded data into a std::string.
 */
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp)
{
    size_t totalSize      = size * nmemb;
    std::string* response = static_cast<std::string*>(userp);

    try {
        response->append(static_cast<char*>(contents), totalSize);
    } catch (const std::exception& e) {
        log_error(std::string("Error appending data to response: ") + e.what());
        return 0; // Signal failure to libcurl
    }

    return totalSize;
}

std::string trim(const std::string& input)
{
    const auto first = input.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = input.find_last_not_of(" \t\n\r");
    return input.substr(first, last - first + 1);
}

std::string toLower(const std::string& input)
{
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string sanitizeKey(const std::string& key)
{
    std::string safe = key;
    for (auto& c : safe) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '-' && c != '.') {
            c = '_';
        }
    }
    // Never produce "." or ".." or a hidden file
    if (!safe.empty() && safe[0] == '.') {
        safe[0] = '_';
    }
    return safe;
}

std::string formatTimestamp(const Timestamp& timestamp)
{
    std::time_t t = Clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buffer);
}

bool parseTimestamp(const std::string& text, Timestamp& out)
{
    std::tm tm = {};
    std::istringstream ss(trim(text));

    // Try ISO 8601 (e.g. "2021-09-15T14:23:00Z")
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        ss.clear();
        ss.str(trim(text));
        ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
        if (ss.fail()) {
            return false;
        }
    }

    std::time_t t = portable_timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return false;
    }
    out = Clock::from_time_t(t);
    return true;
}

fs::path generateTempPath(const std::string& prefix, const fs::path& baseDir)
{
    fs::path tempDir = baseDir;
    if (baseDir.empty()) {
        tempDir = fs::temp_directory_path();
    }

    // Create a random numeric suffix
    static thread_local std::mt19937 mt(std::random_device{}());
    std::uniform_int_distribution<unsigned long> dist(100000, 999999);
    return tempDir / (prefix + "_" + std::to_string(dist(mt)));
}

void writeFileAtomically(const fs::path& path, const std::string& content)
{
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw IOError("Could not create directory " + path.parent_path().string() +
                      ": " + ec.message());
    }

    fs::path tempPath = generateTempPath("." + path.filename().string() + ".tmp",
                                         path.parent_path());
    {
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw IOError("Unable to open file for writing: " + tempPath.string());
        }
        out << content;
        out.flush();
        if (!out.good()) {
            out.close();
            fs::remove(tempPath, ec);
            throw IOError("Failed to write " + tempPath.string());
        }
    }

    fs::rename(tempPath, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        throw IOError("Failed to move " + tempPath.string() + " to " +
                      path.string() + ": " + ec.message());
    }
}

std::string readFile(const fs::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw IOError("Unable to open file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bool isWithin(const fs::path& child, const fs::path& parent)
{
    const auto normalChild  = child.lexically_normal();
    const auto normalParent = parent.lexically_normal();

    auto c = normalChild.begin();
    for (auto p = normalParent.begin(); p != normalParent.end(); ++p) {
        // A trailing separator shows up as an empty final component
        if (p->empty()) {
            continue;
        }
        if (c == normalChild.end() || *c != *p) {
            return false;
        }
        ++c;
    }
    return true;
}

} // namespace KoStore
