#ifndef KOSTORE_UTILS_HPP
#define KOSTORE_UTILS_HPP

#include <string>
#include <chrono>
#include <filesystem>

// ANSI color codes for console output.
#define KOSTORE_COLOR_RESET "\033[0m"
#define KOSTORE_COLOR_INFO  "\033[32m"
#define KOSTORE_COLOR_WARN  "\033[33m"
#define KOSTORE_COLOR_ERROR "\033[31m"
#define KOSTORE_COLOR_DEBUG "\033[36m"

namespace KoStore {

namespace fs = std::filesystem;

using Clock     = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/**
 * @brief Logs an informational message to standard error with green coloring.
 *
 * All log functions serialize on one mutex, so lines written from install
 * jobs running on background threads never interleave.
 *
 * @param message The message to log.
 */
void log_message(const std::string& message);

/**
 * @brief Logs a warning message to standard error with yellow coloring.
 *
 * @param message The warning message to log.
 */
void log_warning(const std::string& message);

/**
 * @brief Logs an error message to standard error with red coloring.
 *
 * @param message The error message to log.
 */
void log_error(const std::string& message);

/**
 * @brief Logs a debug message, only when verbose output is enabled.
 *
 * @param message The message to log.
 */
void log_debug(const std::string& message);

/**
 * @brief Enables or disables log_debug output.
 */
void setVerbose(bool enabled);

/**
 * @brief Returns whether log_debug output is enabled.
 */
bool isVerbose();

// ---------------------------------------------------------------------------
// Other utility function declarations
// ---------------------------------------------------------------------------

/**
 * @brief libcurl write callback function.
 *
 * Appends data received from a libcurl request to a std::string.
 *
 * @param contents Pointer to the received data.
 * @param size Size of each element.
 * @param nmemb Number of elements.
 * @param userp Pointer to the std::string to append data to.
 * @return The total number of bytes processed.
 */
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

/**
 * @brief Removes leading and trailing whitespace.
 */
std::string trim(const std::string& input);

/**
 * @brief Returns a lower-cased copy of the input (ASCII only).
 */
std::string toLower(const std::string& input);

/**
 * @brief Turns an arbitrary key (e.g. "release:owner/repo") into a string
 *        that is safe to use as a single file name.
 */
std::string sanitizeKey(const std::string& key);

/**
 * @brief Formats a timestamp as UTC ISO 8601 ("YYYY-MM-DDTHH:MM:SSZ").
 */
std::string formatTimestamp(const Timestamp& timestamp);

/**
 * @brief Parses an ISO 8601 UTC timestamp as GitHub returns them.
 *
 * @param text  The date in string format (e.g. "2024-03-01T10:00:00Z").
 * @param out   Receives the parsed time point.
 * @return False if the string could not be parsed.
 */
bool parseTimestamp(const std::string& text, Timestamp& out);

/**
 * @brief Creates a random file or directory name with the given prefix
 *        inside baseDir (the system temp directory when baseDir is empty).
 *        Nothing is created on disk.
 */
fs::path generateTempPath(const std::string& prefix, const fs::path& baseDir = {});

/**
 * @brief Writes content to path through a temporary sibling file and a
 *        rename, so readers see either the old file or the new one.
 *
 * @throws IOError if the file cannot be written or renamed.
 */
void writeFileAtomically(const fs::path& path, const std::string& content);

/**
 * @brief Reads a whole file into a string.
 *
 * @throws IOError if the file cannot be opened.
 */
std::string readFile(const fs::path& path);

/**
 * @brief Returns true if child is path or lies underneath it after
 *        lexical normalization.
 */
bool isWithin(const fs::path& child, const fs::path& parent);

} // namespace KoStore

#endif // KOSTORE_UTILS_HPP
