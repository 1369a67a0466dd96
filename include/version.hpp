#ifndef KOSTORE_VERSION_HPP
#define KOSTORE_VERSION_HPP

#include <string>
#include <vector>

namespace KoStore {

/**
 * @brief Result of comparing two version strings.
 */
enum class Ordering { Less, Equal, Greater };

/**
 * @class Version
 * @brief Relaxed semantic-version comparison for release tags.
 *
 * Accepted grammar: an optional 'v'/'V' prefix, then CORE[-PRERELEASE][+BUILD].
 * CORE is one or more dot-separated alphanumeric components (the first one
 * numeric). Anything else is malformed. Malformed versions never raise:
 * they are equal to each other and older than every well-formed version.
 */
class Version
{
public:
    /**
     * @brief Compares two version strings.
     *
     * Numeric components compare numerically (missing ones count as 0),
     * any non-numeric component compares lexically, a pre-release sorts
     * before the same version without one, and build metadata is ignored.
     *
     * @param a The first version string.
     * @param b The second version string.
     * @return Less if a is older than b, Greater if newer, Equal otherwise.
     */
    static Ordering compare(const std::string& a, const std::string& b);

    /**
     * @brief True if remote is strictly newer than installed.
     *
     * An installed version that cannot be parsed counts as outdated against
     * any well-formed remote version.
     */
    static bool isNewer(const std::string& remote, const std::string& installed);

    /**
     * @brief Checks whether a version string follows the accepted grammar.
     */
    static bool isWellFormed(const std::string& version);

    /**
     * @brief Returns the newest entry of versions, or an empty string if
     *        the list is empty.
     */
    static std::string newest(const std::vector<std::string>& versions);

    /**
     * @brief Strips a leading 'v' or 'V' from a release tag ("v1.2" -> "1.2").
     */
    static std::string stripPrefix(const std::string& tag);
};

/**
 * @brief Returns "Less", "Equal" or "Greater".
 */
const char* toString(Ordering ordering);

} // namespace KoStore

#endif // KOSTORE_VERSION_HPP
