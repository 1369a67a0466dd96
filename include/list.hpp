#ifndef KOSTORE_LIST_HPP
#define KOSTORE_LIST_HPP

#include "package.hpp"

#include <string>
#include <vector>
#include <set>
#include <ostream>

namespace KoStore {

/**
 * @class List
 * @brief Tabular output of package listings and installed records.
 */
class List
{
public:
    /**
     * @brief Prints one line per package. Installed packages are marked
     *        [installed] or [update], favorites with '*'.
     *
     * @param records   Install records of the current device (may be empty).
     * @param favorites Favorite package ids.
     */
    static void showPackages(std::ostream& out,
                             const std::vector<PackageMetadata>& packages,
                             const std::vector<InstalledRecord>& records,
                             const std::set<std::string>& favorites);

    /**
     * @brief Prints every install record with its version and path.
     */
    static void showInstalledPackages(std::ostream& out,
                                      const std::vector<InstalledRecord>& records);
};

} // namespace KoStore

#endif // KOSTORE_LIST_HPP
