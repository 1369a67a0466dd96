#ifndef KOSTORE_SEARCH_HPP
#define KOSTORE_SEARCH_HPP

#include "package.hpp"

#include <string>
#include <vector>
#include <set>
#include <optional>
#include <cstdint>

namespace KoStore {

/**
 * @brief Result ordering. Remote keeps the listing order.
 */
enum class SortOrder { Remote, Stars, Updated, Name };

/**
 * @brief Optional restriction on install or favorite state.
 */
enum class StatusFilter { All, Installed, NotInstalled, Favorites };

/**
 * @brief Optional browsing category. TopRated keeps packages with at least
 *        topRatedMinStars stars, RecentlyUpdated those updated within the
 *        last recentDays days.
 */
enum class Category { All, TopRated, RecentlyUpdated };

constexpr std::uint64_t topRatedMinStars = 50;
constexpr int recentDays = 30;

/**
 * @brief Parses "stars", "updated", "name" or "remote" (case-insensitive).
 *
 * @return False if the text names no known order.
 */
bool parseSortOrder(const std::string& text, SortOrder& out);

/**
 * @brief Parses "top-rated", "recent" or "all" (case-insensitive).
 */
bool parseCategory(const std::string& text, Category& out);

/**
 * @struct SearchQuery
 * @brief What filterPackages() keeps and how it orders it.
 */
struct SearchQuery
{
    std::string text;                        ///< empty matches everything
    SortOrder sort       = SortOrder::Remote;
    StatusFilter status  = StatusFilter::All;
    Category category    = Category::All;
    std::optional<Timestamp> now;            ///< reference time of RecentlyUpdated, defaults to Clock::now()
    std::set<std::string> installedIds;      ///< consulted by Installed/NotInstalled
    std::set<std::string> favoriteIds;       ///< consulted by Favorites
};

/**
 * @brief Case-insensitive substring search on name or description, then
 *        the category and status filters, then a stable sort.
 */
std::vector<PackageMetadata> filterPackages(const std::vector<PackageMetadata>& packages,
                                            const SearchQuery& query);

} // namespace KoStore

#endif // KOSTORE_SEARCH_HPP
