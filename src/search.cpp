#include "search.hpp"
#include "utils.hpp"

#include <algorithm>

namespace KoStore {

bool parseSortOrder(const std::string& text, SortOrder& out)
{
    const std::string value = toLower(trim(text));
    if (value == "stars") {
        out = SortOrder::Stars;
    } else if (value == "updated") {
        out = SortOrder::Updated;
    } else if (value == "name") {
        out = SortOrder::Name;
    } else if (value == "remote" || value.empty()) {
        out = SortOrder::Remote;
    } else {
        return false;
    }
    return true;
}

bool parseCategory(const std::string& text, Category& out)
{
    const std::string value = toLower(trim(text));
    if (value == "top-rated" || value == "top") {
        out = Category::TopRated;
    } else if (value == "recent" || value == "recently-updated") {
        out = Category::RecentlyUpdated;
    } else if (value == "all" || value.empty()) {
        out = Category::All;
    } else {
        return false;
    }
    return true;
}

namespace {

    bool inCategory(const PackageMetadata& package, Category category, const Timestamp& now)
    {
        switch (category) {
        case Category::TopRated:
            return package.stars >= topRatedMinStars;
        case Category::RecentlyUpdated: {
            // Packages that never reported an update time are kept
            if (!package.updatedAt) {
                return true;
            }
            const auto ageDays = std::chrono::duration_cast<std::chrono::hours>(now - *package.updatedAt).count() / 24;
            return ageDays <= recentDays;
        }
        case Category::All:
            break;
        }
        return true;
    }

} // anonymous namespace

// ============================================================================
// filterPackages
// ============================================================================
std::vector<PackageMetadata> filterPackages(const std::vector<PackageMetadata>& packages,
                                            const SearchQuery& query)
{
    const std::string needle = toLower(trim(query.text));
    const Timestamp now = query.now.value_or(Clock::now());
    std::vector<PackageMetadata> result;

    for (const auto& package : packages) {
        if (!needle.empty() &&
            toLower(package.name).find(needle) == std::string::npos &&
            toLower(package.description).find(needle) == std::string::npos) {
            continue;
        }
        if (!inCategory(package, query.category, now)) {
            continue;
        }

        const bool installed = query.installedIds.count(package.id) > 0;
        switch (query.status) {
        case StatusFilter::Installed:
            if (!installed) continue;
            break;
        case StatusFilter::NotInstalled:
            if (installed) continue;
            break;
        case StatusFilter::Favorites:
            if (query.favoriteIds.count(package.id) == 0) continue;
            break;
        case StatusFilter::All:
            break;
        }
        result.push_back(package);
    }

    switch (query.sort) {
    case SortOrder::Stars:
        std::stable_sort(result.begin(), result.end(),
                         [](const PackageMetadata& a, const PackageMetadata& b) {
                             return a.stars > b.stars;
                         });
        break;
    case SortOrder::Updated:
        // Packages without a timestamp go last
        std::stable_sort(result.begin(), result.end(),
                         [](const PackageMetadata& a, const PackageMetadata& b) {
                             const Timestamp ta = a.updatedAt.value_or(Timestamp::min());
                             const Timestamp tb = b.updatedAt.value_or(Timestamp::min());
                             return ta > tb;
                         });
        break;
    case SortOrder::Name:
        std::stable_sort(result.begin(), result.end(),
                         [](const PackageMetadata& a, const PackageMetadata& b) {
                             return toLower(a.name) < toLower(b.name);
                         });
        break;
    case SortOrder::Remote:
        break;
    }
    return result;
}

} // namespace KoStore
