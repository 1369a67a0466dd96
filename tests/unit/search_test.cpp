#include "search.hpp"
#include "list.hpp"
#include "info.hpp"

#include <cassert>
#include <iostream>
#include <sstream>

namespace {

using KoStore::InstalledRecord;
using KoStore::List;
using KoStore::PackageInfo;
using KoStore::PackageMetadata;
using KoStore::SearchQuery;
using KoStore::SortOrder;
using KoStore::StatusFilter;
using KoStore::Timestamp;

PackageMetadata MakePackage(const std::string& id, const std::string& name, const std::string& description,
                            std::uint64_t stars, int updatedDay) {
  PackageMetadata package;
  package.id = id;
  package.name = name;
  package.description = description;
  package.stars = stars;
  package.latestVersion = "1.0.0";
  if (updatedDay > 0) {
    package.updatedAt = Timestamp(std::chrono::hours(24 * updatedDay));
  }
  return package;
}

std::vector<PackageMetadata> Catalog() {
  return {
      MakePackage("a/calibre-sync", "calibre-sync", "Sync books with Calibre", 40, 10),
      MakePackage("b/Zotero", "Zotero", "Browse your Zotero library", 120, 30),
      MakePackage("c/statistics-plus", "statistics-plus", "More reading STATS", 5, 0),
      MakePackage("d/book-cover", "book-cover", "Cover browser tweaks", 40, 20),
  };
}

std::vector<std::string> Ids(const std::vector<PackageMetadata>& packages) {
  std::vector<std::string> ids;
  for (const auto& package : packages) {
    ids.push_back(package.id);
  }
  return ids;
}

void TestQueryMatchesNameOrDescriptionCaseInsensitively() {
  SearchQuery query;
  query.text = "STAT";
  assert(Ids(filterPackages(Catalog(), query)) == std::vector<std::string>{"c/statistics-plus"});

  query.text = "calibre";
  assert(Ids(filterPackages(Catalog(), query)) == std::vector<std::string>{"a/calibre-sync"});

  query.text = "";
  assert(filterPackages(Catalog(), query).size() == 4);
}

void TestSortOrders() {
  SearchQuery query;
  query.sort = SortOrder::Stars;
  // Stable: equal stars keep the remote order
  assert((Ids(filterPackages(Catalog(), query)) ==
          std::vector<std::string>{"b/Zotero", "a/calibre-sync", "d/book-cover", "c/statistics-plus"}));

  query.sort = SortOrder::Updated;
  assert((Ids(filterPackages(Catalog(), query)) ==
          std::vector<std::string>{"b/Zotero", "d/book-cover", "a/calibre-sync", "c/statistics-plus"}));

  query.sort = SortOrder::Name;
  assert((Ids(filterPackages(Catalog(), query)) ==
          std::vector<std::string>{"d/book-cover", "a/calibre-sync", "c/statistics-plus", "b/Zotero"}));

  SortOrder parsed = SortOrder::Remote;
  assert(KoStore::parseSortOrder("Stars", parsed) && parsed == SortOrder::Stars);
  assert(!KoStore::parseSortOrder("popularity", parsed));
}

void TestStatusFilters() {
  SearchQuery query;
  query.installedIds = {"a/calibre-sync"};
  query.favoriteIds = {"b/Zotero", "d/book-cover"};

  query.status = StatusFilter::Installed;
  assert(Ids(filterPackages(Catalog(), query)) == std::vector<std::string>{"a/calibre-sync"});

  query.status = StatusFilter::NotInstalled;
  assert(filterPackages(Catalog(), query).size() == 3);

  query.status = StatusFilter::Favorites;
  assert((Ids(filterPackages(Catalog(), query)) == std::vector<std::string>{"b/Zotero", "d/book-cover"}));
}

void TestCategoryFilters() {
  SearchQuery query;
  query.category = KoStore::Category::TopRated;
  assert(Ids(filterPackages(Catalog(), query)) == std::vector<std::string>{"b/Zotero"});

  // Day 45: calibre-sync is 35 days old, statistics-plus has no timestamp
  query.category = KoStore::Category::RecentlyUpdated;
  query.now = Timestamp(std::chrono::hours(24 * 45));
  assert((Ids(filterPackages(Catalog(), query)) ==
          std::vector<std::string>{"b/Zotero", "c/statistics-plus", "d/book-cover"}));

  // Exactly 30 days old still counts as recent
  query.now = Timestamp(std::chrono::hours(24 * 40));
  assert(filterPackages(Catalog(), query).size() == 4);

  // Categories combine with the text query
  query.category = KoStore::Category::TopRated;
  query.text = "calibre";
  assert(filterPackages(Catalog(), query).empty());

  KoStore::Category parsed = KoStore::Category::All;
  assert(KoStore::parseCategory("Top-Rated", parsed) && parsed == KoStore::Category::TopRated);
  assert(KoStore::parseCategory("recent", parsed) && parsed == KoStore::Category::RecentlyUpdated);
  assert(!KoStore::parseCategory("hot", parsed));
}

void TestListingMarksInstalledOutdatedAndFavorites() {
  InstalledRecord current;
  current.packageId = "b/Zotero";
  current.installedVersion = "1.0.0";
  InstalledRecord old;
  old.packageId = "a/calibre-sync";
  old.installedVersion = "0.9.0";

  std::ostringstream out;
  List::showPackages(out, Catalog(), {current, old}, {"d/book-cover"});
  const std::string text = out.str();
  assert(text.find("[update 0.9.0 -> 1.0.0]") != std::string::npos);
  assert(text.find("[installed]") != std::string::npos);
  assert(text.find("* d/book-cover") != std::string::npos);
  assert(text.find("4 package(s)") != std::string::npos);
}

void TestPackageInfoShowsInstallState() {
  auto package = Catalog().front();
  package.assetName = "calibre-sync.zip";
  package.assetSize = 4096;

  InstalledRecord record;
  record.packageId = package.id;
  record.installedVersion = "0.5";
  record.installPath = "/mnt/koreader/plugins/calibre-sync.koplugin";
  record.files = {record.installPath};

  PackageInfo info(package, record, true);
  assert(info.hasUpdate());

  std::ostringstream out;
  info.display(out);
  const std::string text = out.str();
  assert(text.find("[favorite]") != std::string::npos);
  assert(text.find("4.0 KiB") != std::string::npos);
  assert(text.find("(update available)") != std::string::npos);
  assert(text.find("calibre-sync.koplugin") != std::string::npos);

  assert(!PackageInfo(package, std::nullopt, false).hasUpdate());
  assert(KoStore::formatSize(512) == "512 B");
}

} // namespace

int main() {
  TestQueryMatchesNameOrDescriptionCaseInsensitively();
  TestSortOrders();
  TestStatusFilters();
  TestCategoryFilters();
  TestListingMarksInstalledOutdatedAndFavorites();
  TestPackageInfoShowsInstallState();

  std::cout << "kostore_unit_search: pass\n";
  return 0;
}
