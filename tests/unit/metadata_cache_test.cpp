#include "cache.hpp"
#include "package.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

namespace {

using KoStore::MetadataCache;
using KoStore::PackageMetadata;
using KoStore::Timestamp;
using KoStore::testing::TempDir;
using KoStore::testing::WriteFile;

const Timestamp kStart{std::chrono::seconds(1700000000)};

PackageMetadata MakePackage(const std::string& id) {
  PackageMetadata package;
  package.id = id;
  package.name = package.repoName();
  package.latestVersion = "2.3.0";
  package.downloadUrl = "https://example.invalid/" + id + ".zip";
  package.assetName = package.repoName() + ".zip";
  package.assetSize = 4096;
  package.checksum = "sha256:00ff";
  package.stars = 12;
  return package;
}

void TestFreshEntryRoundTrips() {
  TempDir dir;
  Timestamp now = kStart;
  MetadataCache cache(dir.path(), [&now] { return now; });

  assert(!cache.get<PackageMetadata>("release:a/calibre-sync"));

  cache.put("release:a/calibre-sync", MakePackage("a/calibre-sync"), std::chrono::hours(24));
  auto entry = cache.get<PackageMetadata>("release:a/calibre-sync");
  assert(entry);
  assert(entry->payload.id == "a/calibre-sync");
  assert(entry->payload.assetSize && *entry->payload.assetSize == 4096);
  assert(entry->payload.checksum && *entry->payload.checksum == "sha256:00ff");
  assert(entry->fetchedAt == kStart);
  assert(entry->isFresh(now));

  // Expired entries are still returned; freshness is the caller's call
  now = kStart + std::chrono::hours(25);
  entry = cache.get<PackageMetadata>("release:a/calibre-sync");
  assert(entry);
  assert(!entry->isFresh(now));
}

void TestEntriesSurviveRestart() {
  TempDir dir;
  {
    MetadataCache cache(dir.path(), [] { return kStart; });
    cache.put("list:plugin", std::vector<PackageMetadata>{MakePackage("a/one"), MakePackage("b/two")},
              std::chrono::hours(24 * 28));
  }
  MetadataCache reopened(dir.path(), [] { return kStart + std::chrono::hours(1); });
  auto entry = reopened.get<std::vector<PackageMetadata>>("list:plugin");
  assert(entry);
  assert(entry->payload.size() == 2);
  assert(entry->payload[1].id == "b/two");
  assert(entry->fetchedAt == kStart);
  assert(entry->ttl == std::chrono::hours(24 * 28));
}

void TestCorruptFileIsAMissAndRemoved() {
  TempDir dir;
  MetadataCache cache(dir.path(), [] { return kStart; });
  const auto file = dir.path() / (KoStore::sanitizeKey("list:plugin") + ".cache.yaml");
  WriteFile(file, "key: [unterminated\n");

  assert(!cache.get<std::vector<PackageMetadata>>("list:plugin"));
  assert(!KoStore::fs::exists(file));

  // Well-formed YAML that is not an entry is treated the same way
  WriteFile(file, "just a string\n");
  assert(!cache.get<std::vector<PackageMetadata>>("list:plugin"));
  assert(!KoStore::fs::exists(file));
}

void TestClearKeepsFavorites() {
  TempDir dir;
  MetadataCache cache(dir.path(), [] { return kStart; });
  cache.put("release:a/one", MakePackage("a/one"), std::chrono::hours(1));
  cache.put("release:b/two", MakePackage("b/two"), std::chrono::hours(1));
  cache.addFavorite("a/one");

  auto status = cache.info();
  assert(status.size() == 2);
  for (const auto& entry : status) {
    assert(entry.fresh);
    assert(entry.ageDays == 0);
  }

  cache.clear();
  assert(cache.info().empty());
  assert(!cache.get<PackageMetadata>("release:a/one"));
  assert(cache.isFavorite("a/one"));
}

void TestFavorites() {
  TempDir dir;
  MetadataCache cache(dir.path());
  assert(cache.favorites().empty());

  cache.addFavorite("b/zotero");
  cache.addFavorite("a/calibre-sync");
  cache.addFavorite("a/calibre-sync");
  assert(cache.favorites() == (std::set<std::string>{"a/calibre-sync", "b/zotero"}));

  cache.removeFavorite("b/zotero");
  cache.removeFavorite("never/added");
  assert(!cache.isFavorite("b/zotero"));

  MetadataCache reopened(dir.path());
  assert(reopened.isFavorite("a/calibre-sync"));
}

void TestConcurrentFavoriteUpdatesAreNotLost() {
  TempDir dir;
  MetadataCache cache(dir.path());
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&cache, t] {
      for (int i = 0; i < 10; ++i) {
        cache.addFavorite("owner" + std::to_string(t) + "/repo" + std::to_string(i));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  assert(cache.favorites().size() == 40);

  threads.clear();
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&cache, t] {
      for (int i = 0; i < 5; ++i) {
        cache.removeFavorite("owner" + std::to_string(t) + "/repo" + std::to_string(i));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  assert(cache.favorites().size() == 20);
  assert(cache.isFavorite("owner3/repo9"));
  assert(!cache.isFavorite("owner3/repo0"));
}

void TestRemoveDropsOneKey() {
  TempDir dir;
  MetadataCache cache(dir.path(), [] { return kStart; });
  cache.put("release:a/one", MakePackage("a/one"), std::chrono::hours(1));
  cache.put("release:b/two", MakePackage("b/two"), std::chrono::hours(1));
  cache.remove("release:a/one");
  assert(!cache.get<PackageMetadata>("release:a/one"));
  assert(cache.get<PackageMetadata>("release:b/two"));
}

} // namespace

int main() {
  TestFreshEntryRoundTrips();
  TestEntriesSurviveRestart();
  TestCorruptFileIsAMissAndRemoved();
  TestClearKeepsFavorites();
  TestFavorites();
  TestConcurrentFavoriteUpdatesAreNotLost();
  TestRemoveDropsOneKey();

  std::cout << "kostore_unit_metadata_cache: pass\n";
  return 0;
}
