#include "version.hpp"

#include <cassert>
#include <iostream>

namespace {

using KoStore::Ordering;
using KoStore::Version;

void TestNumericComponentsCompareNumerically() {
  assert(Version::compare("1.10.0", "1.9.3") == Ordering::Greater);
  assert(Version::compare("2.3.0", "2.3.0") == Ordering::Equal);
  assert(Version::compare("0.9", "1.0") == Ordering::Less);
  assert(Version::compare("12345678901234567890.1", "12345678901234567889.9") == Ordering::Greater);
  assert(Version::compare("1.01", "1.1") == Ordering::Equal);
}

void TestMissingComponentsCountAsZero() {
  assert(Version::compare("1.0", "1.0.0") == Ordering::Equal);
  assert(Version::compare("1", "1.0.1") == Ordering::Less);
}

void TestPrefixAndBuildMetadata() {
  assert(Version::compare("v2.3.0", "2.3.0") == Ordering::Equal);
  assert(Version::compare("V1.2", "1.1") == Ordering::Greater);
  assert(Version::compare("1.0.0+build.7", "1.0.0+build.9") == Ordering::Equal);
  assert(Version::stripPrefix("v1.2") == "1.2");
  assert(Version::stripPrefix("version") == "version");
}

void TestPrereleaseOrdering() {
  assert(Version::compare("1.0.0-beta", "1.0.0") == Ordering::Less);
  assert(Version::compare("1.0.0-alpha", "1.0.0-beta") == Ordering::Less);
  assert(Version::compare("1.0.0-rc.2", "1.0.0-rc.10") == Ordering::Less);
  assert(Version::compare("1.0.0-rc", "1.0.0-rc.1") == Ordering::Less);
  assert(Version::compare("1.1.0-beta", "1.0.0") == Ordering::Greater);
}

void TestNonNumericComponentsCompareLexically() {
  assert(Version::compare("1.0a", "1.0b") == Ordering::Less);
  assert(Version::isWellFormed("1.2b"));
}

void TestMalformedVersions() {
  const char* malformed[] = {"", " ", "abc", "1..2", "1.", ".1", "1.0-", "1.0+", "1 .0", "v", "1.0-be ta"};
  for (const char* v : malformed) {
    assert(!Version::isWellFormed(v));
    assert(Version::compare(v, v) == Ordering::Equal);
    assert(Version::compare(v, "1.0.0") == Ordering::Less);
    assert(Version::compare("1.0.0", v) == Ordering::Greater);
  }
  assert(Version::compare("abc", "xyz") == Ordering::Equal);
}

void TestIsNewer() {
  assert(Version::isNewer("2.3.0", "2.2.9"));
  assert(!Version::isNewer("2.3.0", "2.3.0"));
  assert(!Version::isNewer("2.2.0", "2.3.0"));
  assert(Version::isNewer("0.1", "garbage"));
  assert(!Version::isNewer("garbage", "0.1"));
}

void TestNewestPicksGreatest() {
  assert(Version::newest({"1.2.0", "v1.10.0", "1.9.9", "bogus", "1.10.0-rc1"}) == "v1.10.0");
  assert(Version::newest({}).empty());
}

} // namespace

int main() {
  TestNumericComponentsCompareNumerically();
  TestMissingComponentsCountAsZero();
  TestPrefixAndBuildMetadata();
  TestPrereleaseOrdering();
  TestNonNumericComponentsCompareLexically();
  TestMalformedVersions();
  TestIsNewer();
  TestNewestPicksGreatest();

  std::cout << "kostore_unit_version: pass\n";
  return 0;
}
