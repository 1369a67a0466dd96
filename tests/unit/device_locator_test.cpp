#include "device.hpp"
#include "errors.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>

namespace {

using KoStore::DeviceLocator;
using KoStore::DevicePath;
using KoStore::InvalidDeviceError;
using KoStore::testing::MakeKoreaderRoot;
using KoStore::testing::TempDir;
using KoStore::testing::WriteFile;

InvalidDeviceError::Reason ValidateFailure(const DeviceLocator& locator, const KoStore::fs::path& path) {
  try {
    locator.validate(path);
  } catch (const InvalidDeviceError& e) {
    return e.getReason();
  }
  assert(false && "validate() should have thrown");
  return InvalidDeviceError::Reason::NotFound;
}

void TestDetectsKoboAndKindleLayouts() {
  TempDir media;
  MakeKoreaderRoot(media.path() / "KOBOeReader" / ".adds" / "koreader");
  MakeKoreaderRoot(media.path() / "Kindle" / "extensions" / "koreader");
  KoStore::fs::create_directories(media.path() / "USBSTICK" / "music");

  DeviceLocator locator({media.path()}, {});
  const auto devices = locator.detect();
  assert(devices.size() == 2);
  for (const auto& device : devices) {
    assert(device.isValid);
    assert(device.rootPath.filename() == "koreader");
    assert(device.pluginsDir == device.rootPath / "plugins");
    assert(device.patchesDir == device.rootPath / "patches");
  }
}

void TestLocalInstallAndDeduplication() {
  TempDir home;
  const auto local = MakeKoreaderRoot(home.path() / "koreader");

  // The same install reachable as a local path and through a volume
  DeviceLocator locator({home.path()}, {local, home.path() / "koreader" / "."});
  const auto devices = locator.detect();
  assert(devices.size() == 1);
  assert(devices.front().rootPath == local);
}

void TestScanSkipsBrokenVolumeEntries() {
  TempDir media;
  MakeKoreaderRoot(media.path() / "KOBOeReader" / ".adds" / "koreader");
  // A volume that went away and left a dangling mount link behind
  KoStore::fs::create_directory_symlink(media.path() / "gone", media.path() / "STALE");
  WriteFile(media.path() / "not-a-volume.txt", "x");

  DeviceLocator locator({media.path()}, {});
  const auto devices = locator.detect();
  assert(devices.size() == 1);
  assert(devices.front().rootPath.parent_path().parent_path().filename() == "KOBOeReader");
}

void TestNothingFound() {
  TempDir media;
  DeviceLocator locator({media.path(), media.path() / "missing"}, {media.path() / "nope"});
  assert(locator.detect().empty());
}

void TestValidateResolvesVolumeToKoreaderRoot() {
  TempDir volume;
  const auto root = volume.path() / ".adds" / "koreader";
  KoStore::fs::create_directories(root);
  WriteFile(root / "settings.reader.lua", "return {}\n");
  WriteFile(root / "git-rev", "v2024.04-1-gabcdef\n");

  DeviceLocator locator({}, {});
  DevicePath device = locator.validate(volume.path());
  assert(device.isValid);
  assert(device.rootPath == root);
  assert(DeviceLocator::readFirmwareVersion(device) == "v2024.04-1-gabcdef");

  // Missing plugins/ and patches/ are not created by validation
  assert(!KoStore::fs::exists(root / "plugins"));
  assert(!KoStore::fs::exists(root / "patches"));
}

void TestValidateFailures() {
  TempDir dir;
  DeviceLocator locator({}, {});

  assert(ValidateFailure(locator, dir.path() / "does-not-exist") == InvalidDeviceError::Reason::NotFound);
  assert(ValidateFailure(locator, "") == InvalidDeviceError::Reason::NotFound);

  KoStore::fs::create_directories(dir.path() / "empty");
  assert(ValidateFailure(locator, dir.path() / "empty") == InvalidDeviceError::Reason::WrongLayout);

  // plugins exists but is not a directory
  const auto root = MakeKoreaderRoot(dir.path() / "koreader");
  WriteFile(root / "plugins", "not a directory");
  assert(ValidateFailure(locator, root) == InvalidDeviceError::Reason::NotWritable);
}

void TestFirmwareVersionMissing() {
  TempDir dir;
  DevicePath device;
  device.rootPath = MakeKoreaderRoot(dir.path());
  assert(DeviceLocator::readFirmwareVersion(device).empty());
  assert(DeviceLocator::isMarkerDirectory(dir.path()));
  assert(!DeviceLocator::isMarkerDirectory(dir.path() / "koreader.sh"));
}

} // namespace

int main() {
  TestDetectsKoboAndKindleLayouts();
  TestLocalInstallAndDeduplication();
  TestScanSkipsBrokenVolumeEntries();
  TestNothingFound();
  TestValidateResolvesVolumeToKoreaderRoot();
  TestValidateFailures();
  TestFirmwareVersionMissing();

  std::cout << "kostore_unit_device_locator: pass\n";
  return 0;
}
