#ifndef KOSTORE_TESTS_TEST_SUPPORT_HPP
#define KOSTORE_TESTS_TEST_SUPPORT_HPP

#include "utils.hpp"

#include <fstream>
#include <string>

namespace KoStore {
namespace testing {

// Unique scratch directory, removed with everything in it on destruction.
class TempDir {
 public:
  explicit TempDir(const std::string& prefix = "kostore_test")
      : path_(generateTempPath(prefix)) {
    fs::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const fs::path& path() const { return path_; }

 private:
  fs::path path_;
};

inline void WriteFile(const fs::path& path, const std::string& content) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

// Creates a minimal KOReader install (marker file only) at dir.
inline fs::path MakeKoreaderRoot(const fs::path& dir) {
  WriteFile(dir / "koreader.sh", "#!/bin/sh\n");
  return dir;
}

inline std::size_t CountEntries(const fs::path& dir) {
  std::size_t count = 0;
  std::error_code ec;
  if (!fs::exists(dir, ec)) {
    return 0;
  }
  for (auto it = fs::directory_iterator(dir); it != fs::directory_iterator(); ++it) {
    ++count;
  }
  return count;
}

} // namespace testing
} // namespace KoStore

#endif // KOSTORE_TESTS_TEST_SUPPORT_HPP
