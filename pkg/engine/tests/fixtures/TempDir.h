// Scratch directory under /tmp, removed with its contents on destruction.

#ifndef SEGWEAVE_TESTS_FIXTURES_TEMP_DIR_H_
#define SEGWEAVE_TESTS_FIXTURES_TEMP_DIR_H_

#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace segweave::tests::fixtures {

class TempDir {
 public:
  explicit TempDir(const std::string& tag = "segweave") {
    static std::atomic<int> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            (tag + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter.fetch_add(1)));
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    std::filesystem::create_directories(path_, ec);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }
  std::string str() const { return path_.string(); }

  std::string Join(const std::string& name) const { return (path_ / name).string(); }

  // Writes contents to <dir>/<name>, creating parents.
  std::string WriteFile(const std::string& name, const std::string& contents) const {
    std::filesystem::path p = path_ / name;
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << contents;
    return p.string();
  }

  static std::string ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }

 private:
  std::filesystem::path path_;
};

}  // namespace segweave::tests::fixtures

#endif  // SEGWEAVE_TESTS_FIXTURES_TEMP_DIR_H_
