#pragma once
/**
 * @file temp_dir.hpp
 * @brief Test helpers: RAII scratch directory and small file utilities.
 */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

namespace kprim_test {

/// Creates a unique directory under @p parent and removes it (recursively) on destruction.
class TempDir {
public:
  explicit TempDir(const std::string& parent = default_parent()) {
    std::string tmpl = parent + "/kprim-test-XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (::mkdtemp(buf.data()) != nullptr) path_ = buf.data();
  }
  ~TempDir() {
    if (path_.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  bool ok() const { return !path_.empty(); }
  const std::string& path() const { return path_; }
  std::string file(const std::string& name) const { return path_ + "/" + name; }

  static std::string default_parent() {
    if (const char* t = std::getenv("TMPDIR"); t && *t) return t;
    return "/tmp";
  }

private:
  std::string path_;
};

inline void write_file(const std::string& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline std::string read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/// Deterministic, non-repeating-looking payload of @p n bytes.
inline std::string pattern(std::size_t n) {
  std::string s(n, '\0');
  for (std::size_t i = 0; i < n; ++i) s[i] = static_cast<char>((i * 131u + 7u) % 251u);
  return s;
}

inline std::optional<dev_t> device_of(const std::string& path) {
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) return std::nullopt;
  return st.st_dev;
}

/// Two writable directories on different devices, if the host has them.
inline std::optional<std::pair<std::string, std::string>> cross_device_dirs() {
  std::vector<std::string> candidates = {TempDir::default_parent(), "/tmp", "/dev/shm", "/var/tmp"};
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) candidates.push_back(cwd.string());
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    const auto di = device_of(candidates[i]);
    if (!di || ::access(candidates[i].c_str(), W_OK) != 0) continue;
    for (std::size_t j = i + 1; j < candidates.size(); ++j) {
      const auto dj = device_of(candidates[j]);
      if (!dj || ::access(candidates[j].c_str(), W_OK) != 0) continue;
      if (*di != *dj) return std::make_pair(candidates[i], candidates[j]);
    }
  }
  return std::nullopt;
}

} // namespace kprim_test
