#include "filefetch/temp-file.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <functional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include "filefetch/base-fd.hpp"
#include "filefetch/log.hpp"

namespace filefetch::test {

namespace {
std::string toHex(uint64_t value) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(16);
  for (int i = 15; i >= 0; --i) {
    out.push_back(kHex[(value >> (i * 4)) & 0xF]);
  }
  return out;
}

std::mt19937_64 &threadRng() {
  thread_local std::mt19937_64 engine = [] {
    // Collect multiple entropy sources and mix via seed_seq.
    std::random_device rd;
    const auto now = static_cast<uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
    const auto tid = static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    const auto addr = reinterpret_cast<uint64_t>(&rd);
    std::array<uint64_t, 4> seeds{static_cast<uint64_t>(rd()), now, tid, addr};
    std::seed_seq seq(seeds.begin(), seeds.end());
    return std::mt19937_64(seq);
  }();
  return engine;
}

void writeAll(int fd, const std::filesystem::path &path, std::string_view content) {
  auto written = ::write(fd, content.data(), content.size());
  if (std::cmp_not_equal(written, content.size())) {
    // best-effort cleanup: try to unlink the file we just created
    if (::unlink(path.c_str()) != 0) {
      int err = errno;
      log::error("ScopedTempFile: unlink({}) failed: {} ({})", path.string(), err, std::strerror(err));
    }
    throw std::runtime_error("ScopedTempFile: write failed");
  }
}

}  // namespace

ScopedTempDir::ScopedTempDir(std::string_view prefix) {
  const auto base = std::filesystem::temp_directory_path();
  std::uniform_int_distribution<uint64_t> dist;
  for (int attempt = 0; attempt < 100; ++attempt) {
    const auto candidate = base / (std::string(prefix) + toHex(dist(threadRng())));
    std::error_code ec;
    if (std::filesystem::create_directories(candidate, ec)) {
      // temp_directory_path() may itself go through a symlink: keep the canonical form so that
      // paths built from dirPath() are canonical.
      _dir = std::filesystem::canonical(candidate);
      return;
    }
  }

  throw std::runtime_error("ScopedTempDir: Failed to create temp dir");
}

ScopedTempDir::ScopedTempDir(ScopedTempDir &&other) noexcept : _dir(std::move(other._dir)) { other._dir.clear(); }

ScopedTempDir &ScopedTempDir::operator=(ScopedTempDir &&other) noexcept {
  if (this != &other) {
    cleanup();
    _dir = std::move(other._dir);
    other._dir.clear();
  }
  return *this;
}

ScopedTempDir::~ScopedTempDir() { cleanup(); }

void ScopedTempDir::cleanup() noexcept {
  if (!_dir.empty()) {
    std::error_code ec;
    // Restore permissions possibly removed by tests so that removal can descend everywhere.
    for (auto it = std::filesystem::recursive_directory_iterator(
             _dir, std::filesystem::directory_options::skip_permission_denied, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
      if (it->is_directory(ec) && !it->is_symlink(ec)) {
        std::filesystem::permissions(it->path(), std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::add, ec);
      }
    }
    ec.clear();
    std::filesystem::remove_all(_dir, ec);
    if (ec) {
      log::error("ScopedTempDir::cleanup: remove_all({}) failed: {}", _dir.string(), ec.message());
    }
    _dir.clear();
  }
}

ScopedTempFile::ScopedTempFile(const ScopedTempDir &dir, std::string_view content) : _dir(dir.dirPath()) {
  // Create a unique file inside the provided directory. Use mkstemp on a
  // template so we get an atomic create+open and avoid races.
  std::string tmpl = _dir.string() + "/filefetch_temp_XXXXXX";

  BaseFd raii(::mkstemp(tmpl.data()));
  if (!raii) {
    int err = errno;
    throw std::system_error(err, std::generic_category(), "ScopedTempFile: mkstemp failed");
  }

  _path = std::filesystem::path(tmpl);
  writeAll(raii.fd(), _path, content);
  _content.assign(content);
}

ScopedTempFile::ScopedTempFile(const ScopedTempDir &dir, std::string_view name, std::string_view content)
    : _dir(dir.dirPath()), _path(dir.dirPath() / name) {
  BaseFd raii(::open(_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
  if (!raii) {
    int err = errno;
    throw std::system_error(err, std::generic_category(), "ScopedTempFile: open failed");
  }

  writeAll(raii.fd(), _path, content);
  _content.assign(content);
}

ScopedTempFile::ScopedTempFile(ScopedTempFile &&other) noexcept
    : _dir(std::move(other._dir)), _path(std::move(other._path)), _content(std::move(other._content)) {
  other._path.clear();
}

ScopedTempFile &ScopedTempFile::operator=(ScopedTempFile &&other) noexcept {
  if (this != &other) {
    cleanup();
    _dir = std::move(other._dir);
    _path = std::move(other._path);
    _content = std::move(other._content);

    other._path.clear();
  }
  return *this;
}

ScopedTempFile::~ScopedTempFile() { cleanup(); }

void ScopedTempFile::cleanup() noexcept {
  // Remove only the file we created. ScopedTempDir is responsible for removing its directory contents.
  if (!_path.empty()) {
    std::error_code ec;
    std::filesystem::remove(_path, ec);
    if (ec) {
      log::error("ScopedTempFile::cleanup: remove({}) failed: {} ({})", _path.string(), ec.value(), ec.message());
    }
    _path.clear();
  }
}

}  // namespace filefetch::test
