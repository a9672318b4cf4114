#include "util/files.hpp"
#include <cstdio>
#include <fcntl.h>
#include <fstream>
#include <random>
#include <sstream>
#include <unistd.h>

namespace gossipnet {
namespace util {

namespace {

bool sync_directory(const std::filesystem::path &dir) {
#if defined(__APPLE__)
  // macOS doesn't have O_DIRECTORY
  int fd = open(dir.c_str(), O_RDONLY);
#else
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
#endif
  if (fd < 0)
    return false;
  bool result = fsync(fd) == 0;
  close(fd);
  return result;
}

std::string random_suffix() {
  static thread_local std::mt19937 gen(std::random_device{}());
  static thread_local std::uniform_int_distribution<> dis(0, 0xFFFF);
  char buf[8];
  snprintf(buf, sizeof(buf), "%04x", dis(gen));
  return std::string(buf);
}

void remove_quietly(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

} // namespace

bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    return false;
  }

  auto temp_path = path;
  temp_path += ".tmp." + random_suffix();

  int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, mode);
  if (fd < 0) {
    return false;
  }

  // Handle partial writes
  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = write(fd, data.data() + total, data.size() - total);
    if (n <= 0) {
      close(fd);
      remove_quietly(temp_path);
      return false;
    }
    total += static_cast<size_t>(n);
  }

  if (fsync(fd) != 0) {
    close(fd);
    remove_quietly(temp_path);
    return false;
  }
  close(fd);

  if (!parent.empty() && !sync_directory(parent)) {
    remove_quietly(temp_path);
    return false;
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    remove_quietly(temp_path);
    return false;
  }

  return true;
}

std::string read_file_string(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return {};
  }
  std::ostringstream oss;
  oss << file.rdbuf();
  return oss.str();
}

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  if (std::filesystem::exists(dir, ec)) {
    return std::filesystem::is_directory(dir, ec);
  }
  return std::filesystem::create_directories(dir, ec) || std::filesystem::is_directory(dir, ec);
}

} // namespace util
} // namespace gossipnet
