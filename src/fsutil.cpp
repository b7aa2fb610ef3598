#include "arbiter/fsutil.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>

namespace fs = std::filesystem;

namespace arbiter {

std::string make_tmp_name(const std::string& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (fs::path(dir) / (".tmp_" + std::to_string(dist(rng)))).string();
}

bool atomic_write(const std::string& target, const std::string& data) {
  std::error_code ec;
  const fs::path parent = fs::path(target).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) return false;
  }
  const std::string tmp = make_tmp_name(parent.empty() ? "." : parent.string());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

std::optional<std::string> read_file_bytes(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return std::nullopt;
  std::string data((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  if (ifs.bad()) return std::nullopt;
  return data;
}

}  // namespace arbiter
