#include "util/Procfs.hpp"

#include <sys/types.h>
#include <dirent.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace proctally::util {

static std::string env_root(const char* name) {
  const char* env = std::getenv(name);
  if (env && *env) return std::string(env);
  return std::string();
}

static std::string remap(const std::string& abs, const char* prefix, const char* env_name) {
  if (abs.rfind(prefix, 0) != 0) return abs;
  auto root = env_root(env_name);
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  return remap(abs, "/proc", "PROCTALLY_PROC_ROOT");
}

auto map_etc_path(const std::string& abs) -> std::string {
  return remap(abs, "/etc", "PROCTALLY_ETC_ROOT");
}

static std::string map_any(const std::string& abs) {
  if (abs.rfind("/etc", 0) == 0) return map_etc_path(abs);
  return map_proc_path(abs);
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_any(abs));
  if (!in) return std::nullopt;
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  // /proc files of an exiting process can open fine and then fail on read
  if (in.bad()) return std::nullopt;
  return s;
}

auto read_file_bytes(const std::string& abs) -> std::optional<std::vector<unsigned char>> {
  std::ifstream in(map_any(abs), std::ios::binary);
  if (!in) return std::nullopt;
  std::vector<unsigned char> buf((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) return std::nullopt;
  return buf;
}

auto read_symlink(const std::string& abs, int* err) -> std::optional<std::string> {
  auto path = map_proc_path(abs);
  char buf[4096];
  if (err) *err = 0;
  ssize_t n = ::readlink(path.c_str(), buf, sizeof(buf) - 1);
  if (n < 0) {
    if (err) *err = errno;
    return std::nullopt;
  }
  if (n == 0) return std::nullopt;
  buf[n] = '\0';
  return std::string(buf, static_cast<size_t>(n));
}

auto list_dir(const std::string& abs) -> std::vector<std::string> {
  std::vector<std::string> out;
  auto path = map_proc_path(abs);
  DIR* d = ::opendir(path.c_str());
  if (!d) return out;
  while (auto* ent = ::readdir(d)) {
    const char* name = ent->d_name;
    if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) continue;
    out.emplace_back(name);
  }
  ::closedir(d);
  return out;
}

} // namespace proctally::util
