// Helpers for reading /proc and /etc with optional root remap (fixtures)
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace proctally::util {

// Map an absolute /proc path under PROCTALLY_PROC_ROOT when set
auto map_proc_path(const std::string& abs) -> std::string;

// Map an absolute /etc path under PROCTALLY_ETC_ROOT when set
auto map_etc_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Read entire file as bytes. Returns std::nullopt on error.
auto read_file_bytes(const std::string& abs) -> std::optional<std::vector<unsigned char>>;

// Resolve a symlink target (e.g. /proc/<pid>/exe). std::nullopt when unreadable;
// the readlink errno is stored in *err when err is given.
auto read_symlink(const std::string& abs, int* err = nullptr) -> std::optional<std::string>;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

} // namespace proctally::util
