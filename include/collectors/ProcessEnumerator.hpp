#pragma once
#include "collectors/IProcessEnumerator.hpp"
#include <cerrno>
#include <optional>
#include <string>
#include <unordered_map>

namespace proctally::collectors {

struct EnumeratorOptions {
  bool collect_mem{true};
  bool collect_io{true};
};

class ProcessEnumerator : public IProcessEnumerator {
public:
  explicit ProcessEnumerator(EnumeratorOptions opts = {});
  bool enumerate(proctally::model::ProcTable& out) override;
  const char* name() const override { return "/proc scanner"; }

  struct StatFields {
    std::string comm;
    char state{'?'};
    int32_t ppid{};
    uint64_t utime{};     // clock ticks
    uint64_t stime{};     // clock ticks
    uint64_t starttime{}; // clock ticks since boot
    uint64_t vsize{};     // bytes
    int64_t rss_pages{};
  };
  // Parse the content of /proc/<pid>/stat. comm may contain spaces and ')'.
  [[nodiscard]] static bool parse_stat_line(const std::string& content, StatFields& out);
  // True for a readlink errno that means the field exists but is hidden from us.
  [[nodiscard]] static bool exe_access_denied(int err) { return err == EACCES || err == EPERM; }

private:
  EnumeratorOptions opts_;
  long clk_tck_{100};
  long page_size_{4096};
  std::optional<double> boot_time_; // btime from /proc/stat, read once
  std::unordered_map<uint32_t, std::string> user_cache_;

  [[nodiscard]] std::optional<std::string> read_cmdline(int32_t pid) const;
  [[nodiscard]] std::optional<std::string> username_from_status(int32_t pid);
  [[nodiscard]] std::optional<std::string> user_name_cached(uint32_t uid);
  [[nodiscard]] bool read_io(int32_t pid, int64_t& read_b, int64_t& write_b) const;
};

// btime line of /proc/stat
[[nodiscard]] std::optional<double> read_boot_time();

// Count of per-core "cpuN" lines in /proc/stat (at least 1)
[[nodiscard]] unsigned read_logical_cores();

} // namespace proctally::collectors
