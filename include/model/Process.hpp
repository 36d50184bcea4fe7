#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace proctally::model {

// Identity of one process lifetime. Raw pids are recycled by the kernel,
// so the start time is part of the key.
struct SessionKey {
  int32_t pid{};
  double  create_time{}; // epoch seconds

  bool operator==(const SessionKey& o) const { return pid == o.pid && create_time == o.create_time; }
};

struct SessionKeyHash {
  size_t operator()(const SessionKey& k) const noexcept {
    size_t h1 = std::hash<int32_t>{}(k.pid);
    size_t h2 = std::hash<double>{}(k.create_time);
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
  }
};

// One process as read from the enumerator for a single tick. Every field
// past the key may be unreadable (permissions, process exiting mid-read).
struct ProcReading {
  SessionKey key{};
  std::string name;                      // comm, always present once stat parsed
  std::optional<double>   cpu_time_s;    // utime+stime
  std::optional<std::string> exe_path;
  std::optional<std::string> cmdline;
  std::optional<std::string> username;
  std::optional<int32_t>  ppid;
  std::optional<int64_t>  rss_bytes;
  std::optional<int64_t>  vms_bytes;
  std::optional<int64_t>  io_read_bytes;
  std::optional<int64_t>  io_write_bytes;
  // Set when any restricted field above was requested and could not be read
  bool partial{false};
};

struct ProcTable {
  std::vector<ProcReading> processes;
  unsigned logical_cores{1};
  size_t skipped{}; // pids listed in /proc whose stat could not be read
};

// Session row as persisted in the `process` table.
struct SessionInfo {
  SessionKey key{};
  std::optional<std::string> exe_path;
  std::string name;
  std::optional<std::string> cmdline;
  std::optional<std::string> username;
  std::optional<int32_t> ppid;
  double first_seen{};
  double last_seen{};
  bool   ended{false};
  bool   partial_meta{false};
};

// One row of the `sample` table.
struct Sample {
  double     ts{};
  SessionKey key{};
  double     dt_s{};
  double     delta_cpu_s{};
  double     eff_cores{};
  bool       active{false};
  std::optional<int64_t> rss_bytes;
  std::optional<int64_t> vms_bytes;
  std::optional<int64_t> io_read_bytes;
  std::optional<int64_t> io_write_bytes;
};

struct SessionEnd {
  SessionKey key{};
  double last_seen{};
};

// Everything one tick wants persisted, committed all-or-nothing.
struct TickBatch {
  double ts{};
  std::vector<SessionInfo> sessions; // upserts for every session seen this tick
  std::vector<Sample> samples;
  std::vector<SessionEnd> ended;
};

} // namespace proctally::model
