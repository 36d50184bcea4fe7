#include "collectors/ProcessEnumerator.hpp"
#include "util/Log.hpp"
#include "util/Procfs.hpp"
#include <unistd.h>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <sstream>

namespace proctally::collectors {

ProcessEnumerator::ProcessEnumerator(EnumeratorOptions opts) : opts_(opts) {
  long hz = ::sysconf(_SC_CLK_TCK);
  if (hz > 0) clk_tck_ = hz;
  long ps = ::sysconf(_SC_PAGESIZE);
  if (ps > 0) page_size_ = ps;
}

std::optional<double> read_boot_time() {
  auto txt = proctally::util::read_file_string("/proc/stat");
  if (!txt) return std::nullopt;
  std::istringstream ss(*txt); std::string line;
  while (std::getline(ss, line)) {
    if (line.rfind("btime ", 0) == 0) {
      uint64_t v = 0;
      const char* b = line.c_str() + 6;
      while (*b == ' ') ++b;
      auto [ptr, ec] = std::from_chars(b, line.c_str() + line.size(), v);
      if (ec != std::errc{}) return std::nullopt;
      return static_cast<double>(v);
    }
  }
  return std::nullopt;
}

unsigned read_logical_cores() {
  auto txt = proctally::util::read_file_string("/proc/stat"); if (!txt) return 1;
  std::istringstream ss(*txt); std::string line; unsigned count = 0; bool first = true;
  while (std::getline(ss, line)) {
    if (line.rfind("cpu", 0) == 0) {
      if (first) { first = false; continue; } // skip aggregate 'cpu '
      if (line.size() >= 4 && std::isdigit(static_cast<unsigned char>(line[3]))) count++;
    } else if (!first) {
      break; // stop after cpu block
    }
  }
  return count == 0 ? 1 : count;
}

bool ProcessEnumerator::parse_stat_line(const std::string& content, StatFields& out) {
  auto lp = content.find('('); auto rp = content.rfind(')');
  if (lp == std::string::npos || rp == std::string::npos || rp < lp || rp + 2 > content.size()) return false;
  out.comm = content.substr(lp + 1, rp - lp - 1);
  std::istringstream ss(content.substr(rp + 2));
  ss >> out.state >> out.ppid;
  // pgrp, session, tty_nr, tpgid, flags, minflt, cminflt, majflt, cmajflt
  for (int i = 0; i < 9; i++) { std::string tmp; ss >> tmp; }
  ss >> out.utime >> out.stime;
  // cutime, cstime, priority, nice, num_threads, itrealvalue
  for (int i = 0; i < 6; i++) { std::string tmp; ss >> tmp; }
  ss >> out.starttime >> out.vsize >> out.rss_pages;
  return !ss.fail();
}

std::optional<std::string> ProcessEnumerator::read_cmdline(int32_t pid) const {
  auto bytes = proctally::util::read_file_bytes("/proc/" + std::to_string(pid) + "/cmdline");
  if (!bytes) return std::nullopt;
  std::string out; out.reserve(bytes->size()); bool sep = true;
  for (auto b : *bytes) {
    if (b == 0) { if (!sep) { out.push_back(' '); sep = true; } }
    else { out.push_back(static_cast<char>(b)); sep = false; }
  }
  if (!out.empty() && out.back() == ' ') out.pop_back();
  return out;
}

std::optional<std::string> ProcessEnumerator::user_name_cached(uint32_t uid) {
  auto it = user_cache_.find(uid);
  if (it != user_cache_.end()) return it->second;
  std::string name = std::to_string(uid);
  if (auto pw = proctally::util::read_file_string("/etc/passwd")) {
    std::istringstream ss(*pw); std::string pl;
    while (std::getline(ss, pl)) {
      auto c1 = pl.find(':'); if (c1 == std::string::npos) continue;
      auto c2 = pl.find(':', c1 + 1); if (c2 == std::string::npos) continue;
      uint32_t fuid = static_cast<uint32_t>(std::strtoul(pl.c_str() + c2 + 1, nullptr, 10));
      if (fuid == uid) { name = pl.substr(0, c1); break; }
    }
  }
  user_cache_.emplace(uid, name);
  return name;
}

std::optional<std::string> ProcessEnumerator::username_from_status(int32_t pid) {
  auto txt = proctally::util::read_file_string("/proc/" + std::to_string(pid) + "/status");
  if (!txt) return std::nullopt;
  std::istringstream ss(*txt); std::string line;
  while (std::getline(ss, line)) {
    if (line.rfind("Uid:", 0) == 0) {
      std::istringstream ls(line.substr(4));
      uint32_t uid = 0;
      if (!(ls >> uid)) return std::nullopt;
      return user_name_cached(uid);
    }
  }
  return std::nullopt;
}

bool ProcessEnumerator::read_io(int32_t pid, int64_t& read_b, int64_t& write_b) const {
  // Needs ptrace-level access: unreadable for other users' processes unless root
  auto txt = proctally::util::read_file_string("/proc/" + std::to_string(pid) + "/io");
  if (!txt || txt->empty()) return false;
  bool have_r = false, have_w = false;
  std::istringstream ss(*txt); std::string line;
  while (std::getline(ss, line)) {
    if (line.rfind("read_bytes:", 0) == 0) { read_b = std::strtoll(line.c_str() + 11, nullptr, 10); have_r = true; }
    else if (line.rfind("write_bytes:", 0) == 0) { write_b = std::strtoll(line.c_str() + 12, nullptr, 10); have_w = true; }
  }
  return have_r && have_w;
}

bool ProcessEnumerator::enumerate(proctally::model::ProcTable& out) {
  out.processes.clear();
  out.skipped = 0;
  out.logical_cores = read_logical_cores();
  if (!boot_time_) {
    boot_time_ = read_boot_time();
    if (!boot_time_) {
      proctally::util::log_error("enum", "cannot read btime from /proc/stat");
      return false;
    }
  }

  auto names = proctally::util::list_dir("/proc");
  if (names.empty()) return false;
  for (auto& name : names) {
    if (name.empty() || name[0] < '0' || name[0] > '9') continue; // numeric
    int32_t pid = static_cast<int32_t>(std::strtol(name.c_str(), nullptr, 10));
    auto content = proctally::util::read_file_string("/proc/" + name + "/stat");
    StatFields st;
    if (!content || !parse_stat_line(*content, st)) {
      // exited between readdir and open: not part of this tick
      out.skipped++;
      continue;
    }
    proctally::model::ProcReading r;
    r.key.pid = pid;
    r.key.create_time = *boot_time_ + static_cast<double>(st.starttime) / static_cast<double>(clk_tck_);
    r.name = st.comm;
    r.ppid = st.ppid;
    r.cpu_time_s = static_cast<double>(st.utime + st.stime) / static_cast<double>(clk_tck_);

    // Kernel threads have no exe link at all (ENOENT); only a denied read is partial
    int exe_err = 0;
    r.exe_path = proctally::util::read_symlink("/proc/" + name + "/exe", &exe_err);
    if (!r.exe_path && exe_access_denied(exe_err)) r.partial = true;

    auto cmd = read_cmdline(pid);
    if (!cmd) r.partial = true;
    else if (!cmd->empty()) r.cmdline = std::move(*cmd);

    r.username = username_from_status(pid);
    if (!r.username) r.partial = true;

    if (opts_.collect_mem) {
      r.rss_bytes = st.rss_pages > 0 ? st.rss_pages * static_cast<int64_t>(page_size_) : 0;
      r.vms_bytes = static_cast<int64_t>(st.vsize);
    }
    if (opts_.collect_io) {
      int64_t rb = 0, wb = 0;
      if (read_io(pid, rb, wb)) { r.io_read_bytes = rb; r.io_write_bytes = wb; }
      else r.partial = true;
    }
    out.processes.push_back(std::move(r));
  }
  if (out.skipped > 0) {
    proctally::util::log_debug("enum", "%zu processes vanished during enumeration", out.skipped);
  }
  return true;
}

} // namespace proctally::collectors
