#include "app/Config.hpp"
#include "app/CsvExport.hpp"
#include "app/SamplerLoop.hpp"
#include "collectors/ProcessEnumerator.hpp"
#include "store/Aggregator.hpp"
#include "store/Database.hpp"
#include "store/Maintenance.hpp"
#include "store/RetentionJanitor.hpp"
#include "store/StorageWriter.hpp"
#include "ui/TopTable.hpp"
#include "util/Log.hpp"
#include "util/TimeSpec.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};
static void on_signal(int){ g_stop.store(true); }

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

const char* kUsage =
  "Usage: proctally <command> [options]\n"
  "Commands:\n"
  "  run          sample processes into the database until Ctrl+C\n"
  "  export csv   write windowed per-group CPU totals as CSV\n"
  "  top          print the heaviest groups over a trailing window\n"
  "  vacuum       compact the database file\n"
  "  reset        delete all recorded data\n"
  "Run 'proctally <command> --help' for command options.\n";

const char* kRunUsage =
  "Usage: proctally run [--db PATH] [--interval S] [--active-threshold X] [--retention D]\n"
  "                     [--no-mem] [--no-io] [--log-level L] [--config FILE] [--ticks N]\n"
  "  --interval S          seconds between ticks (default 1.0)\n"
  "  --active-threshold X  equivalent cores at or above which a tick is active (default 0.005)\n"
  "  --retention D         keep samples this long, e.g. 7d, 12h (default 30d)\n"
  "  --ticks N             stop after N committed ticks (default: until Ctrl+C)\n";

const char* kExportUsage =
  "Usage: proctally export csv --out FILE [--db PATH] [--group exe|pid] [--since T] [--until T]\n"
  "  T is 'now', a duration back from now (24h, 30m), epoch seconds,\n"
  "  or local YYYY-MM-DD[THH:MM:SS]. Defaults: --since 24h --until now\n";

const char* kTopUsage =
  "Usage: proctally top [--db PATH] [--window D] [--group exe|pid] [--limit N]\n"
  "  Defaults: --window 10m --group exe --limit 20\n";

const char* kVacuumUsage = "Usage: proctally vacuum [--db PATH] [--config FILE]\n";
const char* kResetUsage = "Usage: proctally reset [--db PATH] [--config FILE]\n";

// Cursor over argv for one subcommand
struct ArgCursor {
  std::vector<std::string> args;
  size_t i{0};

  bool done() const { return i >= args.size(); }
  const std::string& next() { return args[i++]; }
  std::string value(const std::string& flag) {
    if (done()) throw std::invalid_argument("missing value for " + flag);
    return args[i++];
  }
};

double parse_number(const std::string& flag, const std::string& s) {
  double v = 0.0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size())
    throw std::invalid_argument("invalid " + flag + " '" + s + "' (expected a number)");
  return v;
}

int parse_int(const std::string& flag, const std::string& s) {
  int v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size())
    throw std::invalid_argument("invalid " + flag + " '" + s + "' (expected an integer)");
  return v;
}

// Options shared by every command: database location, config file, log level
struct CommonOpts {
  std::string db;
  std::string config;
  std::string log_level;
};

bool take_common(ArgCursor& c, const std::string& a, CommonOpts& o) {
  if (a == "--db") { o.db = c.value(a); return true; }
  if (a == "--config") { o.config = c.value(a); return true; }
  if (a == "--log-level") { o.log_level = c.value(a); return true; }
  return false;
}

// Config file and environment first, command line on top
proctally::app::SamplerConfig resolve_common(const CommonOpts& o) {
  auto cfg = proctally::app::load_config(o.config);
  if (!o.db.empty()) cfg.db_path = o.db;
  if (!o.log_level.empty()) {
    auto lvl = proctally::util::parse_log_level(o.log_level);
    if (!lvl) throw std::invalid_argument("invalid --log-level '" + o.log_level + "' (e.g. --log-level DEBUG)");
    cfg.log_level = *lvl;
  }
  proctally::util::set_log_level(cfg.log_level);
  return cfg;
}

[[noreturn]] void unknown_option(const std::string& a) {
  throw std::invalid_argument("unknown option " + a);
}

int cmd_run(ArgCursor c) {
  CommonOpts common;
  std::optional<double> interval, threshold, retention;
  bool no_mem = false, no_io = false;
  uint64_t max_ticks = 0;
  while (!c.done()) {
    auto a = c.next();
    if (take_common(c, a, common)) continue;
    if (a == "--interval") interval = parse_number(a, c.value(a));
    else if (a == "--active-threshold") threshold = parse_number(a, c.value(a));
    else if (a == "--retention") retention = proctally::util::require_duration("--retention", c.value(a));
    else if (a == "--no-mem") no_mem = true;
    else if (a == "--no-io") no_io = true;
    else if (a == "--ticks") {
      int n = parse_int(a, c.value(a));
      if (n < 1) throw std::invalid_argument("--ticks must be >= 1 (e.g. --ticks 10)");
      max_ticks = static_cast<uint64_t>(n);
    }
    else if (a == "-h" || a == "--help") { std::cout << kRunUsage; return kExitOk; }
    else unknown_option(a);
  }
  auto cfg = resolve_common(common);
  if (interval) cfg.interval_s = *interval;
  if (threshold) cfg.active_threshold = *threshold;
  if (retention) cfg.retention_s = *retention;
  if (no_mem) cfg.collect_mem = false;
  if (no_io) cfg.collect_io = false;
  proctally::app::validate_config(cfg);

  proctally::store::Database db(cfg.db_path);
  proctally::store::StorageWriter writer(db);
  proctally::store::RetentionJanitor janitor(db, cfg.retention_s, cfg.janitor_interval_s);
  proctally::collectors::ProcessEnumerator enumerator({cfg.collect_mem, cfg.collect_io});

  proctally::app::LoopOptions lo;
  lo.interval = std::chrono::duration<double>(cfg.interval_s);
  lo.active_threshold = cfg.active_threshold;
  lo.max_ticks = max_ticks;
  proctally::util::log_info("main", "database %s (journal %s)%s%s", db.path().c_str(), db.journal_mode().c_str(),
                            cfg.config_path.empty() ? "" : ", config ", cfg.config_path.c_str());

  proctally::app::SamplerLoop loop(enumerator, writer, janitor, lo);
  loop.start();
  while (!g_stop.load() && !loop.finished()) std::this_thread::sleep_for(100ms);
  loop.stop();
  if (loop.failed()) {
    std::fprintf(stderr, "proctally: fatal: %s\n", loop.failure().c_str());
    return kExitFailure;
  }
  return kExitOk;
}

int cmd_export(ArgCursor c) {
  if (c.done()) throw std::invalid_argument("export needs a format (e.g. proctally export csv --out usage.csv)");
  auto fmt = c.next();
  if (fmt == "-h" || fmt == "--help") { std::cout << kExportUsage; return kExitOk; }
  if (fmt != "csv") throw std::invalid_argument("unsupported export format '" + fmt + "' (expected csv)");
  CommonOpts common;
  std::string out, group = "exe", since = "24h", until = "now";
  while (!c.done()) {
    auto a = c.next();
    if (take_common(c, a, common)) continue;
    if (a == "--out") out = c.value(a);
    else if (a == "--group") group = c.value(a);
    else if (a == "--since") since = c.value(a);
    else if (a == "--until") until = c.value(a);
    else if (a == "-h" || a == "--help") { std::cout << kExportUsage; return kExitOk; }
    else unknown_option(a);
  }
  if (out.empty()) throw std::invalid_argument("--out is required (e.g. --out ./usage.csv)");
  proctally::store::AggregateQuery q;
  q.group = proctally::store::require_group(group);
  q.window = proctally::util::resolve_window(since, until, proctally::util::wall_now());
  auto cfg = resolve_common(common);

  proctally::store::Database db(cfg.db_path);
  proctally::store::Aggregator agg(db);
  auto rows = agg.aggregate(q);
  size_t n = proctally::app::write_csv(out, rows, q.group, q.window);
  std::cout << "CSV written: " << out << " (" << n << " rows)\n";
  return kExitOk;
}

int cmd_top(ArgCursor c) {
  CommonOpts common;
  std::string window = "10m", group = "exe";
  int limit = 20;
  while (!c.done()) {
    auto a = c.next();
    if (take_common(c, a, common)) continue;
    if (a == "--window") window = c.value(a);
    else if (a == "--group") group = c.value(a);
    else if (a == "--limit") limit = parse_int(a, c.value(a));
    else if (a == "-h" || a == "--help") { std::cout << kTopUsage; return kExitOk; }
    else unknown_option(a);
  }
  if (limit < 1) throw std::invalid_argument("--limit must be >= 1 (e.g. --limit 20)");
  double span = proctally::util::require_duration("--window", window);
  double now = proctally::util::wall_now();
  proctally::store::AggregateQuery q;
  q.group = proctally::store::require_group(group);
  q.window = {now - span, now};
  q.limit = limit;
  auto cfg = resolve_common(common);

  proctally::store::Database db(cfg.db_path);
  proctally::store::Aggregator agg(db);
  auto rows = agg.aggregate(q);
  std::cout << proctally::ui::render_top_table(rows, q.group);
  if (rows.empty()) std::cout << "(no samples in the last " << window << ")\n";
  return kExitOk;
}

int cmd_maintenance(ArgCursor c, bool do_reset) {
  CommonOpts common;
  while (!c.done()) {
    auto a = c.next();
    if (take_common(c, a, common)) continue;
    if (a == "-h" || a == "--help") { std::cout << (do_reset ? kResetUsage : kVacuumUsage); return kExitOk; }
    unknown_option(a);
  }
  auto cfg = resolve_common(common);
  proctally::store::Database db(cfg.db_path);
  if (do_reset) {
    proctally::store::reset(db);
    std::cout << "Database reset and vacuumed.\n";
  } else {
    proctally::store::vacuum(db);
    std::cout << "VACUUM done.\n";
  }
  return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  if (argc < 2) { std::cerr << kUsage; return kExitUsage; }
  std::string cmd = argv[1];
  ArgCursor rest;
  for (int i = 2; i < argc; ++i) rest.args.emplace_back(argv[i]);

  try {
    if (cmd == "-h" || cmd == "--help") { std::cout << kUsage; return kExitOk; }
    if (cmd == "run") return cmd_run(std::move(rest));
    if (cmd == "export") return cmd_export(std::move(rest));
    if (cmd == "top") return cmd_top(std::move(rest));
    if (cmd == "vacuum") return cmd_maintenance(std::move(rest), false);
    if (cmd == "reset") return cmd_maintenance(std::move(rest), true);
    std::cerr << "proctally: unknown command '" << cmd << "'\n" << kUsage;
    return kExitUsage;
  } catch (const std::invalid_argument& e) {
    std::fprintf(stderr, "proctally: %s\n", e.what());
    return kExitUsage;
  } catch (const proctally::store::StoreError& e) {
    proctally::util::log_error("store", "%s", e.what());
    if (e.busy()) std::fprintf(stderr, "proctally: database is locked by another writer; retry later\n");
    return kExitFailure;
  } catch (const std::exception& e) {
    std::fprintf(stderr, "proctally: %s\n", e.what());
    return kExitFailure;
  }
}
