#include "app/Config.hpp"
#include "util/TimeSpec.hpp"
#include "util/TomlReader.hpp"
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace proctally::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string n(name);
  std::string alt;
  if (n.rfind("PROCTALLY_", 0) == 0) alt = "proctally_" + n.substr(10);
  else if (n.rfind("proctally_", 0) == 0) alt = "PROCTALLY_" + n.substr(10);
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

std::string default_config_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/proctally/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/proctally/config.toml";
  return {};
}

static std::optional<double> to_double(const std::string& s) {
  double v = 0.0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0] == '0' || v[0] == 'f' || v[0] == 'F' || v[0] == 'n' || v[0] == 'N') return false;
  return true;
}

// Resolve a number from TOML -> env -> compiled default
static double resolve_double(const proctally::util::TomlReader& toml, bool have_toml,
                             const char* section, const char* key,
                             const char* env_name, double def) {
  if (have_toml && toml.has(section, key)) {
    auto v = toml.get_double(section, key);
    if (!v) throw std::invalid_argument(std::string("config [") + section + "] " + key + " is not a number");
    return *v;
  }
  if (const char* e = getenv_compat(env_name)) {
    auto v = to_double(e);
    if (!v) throw std::invalid_argument(std::string(env_name) + " is not a number: " + e);
    return *v;
  }
  return def;
}

static bool resolve_bool(const proctally::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key)) {
    auto v = toml.get_bool(section, key);
    if (!v) throw std::invalid_argument(std::string("config [") + section + "] " + key + " is not a boolean");
    return *v;
  }
  return env_flag(env_name, def);
}

static std::string resolve_string(const proctally::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key)) return toml.get_string(section, key, def);
  if (const char* e = getenv_compat(env_name)) return std::string(e);
  return def;
}

SamplerConfig load_config(const std::string& explicit_path) {
  SamplerConfig c{};
  proctally::util::TomlReader toml;
  bool have_toml = false;
  if (!explicit_path.empty()) {
    if (!toml.load(explicit_path)) throw std::runtime_error("cannot open config file " + explicit_path);
    have_toml = true;
    c.config_path = explicit_path;
  } else {
    auto path = default_config_path();
    std::error_code ec;
    if (!path.empty() && std::filesystem::exists(path, ec) && toml.load(path)) {
      have_toml = true;
      c.config_path = path;
    }
  }
  if (have_toml && toml.skipped_lines() > 0) {
    proctally::util::log_warn("config", "%s: ignored %zu unsupported lines", c.config_path.c_str(), toml.skipped_lines());
  }

  // --- [storage] ---
  c.db_path = resolve_string(toml, have_toml, "storage", "db", "PROCTALLY_DB", c.db_path);

  // --- [sampler] ---
  c.interval_s       = resolve_double(toml, have_toml, "sampler", "interval_s",       "PROCTALLY_INTERVAL_S", c.interval_s);
  c.active_threshold = resolve_double(toml, have_toml, "sampler", "active_threshold", "PROCTALLY_ACTIVE_THRESHOLD", c.active_threshold);
  c.collect_mem      = resolve_bool(toml, have_toml, "sampler", "collect_mem", "PROCTALLY_COLLECT_MEM", c.collect_mem);
  c.collect_io       = resolve_bool(toml, have_toml, "sampler", "collect_io",  "PROCTALLY_COLLECT_IO",  c.collect_io);
  c.janitor_interval_s = resolve_double(toml, have_toml, "sampler", "janitor_interval_s", "PROCTALLY_JANITOR_INTERVAL_S", c.janitor_interval_s);
  auto retention = resolve_string(toml, have_toml, "sampler", "retention", "PROCTALLY_RETENTION", "30d");
  c.retention_s = proctally::util::require_duration("retention", retention);

  // --- [log] ---
  auto lvl = resolve_string(toml, have_toml, "log", "level", "PROCTALLY_LOG_LEVEL", "INFO");
  auto parsed = proctally::util::parse_log_level(lvl);
  if (!parsed) throw std::invalid_argument("invalid log level '" + lvl + "' (expected DEBUG, INFO, WARNING or ERROR)");
  c.log_level = *parsed;

  validate_config(c);
  return c;
}

void validate_config(const SamplerConfig& c) {
  if (c.db_path.empty()) throw std::invalid_argument("database path must not be empty (e.g. --db ./proctally.db)");
  if (!(c.interval_s > 0.0)) throw std::invalid_argument("--interval must be > 0 seconds (e.g. --interval 1.0)");
  if (!(c.active_threshold >= 0.0)) throw std::invalid_argument("--active-threshold must be >= 0 (e.g. --active-threshold 0.005)");
  if (!(c.retention_s > 0.0)) throw std::invalid_argument("--retention must be positive (e.g. --retention 30d)");
  if (!(c.janitor_interval_s > 0.0)) throw std::invalid_argument("janitor interval must be > 0 seconds (e.g. 60)");
}

} // namespace proctally::app
