#pragma once

#include "util/Log.hpp"
#include <string>

namespace proctally::app {

struct SamplerConfig {
  std::string db_path{"./proctally.db"};
  double interval_s{1.0};
  double active_threshold{0.005};
  double retention_s{30 * 86400.0};
  bool collect_mem{true};
  bool collect_io{true};
  double janitor_interval_s{60.0};
  proctally::util::LogLevel log_level{proctally::util::LogLevel::Info};
  std::string config_path; // file actually loaded, empty when none
};

// $XDG_CONFIG_HOME/proctally/config.toml, else ~/.config/proctally/config.toml
std::string default_config_path();

// Resolve every setting TOML -> env -> compiled default. An explicit path
// that cannot be opened is an error (std::runtime_error); a missing default
// file is not. Invalid values are rejected with std::invalid_argument.
SamplerConfig load_config(const std::string& explicit_path = "");

// Range checks shared by load_config and command-line overrides.
void validate_config(const SamplerConfig& c);

// Environment helpers; PROCTALLY_X and proctally_X are both accepted
const char* getenv_compat(const char* name);

} // namespace proctally::app
