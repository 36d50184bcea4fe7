#pragma once
#include "model/Process.hpp"

namespace proctally::collectors {

// Per-tick source of process readings. The /proc scanner is the production
// implementation; tests substitute scripted tables.
class IProcessEnumerator {
public:
  virtual ~IProcessEnumerator() = default;

  // Fill out with one reading per live process. Individual processes that
  // cannot be read at all are left out. Returns false only when the process
  // table itself is unavailable.
  [[nodiscard]] virtual bool enumerate(proctally::model::ProcTable& out) = 0;

  // Human-friendly name for diagnostics
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace proctally::collectors
