#include "app/SessionTracker.hpp"
#include <algorithm>

namespace proctally::app {

int SessionTracker::missed_ticks(const proctally::model::SessionKey& key) const {
  auto it = sessions_.find(key);
  return it == sessions_.end() ? 0 : it->second.missed;
}

TrackerUpdate SessionTracker::observe(const std::vector<proctally::model::ProcReading>& procs,
                                      std::chrono::steady_clock::time_point mono_now, double wall_now) {
  TrackerUpdate up;
  up.present.reserve(procs.size());
  ++tick_;

  for (const auto& r : procs) {
    auto [it, inserted] = sessions_.try_emplace(r.key);
    State& s = it->second;
    if (!inserted && s.seen_tick == tick_) continue; // duplicate pid row in one table
    s.seen_tick = tick_;
    s.missed = 0;
    s.last_seen = wall_now;
    s.partial = s.partial || r.partial;

    Observation ob;
    ob.reading = &r;
    if (inserted) {
      s.first_seen = wall_now;
      ob.first = true;
    }
    if (r.cpu_time_s) {
      if (s.prev_cpu_s) {
        ob.dt_s = std::chrono::duration<double>(mono_now - s.last_mono).count();
        ob.delta_cpu_s = std::max(0.0, *r.cpu_time_s - *s.prev_cpu_s);
      }
      // Advance even when dt is degenerate so the next tick diffs from here
      s.prev_cpu_s = *r.cpu_time_s;
      s.last_mono = mono_now;
    }
    ob.partial_meta = s.partial;
    ob.first_seen = s.first_seen;
    up.present.push_back(ob);
  }

  for (auto it = sessions_.begin(); it != sessions_.end(); ) {
    State& s = it->second;
    if (s.seen_tick != tick_ && ++s.missed >= kMissedTicksToEnd) {
      up.ended.push_back(proctally::model::SessionEnd{it->first, s.last_seen});
      it = sessions_.erase(it);
    } else {
      ++it;
    }
  }
  return up;
}

} // namespace proctally::app
