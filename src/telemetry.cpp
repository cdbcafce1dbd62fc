#include "vsim/telemetry.hpp"

#include <iomanip>
#include <ostream>

namespace vsim {

void StreamTelemetrySink::on_tick(const TickTelemetry& t) {
  if (!print_ticks_) return;
  std::lock_guard<std::mutex> lk(mu_);
  os_ << "tick=" << t.tick
      << " tiers=" << t.tiers[tier_index(Tier::Dormant)] << '/' << t.tiers[tier_index(Tier::Low)] << '/'
      << t.tiers[tier_index(Tier::Medium)] << '/' << t.tiers[tier_index(Tier::High)]
      << " budget=" << t.budget
      << " full=" << t.full_updates
      << " aging=" << t.aging_updates
      << " forced=" << t.forced
      << " overflow=" << t.overflow
      << " flagged=" << t.flagged
      << " cohorts=" << t.cohorts_submitted
      << " applied=" << t.results_applied
      << " hit=" << std::fixed << std::setprecision(3) << t.cache_hit_ratio
      << " batch=" << t.last_batch_size
      << " circuit=" << to_string(t.circuit)
      << " degradation=" << to_string(t.degradation)
      << " ms=" << std::setprecision(2) << t.tick_ms
      << std::defaultfloat << '\n';
}

void StreamTelemetrySink::log(LogLevel level, std::string_view msg) {
  if (level < min_level_) return;
  std::lock_guard<std::mutex> lk(mu_);
  os_ << '[' << to_string(level) << "] " << msg << '\n';
}

} // namespace vsim
