#pragma once
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string_view>

#include "vsim/types.hpp"

namespace vsim {

enum class LogLevel : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3 };

inline std::string_view to_string(LogLevel l) noexcept {
  switch (l) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "?";
}

// Per-tick figures emitted by the simulation.
struct TickTelemetry {
  Tick tick{0};
  TierCounts tiers{};

  std::size_t budget{0};
  std::size_t full_updates{0};
  std::size_t aging_updates{0};
  std::size_t forced{0};
  std::size_t overflow{0};

  std::size_t flagged{0};
  std::size_t cohorts_submitted{0};
  std::size_t results_applied{0};

  double cache_hit_ratio{0.0};
  std::size_t last_batch_size{0};
  CircuitState circuit{CircuitState::Closed};

  Degradation degradation{Degradation::None};
  double tick_ms{0.0};
};

// Metrics/log sink injected at construction; implementations must be thread-safe
// for log(), which may be called from gateway workers.
class TelemetrySink {
public:
  virtual ~TelemetrySink() = default;

  virtual void on_tick(const TickTelemetry& t) { (void)t; }
  virtual void log(LogLevel level, std::string_view msg) { (void)level; (void)msg; }
};

class NullTelemetrySink final : public TelemetrySink {};

// Writes log lines (and optionally tick lines) to a stream, one line per call.
class StreamTelemetrySink final : public TelemetrySink {
public:
  explicit StreamTelemetrySink(std::ostream& os, LogLevel min_level = LogLevel::Info,
                               bool print_ticks = false)
    : os_(os), min_level_(min_level), print_ticks_(print_ticks) {}

  void on_tick(const TickTelemetry& t) override;
  void log(LogLevel level, std::string_view msg) override;

private:
  std::mutex mu_;
  std::ostream& os_;
  LogLevel min_level_;
  bool print_ticks_;
};

} // namespace vsim
