#pragma once
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace vsim {

inline constexpr uint64_t splitmix64(uint64_t& x) noexcept {
  uint64_t z = (x += 0x9e3779b97f4a7c15ull);
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ull;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebull;
  return z ^ (z >> 31);
}

// Stateless mix of two words; used for keys and per-agent streams.
inline constexpr uint64_t mix64(uint64_t a, uint64_t b) noexcept {
  uint64_t s = a ^ (b + 0x9e3779b97f4a7c15ull + (a << 6) + (a >> 2));
  return splitmix64(s);
}

// Small deterministic generator (splitmix64 stream). The <random> distributions
// are implementation-defined, so normal() and pick() are written out here to keep
// a seeded population identical across standard libraries.
class Rng {
public:
  explicit Rng(uint64_t seed) noexcept : state_(seed) {}

  uint64_t next() noexcept { return splitmix64(state_); }

  double uniform01() noexcept {
    return static_cast<double>(next() >> 11) * (1.0 / 9007199254740992.0);
  }

  // inclusive bounds
  int32_t uniform_int(int32_t lo, int32_t hi) noexcept {
    if (hi <= lo) return lo;
    const uint64_t span = static_cast<uint64_t>(static_cast<int64_t>(hi) - lo + 1);
    return static_cast<int32_t>(lo + static_cast<int64_t>(next() % span));
  }

  double normal(double mean, double stddev) noexcept {
    // Box-Muller, one sample per call
    double u1 = uniform01();
    if (u1 < 1e-12) u1 = 1e-12;
    const double u2 = uniform01();
    return mean + stddev * std::sqrt(-2.0 * std::log(u1)) * std::cos(6.283185307179586 * u2);
  }

  // pick an index from a discrete distribution that sums to ~1
  template <class Weights>
  std::size_t pick(const Weights& w) noexcept {
    const double u = uniform01();
    double acc = 0.0;
    std::size_t i = 0;
    for (const auto x : w) {
      acc += x;
      if (u < acc) return i;
      ++i;
    }
    return (i == 0) ? 0 : i - 1;
  }

private:
  uint64_t state_;
};

} // namespace vsim
