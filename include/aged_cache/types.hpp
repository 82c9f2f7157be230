#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace aged_cache {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Absolute instants are milliseconds since the Unix epoch.
using EpochMillis = std::int64_t;

inline EpochMillis to_epoch_ms(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

struct CacheOptions {
  bool sweep_on_put{false};
  std::string version{"defaults-v1"};
};

struct CacheStats {
  std::uint64_t puts{0};
  std::uint64_t replacements{0};
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t expirations{0};
  std::uint64_t sweeps{0};
};

} // namespace aged_cache
