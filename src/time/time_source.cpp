#include "aged_cache/time_source.hpp"

namespace aged_cache {

EpochMillis SystemTimeSource::now_ms() const {
  return to_epoch_ms(Clock::now());
}

ManualTimeSource::ManualTimeSource() : now_ms_(to_epoch_ms(Clock::now())) {}

ManualTimeSource::ManualTimeSource(EpochMillis start_ms) : now_ms_(start_ms) {}

std::unique_ptr<ITimeSource> make_time_source_by_name(const std::string &mode) {
  if (mode == "manual")
    return std::make_unique<ManualTimeSource>();
  return std::make_unique<SystemTimeSource>();
}

} // namespace aged_cache
