#pragma once

#include "aged_cache/types.hpp"

#include <memory>
#include <string>

namespace aged_cache {

class ITimeSource {
public:
  virtual ~ITimeSource() = default;
  virtual std::string name() const = 0;
  virtual EpochMillis now_ms() const = 0;
};

class SystemTimeSource final : public ITimeSource {
public:
  std::string name() const override { return "system"; }
  EpochMillis now_ms() const override;
};

// Holds a fixed instant until told otherwise. Starts at the wall clock
// reading taken at construction unless an explicit start is given.
class ManualTimeSource final : public ITimeSource {
public:
  ManualTimeSource();
  explicit ManualTimeSource(EpochMillis start_ms);

  std::string name() const override { return "manual"; }
  EpochMillis now_ms() const override { return now_ms_; }

  void set(EpochMillis ms) { now_ms_ = ms; }
  void advance(std::int64_t delta_ms) { now_ms_ += delta_ms; }

private:
  EpochMillis now_ms_;
};

std::unique_ptr<ITimeSource> make_time_source_by_name(const std::string &mode);

} // namespace aged_cache
