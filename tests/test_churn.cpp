#include "aged_cache/aged_cache.hpp"

#include <catch2/catch_test_macros.hpp>

#include <map>
#include <random>

using namespace aged_cache;

TEST_CASE("random churn agrees with a reference model", "[churn]") {
  auto src = std::make_unique<ManualTimeSource>(0);
  auto *clock = src.get();
  AgedCache<int, int> cache(std::move(src));

  struct Ref {
    int value;
    EpochMillis expires_at;
  };
  std::map<int, Ref> model;
  auto live = [&](EpochMillis now) {
    std::size_t n = 0;
    for (const auto &[k, r] : model)
      if (r.expires_at >= now)
        ++n;
    return n;
  };

  std::mt19937_64 rng(42);
  for (int i = 0; i < 5000; ++i) {
    const int key = static_cast<int>(rng() % 64);
    switch (rng() % 4) {
    case 0: {
      const auto retention = static_cast<std::int64_t>(rng() % 200) - 20;
      cache.put(key, i, retention);
      model[key] = {i, clock->now_ms() + retention};
      break;
    }
    case 1: {
      auto got = cache.get(key);
      auto it = model.find(key);
      const bool expect = it != model.end() &&
                          it->second.expires_at >= clock->now_ms();
      REQUIRE(got.has_value() == expect);
      if (expect)
        REQUIRE(*got == it->second.value);
      break;
    }
    case 2:
      REQUIRE(cache.size() == live(clock->now_ms()));
      break;
    default:
      clock->advance(static_cast<std::int64_t>(rng() % 15));
      break;
    }
  }
  REQUIRE(cache.empty() == (live(clock->now_ms()) == 0));
}
