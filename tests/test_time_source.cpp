#include "aged_cache/time_source.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace aged_cache;

TEST_CASE("manual source holds still until moved", "[clock]") {
  ManualTimeSource src(1000);
  CHECK(src.now_ms() == 1000);
  CHECK(src.now_ms() == 1000);
  src.advance(250);
  CHECK(src.now_ms() == 1250);
  src.set(42);
  CHECK(src.now_ms() == 42);
  src.advance(-2);
  CHECK(src.now_ms() == 40);
}

TEST_CASE("default manual source starts near wall clock", "[clock]") {
  const auto before = to_epoch_ms(Clock::now());
  ManualTimeSource src;
  const auto after = to_epoch_ms(Clock::now());
  CHECK(src.now_ms() >= before);
  CHECK(src.now_ms() <= after);
}

TEST_CASE("system source is monotone enough across reads", "[clock]") {
  SystemTimeSource src;
  const auto a = src.now_ms();
  const auto b = src.now_ms();
  CHECK(a > 0);
  CHECK(b >= a - 1000);
}

TEST_CASE("factory picks sources by name", "[clock]") {
  CHECK(make_time_source_by_name("manual")->name() == "manual");
  CHECK(make_time_source_by_name("system")->name() == "system");
  CHECK(make_time_source_by_name("bogus")->name() == "system");
}
