#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <thread>

#include <daas/time.hpp>

using namespace daas;
using namespace std::chrono_literals;

TEST_CASE("format_utc", "[time]")
{
   utc_time t = utc_time(std::chrono::seconds(1792411200)) + 123ms;
   REQUIRE(format_utc(t) == "2026-10-19T12:00:00.123Z");
   REQUIRE(format_utc(utc_time{}) == "1970-01-01T00:00:00.000Z");
}

TEST_CASE("parse_utc", "[time]")
{
   auto expected = utc_time(std::chrono::seconds(1792411200));

   SECTION("round trip keeps milliseconds")
   {
      auto t = expected + 7ms;
      REQUIRE(parse_utc(format_utc(t)) == t);
   }

   SECTION("fraction and zone are optional")
   {
      REQUIRE(parse_utc("2026-10-19T12:00:00") == expected);
      REQUIRE(parse_utc("2026-10-19T12:00:00Z") == expected);
      REQUIRE(parse_utc("2026-10-19T12:00:00.5Z") == expected + 500ms);
      // digits beyond milliseconds are dropped
      REQUIRE(parse_utc("2026-10-19T12:00:00.1234567Z") == expected + 123ms);
   }

   SECTION("garbage is rejected")
   {
      REQUIRE_FALSE(parse_utc(""));
      REQUIRE_FALSE(parse_utc("yesterday"));
      REQUIRE_FALSE(parse_utc("2026-13-19T12:00:00Z"));
      REQUIRE_FALSE(parse_utc("2026-10-19T12:00:00.Z"));
      REQUIRE_FALSE(parse_utc("2026-10-19T12:00:00+02:00"));
      REQUIRE_FALSE(parse_utc("2026-10-19T12:00:00Zjunk"));
   }

   SECTION("days a month does not have are rejected")
   {
      REQUIRE_FALSE(parse_utc("2026-02-31T12:00:00Z"));
      REQUIRE_FALSE(parse_utc("2026-02-29T00:00:00Z"));
      REQUIRE_FALSE(parse_utc("2026-04-31T00:00:00Z"));
      REQUIRE(parse_utc("2028-02-29T00:00:00Z"));
      REQUIRE(parse_utc("2026-12-31T23:59:59.999Z"));
   }
}

TEST_CASE("manual_clock", "[time]")
{
   auto         start = utc_time(std::chrono::seconds(1792411200));
   manual_clock clk(start);

   REQUIRE(clk.now() == start);
   std::this_thread::sleep_for(2ms);
   REQUIRE(clk.now() == start);

   clk.advance(90s);
   REQUIRE(clk.now() == start + 90s);

   clk.set(start);
   REQUIRE(clk.now() == start);
}
