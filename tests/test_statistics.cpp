/**
 * @file test_statistics.cpp
 * @brief Tests for statistics.hpp
 */

#include "scon/statistics.hpp"

#include <catch2/catch_test_macros.hpp>

TEST_CASE("Statistics start at zero", "[statistics]") {
  scon::StatisticsAggregator agg(1000U);
  const scon::Statistics& s = agg.Get();
  REQUIRE(s.bytes_received == 0U);
  REQUIRE(s.bytes_sent == 0U);
  REQUIRE(s.messages_received == 0U);
  REQUIRE(s.session_start_ms == 1000U);
}

TEST_CASE("Statistics counters accumulate", "[statistics]") {
  scon::StatisticsAggregator agg(0U);
  agg.AddReceived(10U);
  agg.AddReceived(5U);
  agg.AddSent(6U);
  agg.AddMessage();
  agg.AddMessage();
  REQUIRE(agg.Get().bytes_received == 15U);
  REQUIRE(agg.Get().bytes_sent == 6U);
  REQUIRE(agg.Get().messages_received == 2U);
}

TEST_CASE("Statistics uptime is floored seconds", "[statistics]") {
  scon::StatisticsAggregator agg(5000U);
  REQUIRE(agg.UptimeSeconds(5000U) == 0U);
  REQUIRE(agg.UptimeSeconds(5999U) == 0U);
  REQUIRE(agg.UptimeSeconds(6000U) == 1U);
  REQUIRE(agg.UptimeSeconds(65500U) == 60U);
  REQUIRE(agg.UptimeSeconds(1000U) == 0U);
}

TEST_CASE("Statistics rates use max(1, uptime)", "[statistics]") {
  scon::StatisticsAggregator agg(0U);
  agg.AddReceived(300U);
  agg.AddSent(30U);
  REQUIRE(agg.RxRate(500U) == 300.0);
  REQUIRE(agg.TxRate(500U) == 30.0);
  REQUIRE(agg.RxRate(3000U) == 100.0);
  REQUIRE(agg.TxRate(3000U) == 10.0);
}
