/**
 * @file test_message_filter.cpp
 * @brief Tests for message_filter.hpp
 */

#include "scon/message_filter.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <string>

namespace {

bool Accepts(const scon::MessageFilter& f, const char* line) {
  return f.Accepts(line, static_cast<uint32_t>(std::strlen(line)));
}

}  // namespace

TEST_CASE("MessageFilter disabled accepts everything", "[filter]") {
  scon::MessageFilter f;
  REQUIRE(!f.Enabled());
  REQUIRE(Accepts(f, "anything"));
  REQUIRE(Accepts(f, ""));
}

TEST_CASE("MessageFilter matches case-insensitively", "[filter]") {
  scon::MessageFilter f;
  f.Set("temp");
  REQUIRE(f.Enabled());
  REQUIRE(Accepts(f, "Temperature: 23.5C"));
  REQUIRE(Accepts(f, "CPU TEMP high"));
  REQUIRE(!Accepts(f, "Status OK"));
  REQUIRE(!Accepts(f, "tem"));
}

TEST_CASE("MessageFilter empty text disables", "[filter]") {
  scon::MessageFilter f;
  f.Set("x");
  REQUIRE(f.Enabled());
  f.Set("");
  REQUIRE(!f.Enabled());
  REQUIRE(f.Config().text.empty());
  f.Set(nullptr);
  REQUIRE(!f.Enabled());
}

TEST_CASE("MessageFilter rejects text past its capacity", "[filter]") {
  scon::MessageFilter f;
  REQUIRE(f.Set("temp"));
  const std::string longest(SCON_FILTER_MAX_LEN, 'a');
  const std::string too_long(SCON_FILTER_MAX_LEN + 1U, 'a');
  REQUIRE(scon::MessageFilter::Fits(longest.c_str()));
  REQUIRE(!scon::MessageFilter::Fits(too_long.c_str()));

  REQUIRE(!f.Set(too_long.c_str()));
  REQUIRE(f.Enabled());
  REQUIRE(std::string(f.Config().text.c_str()) == "temp");

  REQUIRE(f.Set(longest.c_str()));
  REQUIRE(f.Config().text.size() == SCON_FILTER_MAX_LEN);
}

TEST_CASE("MessageFilter respects line length", "[filter]") {
  scon::MessageFilter f;
  f.Set("ok");
  // Only the first 3 chars belong to the line.
  REQUIRE(!f.Accepts("abcok", 3U));
  REQUIRE(f.Accepts("abcok", 5U));
}
