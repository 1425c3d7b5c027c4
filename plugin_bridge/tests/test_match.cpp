#include <plugin_bridge/events/match.hpp>
#include <plugin_bridge/events/pckn.hpp>

#include <catch2/catch.hpp>
#include <cstdint>

using namespace plugin_bridge;

TEST_CASE("match all matches everything", "[match]")
{
  auto all = match16::all();
  REQUIRE(all.is_all());
  REQUIRE(match16().is_all());
  REQUIRE(all.matches(match16::all()));
  REQUIRE(all.matches(match16::specific(0)));
  REQUIRE(all.matches(match16::specific(4242)));
  REQUIRE(match16::specific(7).matches(all));
}

TEST_CASE("match specific compares values", "[match]")
{
  REQUIRE(match32::specific(5).matches(match32::specific(5)));
  REQUIRE_FALSE(match32::specific(5).matches(match32::specific(6)));
  REQUIRE(match32(5u) == match32::specific(5));
  REQUIRE(match32::specific(5).value() == 5u);
  REQUIRE_FALSE(match32::all().value().has_value());
  REQUIRE(match32::all().value_or(9) == 9u);
}

TEST_CASE("match equality is structural", "[match]")
{
  REQUIRE(match16::all() == match16::all());
  REQUIRE(match16::all() != match16::specific(0));
  REQUIRE(match16::specific(3) != match16::specific(4));
}

TEST_CASE("match raw encoding", "[match]")
{
  SECTION("negative raw values are wildcards")
  {
    REQUIRE(match16::from_raw(-1).is_all());
    REQUIRE(match16::from_raw(-2).is_all());
    REQUIRE(match16::from_raw(INT16_MIN).is_all());
    REQUIRE(match32::from_raw(-1).is_all());
    REQUIRE(match32::from_raw(INT32_MIN).is_all());
  }

  SECTION("wildcard encodes as -1")
  {
    REQUIRE(match16::all().to_raw() == -1);
    REQUIRE(match32::all().to_raw() == -1);
  }

  SECTION("values representable in the signed width survive")
  {
    for (std::int32_t v : { 0, 1, 60, 127, 1000, INT16_MAX })
    {
      auto m = match16::specific(static_cast<std::uint16_t>(v));
      REQUIRE(m.to_raw() == v);
      REQUIRE(match16::from_raw(m.to_raw()) == m);
    }
  }
}

TEST_CASE("pckn match all matches everything", "[pckn]")
{
  auto all = pckn::match_all();
  REQUIRE(all.matches(pckn(0, 0, 60, 5)));
  REQUIRE(all.matches(pckn(3, 15, 127, match32::all())));
  REQUIRE(pckn(1, 2, 3, 4).matches(all));
}

TEST_CASE("pckn matches field by field", "[pckn]")
{
  pckn voice(0, 0, 60, 5);
  REQUIRE(voice.matches(pckn(0, 0, 60, match32::all())));
  REQUIRE_FALSE(voice.matches(pckn(0, 1, 60, match32::all())));
  REQUIRE_FALSE(voice.matches(pckn(1, 0, 60, 5)));
  REQUIRE_FALSE(voice.matches(pckn(0, 0, 61, 5)));
  REQUIRE(voice.matches(pckn(match16::all(), match16::all(), 60, match32::all())));
}

TEST_CASE("pckn raw fields", "[pckn]")
{
  auto address = pckn::from_raw(0, -1, 60, -1);
  REQUIRE(address.port == match16::specific(0));
  REQUIRE(address.channel.is_all());
  REQUIRE(address.key == match16::specific(60));
  REQUIRE(address.note_id.is_all());
  REQUIRE(address.raw_port() == 0);
  REQUIRE(address.raw_channel() == -1);
  REQUIRE(address.raw_key() == 60);
  REQUIRE(address.raw_note_id() == -1);
  REQUIRE(pckn::from_raw(address.raw_port(), address.raw_channel(), address.raw_key(), address.raw_note_id()) == address);
}
