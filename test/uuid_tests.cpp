#include <catch2/catch_test_macros.hpp>
#include <core/uuid.hpp>
#include <string>

using draft_uuid::core::parse_uuid;
using draft_uuid::core::uint128_t;
using draft_uuid::core::uuid;
using draft_uuid::core::variant;

namespace {

auto from_hex(const std::string &hex) -> uuid
{
  auto parsed = parse_uuid(hex);
  REQUIRE(parsed.has_value());
  return parsed.value_or(uuid{});
}

}// namespace

TEST_CASE("uuid exposes the standard fields", "[uuid][fields]")
{
  const auto value = from_hex("1EC9414C-232A-6B00-B3C8-9E6BDECED846");

  CHECK(value.time_low() == 0x1EC9414CU);
  CHECK(value.time_mid() == 0x232AU);
  CHECK(value.time_hi_version() == 0x6B00U);
  CHECK(value.clock_seq_hi_variant() == 0xB3U);
  CHECK(value.clock_seq_low() == 0xC8U);
  CHECK(value.node() == 0x9E6BDECED846ULL);
}

TEST_CASE("uuid reports variant and version", "[uuid][variant]")
{
  SECTION("RFC 4122 variant carries a version")
  {
    const auto value = from_hex("017f21cf-d130-7cc3-98c4-dc0c0c07398f");
    CHECK(value.get_variant() == variant::rfc_4122);
    REQUIRE(value.version().has_value());
    CHECK(value.version().value_or(0) == 7);
  }

  SECTION("NCS variant has no version")
  {
    const uuid value{ uint128_t(0) };
    CHECK(value.get_variant() == variant::ncs);
    CHECK_FALSE(value.version().has_value());
  }

  SECTION("Microsoft variant has no version")
  {
    const auto value = from_hex("00000000-0000-1000-c000-000000000000");
    CHECK(value.get_variant() == variant::microsoft);
    CHECK_FALSE(value.version().has_value());
  }

  SECTION("future variant")
  {
    const auto value = from_hex("00000000-0000-1000-e000-000000000000");
    CHECK(value.get_variant() == variant::future);
  }
}

TEST_CASE("uuid renders canonical text", "[uuid][string]")
{
  SECTION("nil uuid")
  {
    const uuid value{};
    CHECK(value.to_string() == "00000000-0000-0000-0000-000000000000");
  }

  SECTION("leading zero bytes are kept")
  {
    const uuid value{ uint128_t(0xABCDU) };
    CHECK(value.to_string() == "00000000-0000-0000-0000-00000000abcd");
  }

  SECTION("parsed text renders in lower case")
  {
    CHECK(from_hex("C232AB00-9414-11EC-B3C8-9E6BDECED846").to_string() == "c232ab00-9414-11ec-b3c8-9e6bdeced846");
  }

  SECTION("braced form is accepted")
  {
    CHECK(from_hex("{c232ab00-9414-11ec-b3c8-9e6bdeced846}").to_string() == "c232ab00-9414-11ec-b3c8-9e6bdeced846");
  }
}

TEST_CASE("parse_uuid rejects malformed text", "[uuid][string]")
{
  CHECK_FALSE(parse_uuid("").has_value());
  CHECK_FALSE(parse_uuid("not-a-uuid").has_value());
  CHECK_FALSE(parse_uuid("c232ab00-9414-11ec-b3c8-9e6bdeced84").has_value());
  CHECK_FALSE(parse_uuid("g232ab00-9414-11ec-b3c8-9e6bdeced846").has_value());
}

TEST_CASE("uuid bytes are big endian", "[uuid][bytes]")
{
  const auto bytes = from_hex("00112233-4455-6677-8899-aabbccddeeff").bytes();

  for (std::size_t i = 0; i < bytes.size(); ++i) { CHECK(bytes.at(i) == static_cast<std::uint8_t>(i * 0x11U)); }
}

TEST_CASE("uuid ordering follows the integer value", "[uuid][ordering]")
{
  const auto lower = from_hex("1ec9414c-232a-6b00-b3c8-9e6bdeced846");
  const auto higher = from_hex("1ec9414c-232a-6b01-0000-000000000000");

  CHECK(lower < higher);
  CHECK_FALSE(higher < lower);
  CHECK(lower == from_hex("1EC9414C-232A-6B00-B3C8-9E6BDECED846"));
}
