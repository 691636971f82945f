#include <core/uuid.hpp>

#include <algorithm>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <stdexcept>

namespace draft_uuid::core {

namespace {

  constexpr std::size_t uuid_size = 16;
  constexpr unsigned bits_per_byte = 8;

  auto to_boost(const uuid &value) -> boost::uuids::uuid
  {
    const auto bytes = value.bytes();
    boost::uuids::uuid result{};
    std::copy(bytes.begin(), bytes.end(), result.begin());
    return result;
  }

}// namespace

auto uuid::time_low() const -> std::uint32_t
{
  return static_cast<std::uint32_t>((value_ >> 96) & 0xFFFFFFFFU);
}

auto uuid::time_mid() const -> std::uint16_t
{
  return static_cast<std::uint16_t>((value_ >> 80) & 0xFFFFU);
}

auto uuid::time_hi_version() const -> std::uint16_t
{
  return static_cast<std::uint16_t>((value_ >> 64) & 0xFFFFU);
}

auto uuid::clock_seq_hi_variant() const -> std::uint8_t
{
  return static_cast<std::uint8_t>((value_ >> 56) & 0xFFU);
}

auto uuid::clock_seq_low() const -> std::uint8_t { return static_cast<std::uint8_t>((value_ >> 48) & 0xFFU); }

auto uuid::node() const -> std::uint64_t { return static_cast<std::uint64_t>(value_ & 0xFFFFFFFFFFFFULL); }

auto uuid::get_variant() const -> variant
{
  const auto hi = clock_seq_hi_variant();
  if ((hi & 0x80U) == 0) { return variant::ncs; }
  if ((hi & 0x40U) == 0) { return variant::rfc_4122; }
  if ((hi & 0x20U) == 0) { return variant::microsoft; }
  return variant::future;
}

auto uuid::version() const -> std::optional<int>
{
  if (get_variant() != variant::rfc_4122) { return std::nullopt; }
  return static_cast<int>((time_hi_version() >> 12) & 0x0FU);
}

auto uuid::bytes() const -> std::array<std::uint8_t, 16>
{
  std::array<std::uint8_t, uuid_size> result{};
  for (std::size_t i = 0; i < uuid_size; ++i) {
    const auto shift = static_cast<unsigned>((uuid_size - 1 - i) * bits_per_byte);
    result.at(i) = static_cast<std::uint8_t>((value_ >> shift) & 0xFFU);
  }
  return result;
}

auto uuid::to_string() const -> std::string { return boost::uuids::to_string(to_boost(*this)); }

auto parse_uuid(std::string_view text) -> std::optional<uuid>
{
  boost::uuids::uuid parsed{};
  try {
    parsed = boost::uuids::string_generator{}(std::string(text));
  } catch (const std::runtime_error &) {
    return std::nullopt;
  }

  uint128_t value{ 0 };
  for (const auto byte : parsed) { value = (value << bits_per_byte) | byte; }
  return uuid{ value };
}

}// namespace draft_uuid::core
