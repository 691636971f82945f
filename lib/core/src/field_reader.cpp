#include <core/field_reader.hpp>

#include <core/bit_layout.hpp>

namespace draft_uuid::core {

auto subsec(const uuid &value) -> std::uint32_t
{
  return (static_cast<std::uint32_t>(value.time_mid() & 0x0FFFU) << 18U)
         | (static_cast<std::uint32_t>(value.time_hi_version() & 0x0FFFU) << 6U)
         | (static_cast<std::uint32_t>(value.clock_seq_hi_variant()) & 0x3FU);
}

auto unixts(const uuid &value) -> std::uint64_t
{
  return (static_cast<std::uint64_t>(value.time_low()) << 4U) | (static_cast<std::uint64_t>(value.time_mid()) >> 12U);
}

auto clock_seq(const uuid &value) -> std::uint16_t
{
  return static_cast<std::uint16_t>(
    (static_cast<unsigned>(value.clock_seq_hi_variant() & 0x3FU) << 8U) | value.clock_seq_low());
}

auto time(const uuid &value) -> uint128_t
{
  const auto version = value.version();

  if (version == 6) {
    return (uint128_t(value.time_low()) << 28U) | (uint128_t(value.time_mid()) << 12U)
           | uint128_t(value.time_hi_version() & 0x0FFFU);
  }

  if (version == 7) {
    constexpr std::uint64_t nanoseconds_per_second = 1'000'000'000ULL;
    return uint128_t(unixts(value)) * nanoseconds_per_second + subsec_decode(subsec(value));
  }

  return (uint128_t(value.time_hi_version() & 0x0FFFU) << 48U) | (uint128_t(value.time_mid()) << 32U)
         | uint128_t(value.time_low());
}

}// namespace draft_uuid::core
