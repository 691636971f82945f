#include <core/bit_layout.hpp>

#include <stdexcept>

namespace draft_uuid::core {

namespace {

  constexpr unsigned variant_shift = 48;
  constexpr unsigned version_shift = 64;
  constexpr std::uint64_t nanoseconds_per_second = 1'000'000'000ULL;

  auto max_value() -> const boost::multiprecision::cpp_int &
  {
    static const boost::multiprecision::cpp_int max = (boost::multiprecision::cpp_int(1) << 128) - 1;
    return max;
  }

  auto apply_version(uint128_t value, int version) -> uuid
  {
    if (version < 6 or version > 7) { throw std::range_error("illegal version number"); }

    // RFC 4122 variant
    value &= ~(uint128_t(0xC000U) << variant_shift);
    value |= uint128_t(0x8000U) << variant_shift;

    value &= ~(uint128_t(0xF000U) << version_shift);
    value |= uint128_t(static_cast<unsigned>(version)) << 76U;
    return uuid{ value };
  }

}// namespace

auto make_uuid(const boost::multiprecision::cpp_int &value, std::optional<int> version) -> uuid
{
  if (value < 0 or value > max_value()) { throw std::range_error("int is out of range (need a 128-bit value)"); }

  const auto raw = static_cast<uint128_t>(value);
  if (not version.has_value()) { return uuid{ raw }; }
  return apply_version(raw, *version);
}

auto pack_v6(std::uint64_t timestamp, std::uint16_t clock_seq, std::uint64_t node) -> uuid
{
  const auto time_high_and_mid = (timestamp >> 12U) & 0xFFFFFFFFFFFFULL;
  const auto time_low_and_version = timestamp & 0x0FFFULL;

  uint128_t value = uint128_t(time_high_and_mid) << 80U;
  value |= uint128_t(time_low_and_version) << 64U;
  value |= uint128_t(clock_seq & 0x3FFFU) << 48U;
  value |= uint128_t(node & 0xFFFFFFFFFFFFULL);
  return apply_version(value, 6);
}

auto pack_v7(std::uint64_t nanoseconds, std::uint64_t random) -> uuid
{
  const auto timestamp_s = nanoseconds / nanoseconds_per_second;
  const auto timestamp_ns = static_cast<std::uint32_t>(nanoseconds % nanoseconds_per_second);

  const auto subsec = subsec_encode(timestamp_ns);
  const auto subsec_a = subsec >> 18U;
  const auto subsec_b = (subsec >> 6U) & 0x0FFFU;
  const auto subsec_c = subsec & 0x3FU;

  uint128_t value = uint128_t(timestamp_s & 0x0FFFFFFFFFULL) << 92U;
  value |= uint128_t(subsec_a) << 80U;
  value |= uint128_t(subsec_b) << 64U;
  value |= uint128_t(subsec_c) << 56U;
  value |= uint128_t(random & 0xFFFFFFFFFFFFFFULL);
  return apply_version(value, 7);
}

}// namespace draft_uuid::core
