#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <core/uuid.hpp>
#include <cstdint>
#include <optional>

namespace draft_uuid::core {

/**
 * @brief Builds a UUID from an arbitrary-precision integer.
 *
 * Without a version the integer is taken verbatim. With a version, the two
 * variant bits are forced to the RFC 4122 pattern (10) and the version nibble
 * is replaced; the caller is expected to have laid the payload out around
 * those positions.
 *
 * @param value Integer in [0, 2^128)
 * @param version Optional version tag, 6 or 7
 * @return The constructed UUID
 * @throws std::range_error if value is out of range or version is not 6 or 7
 */
[[nodiscard]] auto make_uuid(const boost::multiprecision::cpp_int &value, std::optional<int> version = std::nullopt)
  -> uuid;

/**
 * @brief Packs a 60-bit UUID-epoch timestamp, clock sequence and node into a v6 UUID.
 *
 * The field is 60 bits wide, so timestamps wrap to zero during the year 5236.
 *
 * @param timestamp 100-ns ticks since 1582-10-15, lower 60 bits used
 * @param clock_seq Clock sequence, lower 14 bits used
 * @param node Node bits, lower 48 bits used
 */
[[nodiscard]] auto pack_v6(std::uint64_t timestamp, std::uint16_t clock_seq, std::uint64_t node) -> uuid;

/**
 * @brief Packs Unix nanoseconds and random bits into a v7 UUID.
 *
 * Seconds occupy the top 36 bits; the sub-second remainder is encoded as a
 * 30-bit binary fraction split 12/12/6 around the version and variant bits.
 *
 * @param nanoseconds Nanoseconds since the Unix epoch
 * @param random Random tail, lower 56 bits used
 */
[[nodiscard]] auto pack_v7(std::uint64_t nanoseconds, std::uint64_t random) -> uuid;

/**
 * @brief Converts Unix nanoseconds to 100-ns ticks since the UUID epoch (1582-10-15).
 */
[[nodiscard]] constexpr auto unix_ns_to_uuid_ticks(std::uint64_t nanoseconds) -> std::uint64_t
{
  constexpr std::uint64_t uuid_epoch_offset = 0x01B21DD213814000ULL;
  constexpr std::uint64_t ns_per_tick = 100;
  return nanoseconds / ns_per_tick + uuid_epoch_offset;
}

/**
 * @brief Sub-second nanoseconds to a 30-bit fraction, truncating.
 */
[[nodiscard]] constexpr auto subsec_encode(std::uint32_t nanoseconds) -> std::uint32_t
{
  return static_cast<std::uint32_t>((static_cast<std::uint64_t>(nanoseconds) << 30U) / 1'000'000'000ULL);
}

/**
 * @brief 30-bit fraction back to nanoseconds, rounding up.
 */
[[nodiscard]] constexpr auto subsec_decode(std::uint32_t fraction) -> std::uint32_t
{
  constexpr std::uint64_t one = 1;
  return static_cast<std::uint32_t>(
    (static_cast<std::uint64_t>(fraction) * 1'000'000'000ULL + (one << 30U) - 1) >> 30U);
}

}// namespace draft_uuid::core
