#pragma once

#include <core/uuid.hpp>
#include <cstdint>

namespace draft_uuid::core {

/**
 * @brief Embedded timestamp of a UUID.
 *
 * - v6: 60-bit count of 100-ns ticks since 1582-10-15
 * - v7: nanoseconds since the Unix epoch
 * - otherwise: the RFC 4122 version 1 time field
 *
 * @param value UUID to inspect
 * @return Timestamp in the unit of the UUID's version
 */
[[nodiscard]] auto time(const uuid &value) -> uint128_t;

/**
 * @brief 30-bit sub-second fraction of a v7 UUID.
 */
[[nodiscard]] auto subsec(const uuid &value) -> std::uint32_t;

/**
 * @brief Top 36 bits of the UUID (Unix seconds for v7).
 */
[[nodiscard]] auto unixts(const uuid &value) -> std::uint64_t;

[[nodiscard]] auto clock_seq(const uuid &value) -> std::uint16_t;

}// namespace draft_uuid::core
