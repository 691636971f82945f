#pragma once

#include <core/bit_layout.hpp>
#include <core/field_reader.hpp>
#include <core/uuid.hpp>
#include <cstdint>
#include <optional>

namespace draft_uuid {

/**
 * @brief Generates a version 6 UUID from the system clock.
 *
 * Shares a process-wide clock state with every other call, so successive
 * UUIDs carry strictly increasing timestamps.
 *
 * @param clock_seq Clock sequence (lower 14 bits); random if not given
 */
[[nodiscard]] auto generate_v6(std::optional<std::uint16_t> clock_seq = std::nullopt) -> core::uuid;

/**
 * @brief Generates a version 7 UUID from the system clock.
 */
[[nodiscard]] auto generate_v7() -> core::uuid;

}// namespace draft_uuid
