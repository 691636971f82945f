#pragma once

#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace draft_uuid::core {

using uint128_t = boost::multiprecision::uint128_t;

enum class variant : std::uint8_t { ncs, rfc_4122, microsoft, future };

/**
 * @brief Immutable 128-bit UUID value.
 *
 * Field accessors follow the 8-4-4-4-12 grouping of RFC 4122. Textual
 * rendering and parsing are delegated to Boost.UUID.
 */
class uuid
{
public:
  uuid() = default;
  explicit uuid(const uint128_t &value) : value_(value) {}

  [[nodiscard]] auto value() const -> const uint128_t & { return value_; }

  [[nodiscard]] auto time_low() const -> std::uint32_t;
  [[nodiscard]] auto time_mid() const -> std::uint16_t;
  [[nodiscard]] auto time_hi_version() const -> std::uint16_t;
  [[nodiscard]] auto clock_seq_hi_variant() const -> std::uint8_t;
  [[nodiscard]] auto clock_seq_low() const -> std::uint8_t;
  [[nodiscard]] auto node() const -> std::uint64_t;

  [[nodiscard]] auto get_variant() const -> variant;

  /**
   * @brief Version nibble, only meaningful for the RFC 4122 variant.
   *
   * @return Version number, or std::nullopt for other variants
   */
  [[nodiscard]] auto version() const -> std::optional<int>;

  /**
   * @brief Big-endian byte representation.
   */
  [[nodiscard]] auto bytes() const -> std::array<std::uint8_t, 16>;

  /**
   * @brief Canonical lowercase 8-4-4-4-12 hexadecimal rendering.
   */
  [[nodiscard]] auto to_string() const -> std::string;

  friend auto operator==(const uuid &lhs, const uuid &rhs) -> bool { return lhs.value_ == rhs.value_; }
  friend auto operator<(const uuid &lhs, const uuid &rhs) -> bool { return lhs.value_ < rhs.value_; }

private:
  uint128_t value_{ 0 };
};

/**
 * @brief Parses a UUID from text.
 *
 * Accepts the forms understood by boost::uuids::string_generator (canonical,
 * braced, upper or lower case hex).
 *
 * @param text UUID text
 * @return Parsed UUID, or std::nullopt if the text is not a UUID
 */
[[nodiscard]] auto parse_uuid(std::string_view text) -> std::optional<uuid>;

}// namespace draft_uuid::core
