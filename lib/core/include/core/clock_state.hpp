#pragma once

#include <array>
#include <cstdint>
#include <mutex>
#include <optional>

namespace draft_uuid::core {

enum class generator_kind : std::uint8_t { v6, v7 };

/**
 * @brief Last-issued timestamp watermarks, one per generator kind.
 *
 * Guarantees that for a given kind the values returned by advance() are
 * strictly increasing, whatever the candidates passed in. Thread-safe.
 */
class clock_state
{
public:
  clock_state() = default;
  clock_state(const clock_state &) = delete;
  auto operator=(const clock_state &) -> clock_state & = delete;
  clock_state(clock_state &&) = delete;
  auto operator=(clock_state &&) -> clock_state & = delete;
  ~clock_state() = default;

  /**
   * @brief Issues the next timestamp for a generator kind.
   *
   * @param kind Generator whose watermark is consulted
   * @param candidate Timestamp read from the time source
   * @return candidate if it is past the watermark, otherwise watermark + 1
   * @throws std::overflow_error if the watermark is already the largest value; the watermark is left unchanged
   */
  [[nodiscard]] auto advance(generator_kind kind, std::uint64_t candidate) -> std::uint64_t;

  [[nodiscard]] auto watermark(generator_kind kind) const -> std::optional<std::uint64_t>;

private:
  static auto slot(generator_kind kind) -> std::size_t { return static_cast<std::size_t>(kind); }

  mutable std::mutex mutex_;
  std::array<std::optional<std::uint64_t>, 2> watermarks_;
};

}// namespace draft_uuid::core
