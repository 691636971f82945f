#pragma once

#include <concepts/random_source.hpp>
#include <concepts/time_source.hpp>
#include <core/bit_layout.hpp>
#include <core/clock_state.hpp>
#include <core/uuid.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

namespace draft_uuid::core {

/**
 * @brief Generates version 6 UUIDs.
 *
 * The 60-bit timestamp counts 100-ns ticks since 1582-10-15 and is stored
 * most significant bits first, so UUIDs sort in generation order. The node
 * is random on every call rather than a host identifier.
 * Ticks past 60 bits (after 5236) are truncated by pack_v6 and no longer sort.
 *
 * @tparam Time Type satisfying the time_source concept
 * @tparam Random Type satisfying the random_source concept
 */
template<concepts::time_source Time, concepts::random_source Random> class v6_generator
{
public:
  static constexpr unsigned clock_seq_bits = 14;
  static constexpr unsigned node_bits = 48;

  v6_generator(std::shared_ptr<clock_state> state, std::shared_ptr<Time> time, std::shared_ptr<Random> random)
    : state_(std::move(state)), time_(std::move(time)), random_(std::move(random))
  {}

  /**
   * @brief Generates a UUID from the current time.
   *
   * @param clock_seq Clock sequence to embed (lower 14 bits); random if not given
   * @return Version 6 UUID
   */
  [[nodiscard]] auto generate(std::optional<std::uint16_t> clock_seq = std::nullopt) -> uuid
  {
    const auto ticks = state_->advance(generator_kind::v6, unix_ns_to_uuid_ticks(time_->now_ns()));

    const auto sequence =
      clock_seq.has_value() ? *clock_seq : static_cast<std::uint16_t>(random_->random_bits(clock_seq_bits));
    const auto node = static_cast<std::uint64_t>(random_->random_bits(node_bits));

    return pack_v6(ticks, sequence, node);
  }

private:
  std::shared_ptr<clock_state> state_;
  std::shared_ptr<Time> time_;
  std::shared_ptr<Random> random_;
};

}// namespace draft_uuid::core
