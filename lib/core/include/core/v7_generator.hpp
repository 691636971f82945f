#pragma once

#include <concepts/random_source.hpp>
#include <concepts/time_source.hpp>
#include <core/bit_layout.hpp>
#include <core/clock_state.hpp>
#include <core/uuid.hpp>
#include <cstdint>
#include <memory>
#include <utility>

namespace draft_uuid::core {

/**
 * @brief Generates version 7 UUIDs.
 *
 * Unix seconds plus a binary sub-second fraction, so a parser with a
 * different sub-second precision still orders UUIDs correctly down to the
 * coarser of the two precisions.
 *
 * @tparam Time Type satisfying the time_source concept
 * @tparam Random Type satisfying the random_source concept
 */
template<concepts::time_source Time, concepts::random_source Random> class v7_generator
{
public:
  static constexpr unsigned tail_bits = 56;

  v7_generator(std::shared_ptr<clock_state> state, std::shared_ptr<Time> time, std::shared_ptr<Random> random)
    : state_(std::move(state)), time_(std::move(time)), random_(std::move(random))
  {}

  [[nodiscard]] auto generate() -> uuid
  {
    const auto nanoseconds = state_->advance(generator_kind::v7, time_->now_ns());
    return pack_v7(nanoseconds, static_cast<std::uint64_t>(random_->random_bits(tail_bits)));
  }

private:
  std::shared_ptr<clock_state> state_;
  std::shared_ptr<Time> time_;
  std::shared_ptr<Random> random_;
};

}// namespace draft_uuid::core
