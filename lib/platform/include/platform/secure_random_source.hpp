#pragma once

#include <cstdint>

namespace draft_uuid::platform {

/**
 * @brief Cryptographically secure random bits.
 *
 * Draws from boost::uuids::random_generator, which is seeded from the
 * operating system entropy source. One generator per thread.
 */
class secure_random_source
{
public:
  static constexpr unsigned max_bits = 64;

  /**
   * @brief Returns a uniformly distributed value in [0, 2^bits).
   *
   * @param bits Number of random bits, at most 64
   * @return Random value
   * @throws std::invalid_argument if bits exceeds 64
   */
  [[nodiscard]] auto random_bits(unsigned bits) const -> std::uint64_t;
};

}// namespace draft_uuid::platform
