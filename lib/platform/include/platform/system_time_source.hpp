#pragma once

#include <cstdint>

namespace draft_uuid::platform {

/**
 * @brief Wall-clock time source backed by std::chrono::system_clock.
 */
class system_time_source
{
public:
  /**
   * @brief Returns the current time.
   *
   * @return Nanoseconds since the Unix epoch
   */
  [[nodiscard]] auto now_ns() const -> std::uint64_t;
};

}// namespace draft_uuid::platform
