#include <core/clock_state.hpp>

#include <limits>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace draft_uuid::core {

auto clock_state::advance(generator_kind kind, std::uint64_t candidate) -> std::uint64_t
{
  const std::scoped_lock lock(mutex_);

  auto &last = watermarks_.at(slot(kind));
  if (last.has_value() and candidate <= *last) {
    if (*last == std::numeric_limits<std::uint64_t>::max()) {
      throw std::overflow_error("clock watermark cannot advance past the largest timestamp");
    }
    spdlog::debug("clock did not advance for v{} (candidate {}, last {}), bumping",
      kind == generator_kind::v6 ? 6 : 7,
      candidate,
      *last);
    candidate = *last + 1;
  }

  last = candidate;
  return candidate;
}

auto clock_state::watermark(generator_kind kind) const -> std::optional<std::uint64_t>
{
  const std::scoped_lock lock(mutex_);
  return watermarks_.at(slot(kind));
}

}// namespace draft_uuid::core
