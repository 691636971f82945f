#pragma once

#include <concepts>
#include <cstdint>

namespace draft_uuid::concepts {

template<typename T>
concept time_source = requires(T source) {
  // Nanoseconds since the Unix epoch
  { source.now_ns() } -> std::convertible_to<std::uint64_t>;
};

}// namespace draft_uuid::concepts
