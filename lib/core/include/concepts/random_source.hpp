#pragma once

#include <concepts>
#include <cstdint>

namespace draft_uuid::concepts {

template<typename T>
concept random_source = requires(T source, unsigned bits) {
  // Uniform value in [0, 2^bits), bits <= 64
  { source.random_bits(bits) } -> std::convertible_to<std::uint64_t>;
};

}// namespace draft_uuid::concepts
