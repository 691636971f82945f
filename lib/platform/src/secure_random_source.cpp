#include <platform/secure_random_source.hpp>

#include <array>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <fmt/format.h>
#include <stdexcept>

namespace draft_uuid::platform {

namespace {

  // Bytes of a v4 UUID that carry no version or variant bits.
  constexpr std::array<std::size_t, 8> untagged_bytes = { 0, 1, 2, 3, 4, 5, 10, 11 };

}// namespace

auto secure_random_source::random_bits(unsigned bits) const -> std::uint64_t
{
  if (bits > max_bits) { throw std::invalid_argument(fmt::format("cannot draw {} random bits (max {})", bits, max_bits)); }
  if (bits == 0) { return 0; }

  static thread_local boost::uuids::random_generator gen;
  const auto entropy = gen();

  std::uint64_t value = 0;
  for (const auto index : untagged_bytes) { value = (value << 8U) | entropy.data[index]; }// NOLINT

  if (bits == max_bits) { return value; }
  return value & ((std::uint64_t{ 1 } << bits) - 1);
}

}// namespace draft_uuid::platform
