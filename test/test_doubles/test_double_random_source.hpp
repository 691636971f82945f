#pragma once

#include <cstdint>
#include <vector>

namespace draft_uuid_test {

/**
 * @brief Returns the same value on every call, truncated to the requested width.
 */
class TestDoubleRandomSource
{
public:
  explicit TestDoubleRandomSource(std::uint64_t value) : value_(value) {}

  auto random_bits(unsigned bits) -> std::uint64_t
  {
    requested_bits.push_back(bits);
    if (bits >= 64) { return value_; }
    return value_ & ((std::uint64_t{ 1 } << bits) - 1);
  }

  std::vector<unsigned> requested_bits;

private:
  std::uint64_t value_;
};

}// namespace draft_uuid_test
