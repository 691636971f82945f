#include <platform/system_time_source.hpp>

#include <chrono>

namespace draft_uuid::platform {

auto system_time_source::now_ns() const -> std::uint64_t
{
  using namespace std::chrono;

  return static_cast<std::uint64_t>(duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count());
}

}// namespace draft_uuid::platform
