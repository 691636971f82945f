#include <draft_uuid/draft_uuid.hpp>

#include <core/clock_state.hpp>
#include <core/v6_generator.hpp>
#include <core/v7_generator.hpp>
#include <memory>
#include <platform/secure_random_source.hpp>
#include <platform/system_time_source.hpp>

namespace draft_uuid {

namespace {

  using time_source_t = platform::system_time_source;
  using random_source_t = platform::secure_random_source;

  struct default_generators
  {
    std::shared_ptr<core::clock_state> state = std::make_shared<core::clock_state>();
    std::shared_ptr<time_source_t> time = std::make_shared<time_source_t>();
    std::shared_ptr<random_source_t> random = std::make_shared<random_source_t>();
    core::v6_generator<time_source_t, random_source_t> v6{ state, time, random };
    core::v7_generator<time_source_t, random_source_t> v7{ state, time, random };
  };

  auto defaults() -> default_generators &
  {
    static default_generators generators;
    return generators;
  }

}// namespace

auto generate_v6(std::optional<std::uint16_t> clock_seq) -> core::uuid { return defaults().v6.generate(clock_seq); }

auto generate_v7() -> core::uuid { return defaults().v7.generate(); }

}// namespace draft_uuid
