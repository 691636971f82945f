#include <catch2/benchmark/catch_benchmark.hpp>
#include <catch2/catch_test_macros.hpp>
#include <core/bit_layout.hpp>
#include <core/field_reader.hpp>
#include <core/uuid.hpp>
#include <draft_uuid/draft_uuid.hpp>

namespace draft_uuid::test {

TEST_CASE("UUID generation benchmarks", "[benchmark][generator]")
{
  BENCHMARK("generate_v6") { return draft_uuid::generate_v6(); };

  BENCHMARK("generate_v7") { return draft_uuid::generate_v7(); };

  BENCHMARK("generate_v7 and render") { return draft_uuid::generate_v7().to_string(); };
}

TEST_CASE("UUID decoding benchmarks", "[benchmark][field_reader]")
{
  const auto uuid_6 = core::pack_v6(0x1EC9414C232AB00ULL, 0xB3C8U, 0x9E6BDECED846ULL);
  const auto uuid_7 = core::pack_v7(1645539742123456789ULL, 0x123456789ABCDEULL);

  BENCHMARK("time of v6") { return core::time(uuid_6); };

  BENCHMARK("time of v7") { return core::time(uuid_7); };

  BENCHMARK("parse canonical text") { return core::parse_uuid("017f21cf-d130-7cc3-98c4-dc0c0c07398f"); };
}

}// namespace draft_uuid::test
