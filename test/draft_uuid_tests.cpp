#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <cstddef>
#include <draft_uuid/draft_uuid.hpp>
#include <string>
#include <thread>
#include <vector>

TEST_CASE("generate_v6 produces ordered version 6 UUIDs", "[draft_uuid][v6]")
{
  std::vector<draft_uuid::core::uuid> values;
  for (int i = 0; i < 100; ++i) { values.push_back(draft_uuid::generate_v6()); }

  for (const auto &value : values) {
    CHECK(value.version().value_or(0) == 6);
    CHECK(value.get_variant() == draft_uuid::core::variant::rfc_4122);
  }
  for (std::size_t i = 1; i < values.size(); ++i) {
    CHECK(draft_uuid::core::time(values[i]) > draft_uuid::core::time(values[i - 1]));
  }
}

TEST_CASE("generate_v6 embeds the requested clock sequence", "[draft_uuid][v6]")
{
  const auto value = draft_uuid::generate_v6(0x1234U);

  CHECK(draft_uuid::core::clock_seq(value) == 0x1234U);
}

TEST_CASE("generate_v7 produces ordered version 7 UUIDs", "[draft_uuid][v7]")
{
  std::vector<std::string> rendered;
  for (int i = 0; i < 100; ++i) {
    const auto value = draft_uuid::generate_v7();
    CHECK(value.version().value_or(0) == 7);
    CHECK(value.get_variant() == draft_uuid::core::variant::rfc_4122);
    rendered.push_back(value.to_string());
  }

  CHECK(std::is_sorted(rendered.begin(), rendered.end()));
  CHECK(std::adjacent_find(rendered.begin(), rendered.end()) == rendered.end());
}

TEST_CASE("generate_v7 timestamps never repeat across threads", "[draft_uuid][v7][concurrency]")
{
  constexpr int thread_count = 4;
  constexpr int per_thread = 500;

  std::vector<std::vector<draft_uuid::core::uint128_t>> times(thread_count);
  std::vector<std::thread> threads;
  threads.reserve(thread_count);
  for (int t = 0; t < thread_count; ++t) {
    threads.emplace_back([&times, t]() {
      for (int i = 0; i < per_thread; ++i) {
        times.at(static_cast<std::size_t>(t)).push_back(draft_uuid::core::time(draft_uuid::generate_v7()));
      }
    });
  }
  for (auto &thread : threads) { thread.join(); }

  std::vector<draft_uuid::core::uint128_t> all;
  for (const auto &mine : times) { all.insert(all.end(), mine.begin(), mine.end()); }
  std::sort(all.begin(), all.end());
  CHECK(std::adjacent_find(all.begin(), all.end()) == all.end());
}

TEST_CASE("generate_v6 timestamps never repeat across threads", "[draft_uuid][v6][concurrency]")
{
  constexpr int thread_count = 4;
  constexpr int per_thread = 500;

  std::vector<std::vector<draft_uuid::core::uint128_t>> times(thread_count);
  std::vector<std::thread> threads;
  threads.reserve(thread_count);
  for (int t = 0; t < thread_count; ++t) {
    threads.emplace_back([&times, t]() {
      for (int i = 0; i < per_thread; ++i) {
        times.at(static_cast<std::size_t>(t)).push_back(draft_uuid::core::time(draft_uuid::generate_v6()));
      }
    });
  }
  for (auto &thread : threads) { thread.join(); }

  for (const auto &mine : times) { CHECK(std::is_sorted(mine.begin(), mine.end())); }

  std::vector<draft_uuid::core::uint128_t> all;
  for (const auto &mine : times) { all.insert(all.end(), mine.begin(), mine.end()); }
  std::sort(all.begin(), all.end());
  CHECK(all.size() == static_cast<std::size_t>(thread_count * per_thread));
  CHECK(std::adjacent_find(all.begin(), all.end()) == all.end());
}
