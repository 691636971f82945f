#pragma once

#include <CLI/CLI.hpp>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace draft_uuid::cli_utils {

struct cli_args
{
  int uuid_version = 7;
  std::size_t count = 1;
  std::optional<std::uint16_t> clock_seq;
  bool verbose = false;
  bool show_version = false;

  bool decode_parsed = false;
  std::vector<std::string> decode_inputs;
};

inline constexpr std::uint16_t max_clock_seq = 0x3FFF;

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void;

inline auto parse_cli_args(int argc, char **argv) -> cli_args
{
  cli_args args;
  CLI::App app{ "Draft UUID - time-ordered version 6 and 7 UUIDs", "draft-uuid" };

  setup_cli_app(app, args);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    app.exit(e);
    std::exit(e.get_exit_code());// NOLINT(concurrency-mt-unsafe)
  }

  return args;
}

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void
{
  app.add_option("-V,--uuid-version", args.uuid_version, "UUID version to generate: 6 or 7")
    ->check(CLI::IsMember({ 6, 7 }));
  app.add_option("-n,--count", args.count, "Number of UUIDs to generate")->check(CLI::PositiveNumber);
  app.add_option("--clock-seq", args.clock_seq, "Clock sequence for version 6 UUIDs")
    ->check(CLI::Range(0, static_cast<int>(max_clock_seq)));
  app.add_flag("-v,--verbose", args.verbose, "Enable verbose logging");
  app.add_flag("--version", args.show_version, "Show version information");

  auto *decode_cmd = app.add_subcommand("decode", "Print the fields embedded in existing UUIDs");
  decode_cmd->add_option("uuids", args.decode_inputs, "UUIDs to decode")->required();
  decode_cmd->callback([&args]() { args.decode_parsed = true; });
}

inline auto validate_cli_args(const cli_args &args) -> bool
{
  if (args.uuid_version != 6 and args.uuid_version != 7) {
    spdlog::error("Invalid UUID version: {}", args.uuid_version);
    return false;
  }

  if (args.count == 0) {
    spdlog::error("Count must be at least 1");
    return false;
  }

  if (args.clock_seq.has_value()) {
    if (args.uuid_version != 6) {
      spdlog::error("--clock-seq only applies to version 6 UUIDs");
      return false;
    }
    if (*args.clock_seq > max_clock_seq) {
      spdlog::error("Clock sequence out of range: {}", *args.clock_seq);
      return false;
    }
  }

  if (args.decode_parsed and args.decode_inputs.empty()) {
    spdlog::error("Decode command requires at least one UUID");
    return false;
  }

  return true;
}

}// namespace draft_uuid::cli_utils
