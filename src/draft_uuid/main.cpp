#include <draft_uuid/cli_utils/app_init.hpp>
#include <draft_uuid/cli_utils/cli_parser.hpp>
#include <draft_uuid/draft_uuid.hpp>
#include <cstdint>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <optional>
#include <string>

// NOLINTNEXTLINE(bugprone-exception-escape)
auto main(int argc, char **argv) -> int
{
  auto args = draft_uuid::cli_utils::parse_cli_args(argc, argv);

  if (not draft_uuid::cli_utils::validate_cli_args(args)) { return 1; }

  draft_uuid::cli_utils::configure_logging(args);

  if (args.show_version) {
    draft_uuid::cli_utils::print_version();
    return 0;
  }

  const auto emit = [](const std::string &line) { fmt::print("{}\n", line); };

  if (args.decode_parsed) {
    const auto describe = [](const std::string &text) { fmt::print("{}", text); };
    return draft_uuid::cli_utils::run_decode(args, describe) ? 0 : 1;
  }

  spdlog::debug("generating {} version {} UUID(s)", args.count, args.uuid_version);
  draft_uuid::cli_utils::run_generate(
    args,
    [](std::optional<std::uint16_t> clock_seq) { return draft_uuid::generate_v6(clock_seq); },
    [] { return draft_uuid::generate_v7(); },
    emit);

  return 0;
}
