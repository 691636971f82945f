#pragma once

#include <config.hpp>
#include <core/field_reader.hpp>
#include <core/uuid.hpp>
#include <draft_uuid/cli_utils/cli_parser.hpp>
#include <fmt/core.h>
#include <fmt/format.h>
#include <functional>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>

namespace draft_uuid::cli_utils {

inline auto configure_logging(const cli_args &args) -> void
{
  if (args.verbose) { spdlog::set_level(spdlog::level::debug); }
}

inline auto print_version() -> void { fmt::print("draft-uuid v{}\n", draft_uuid::cmake::project_version); }

[[nodiscard]] inline auto variant_name(core::variant value) -> std::string_view
{
  switch (value) {
  case core::variant::ncs:
    return "reserved for NCS compatibility";
  case core::variant::rfc_4122:
    return "specified in RFC 4122";
  case core::variant::microsoft:
    return "reserved for Microsoft compatibility";
  case core::variant::future:
    return "reserved for future definition";
  }
  return "unknown";
}

/**
 * @brief Human readable summary of the fields embedded in a UUID.
 *
 * @param value UUID to describe
 * @return Multi-line description, terminated by a newline
 */
[[nodiscard]] inline auto describe_uuid(const core::uuid &value) -> std::string
{
  const auto version = value.version();
  auto text = fmt::format("{}\n  variant: {}\n", value.to_string(), variant_name(value.get_variant()));

  if (not version.has_value()) { return text; }

  text += fmt::format("  version: {}\n", *version);
  text += fmt::format("  time: {}\n", core::time(value).str());

  if (*version == 7) {
    text += fmt::format("  unixts: {}\n  subsec: {}\n", core::unixts(value), core::subsec(value));
  } else {
    text += fmt::format("  clock_seq: {:#06x}\n  node: {:012x}\n", core::clock_seq(value), value.node());
  }
  return text;
}

/**
 * @brief Generates the requested number of UUIDs.
 *
 * @param args Parsed command line
 * @param generate_v6 Version 6 generator taking an optional clock sequence
 * @param generate_v7 Version 7 generator
 * @param emit Called once per canonical UUID string
 */
inline auto run_generate(const cli_args &args,
  const std::function<core::uuid(std::optional<std::uint16_t>)> &generate_v6,
  const std::function<core::uuid()> &generate_v7,
  const std::function<void(const std::string &)> &emit) -> void
{
  for (std::size_t i = 0; i < args.count; ++i) {
    const auto value = args.uuid_version == 6 ? generate_v6(args.clock_seq) : generate_v7();
    emit(value.to_string());
  }
}

/**
 * @brief Decodes every UUID given to the decode command.
 *
 * @return true if every input parsed
 */
[[nodiscard]] inline auto run_decode(const cli_args &args, const std::function<void(const std::string &)> &emit)
  -> bool
{
  auto all_parsed = true;
  for (const auto &input : args.decode_inputs) {
    const auto parsed = core::parse_uuid(input);
    if (not parsed.has_value()) {
      spdlog::error("Not a UUID: {}", input);
      all_parsed = false;
      continue;
    }
    emit(describe_uuid(*parsed));
  }
  return all_parsed;
}

}// namespace draft_uuid::cli_utils
