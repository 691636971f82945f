#include <core/bit_layout.hpp>
#include <core/field_reader.hpp>
#include <core/uuid.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <tuple>

// Fuzzer that feeds arbitrary text to the UUID parser and decodes whatever parses
// cppcheck-suppress unusedFunction symbolName=LLVMFuzzerTestOneInput
// NOLINTNEXTLINE(readability-identifier-naming)
extern "C" auto LLVMFuzzerTestOneInput(const uint8_t *Data, size_t Size) -> int
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const std::string input(reinterpret_cast<const char *>(Data), Size);

  const auto parsed = draft_uuid::core::parse_uuid(input);
  if (not parsed.has_value()) { return 0; }

  std::ignore = draft_uuid::core::time(*parsed);
  std::ignore = draft_uuid::core::subsec(*parsed);
  std::ignore = draft_uuid::core::unixts(*parsed);
  std::ignore = draft_uuid::core::clock_seq(*parsed);

  if (parsed->to_string().size() != 36) { __builtin_trap(); }

  // Re-tagging must leave everything but the version and variant bits alone
  const auto retagged = draft_uuid::core::make_uuid(boost::multiprecision::cpp_int(parsed->value()), 7);
  if (retagged.version() != 7) { __builtin_trap(); }
  if (retagged.node() != parsed->node()) { __builtin_trap(); }

  return 0;
}
