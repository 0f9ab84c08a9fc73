#include <core/command_parser.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <tuple>

// Fuzzer that feeds arbitrary lines through the command parser, in and out of chat mode
// cppcheck-suppress unusedFunction symbolName=LLVMFuzzerTestOneInput
// NOLINTNEXTLINE(readability-identifier-naming)
extern "C" auto LLVMFuzzerTestOneInput(const uint8_t *Data, size_t Size) -> int
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const std::string input(reinterpret_cast<const char *>(Data), Size);

  courier::core::command_parser parser;
  std::ignore = parser.parse(input);
  std::ignore = parser.parse("/chat fuzz");
  std::ignore = parser.parse(input);

  return 0;
}
