#include "parse.hpp"

#include <charconv>
#include <system_error>

namespace connstate::util {

std::optional<std::size_t> ParseCount(std::string_view text) {
  // from_chars never accepts '+' or whitespace, but does accept '-' for
  // unsigned types and wraps it.
  if (text.empty() || text.front() == '-') return std::nullopt;

  std::size_t value = 0;
  const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || end != text.data() + text.size()) return std::nullopt;
  return value;
}

} // namespace connstate::util
