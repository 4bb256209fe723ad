#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace connstate::util {

// Decimal count with no sign, no whitespace and no trailing characters.
// nullopt on anything else, including overflow.
std::optional<std::size_t> ParseCount(std::string_view text);

} // namespace connstate::util
