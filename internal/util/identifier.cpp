#include "identifier.hpp"

#include <cctype>

namespace connstate::util {

bool IsValidIdentifier(std::string_view name) {
  if (name.empty()) return false;
  for (char c : name) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
  }
  return true;
}

} // namespace connstate::util
