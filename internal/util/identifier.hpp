#pragma once

#include <string_view>

namespace connstate::util {

// True for a non-empty name made only of [A-Za-z0-9_]. Relation names are
// spliced into DDL/DML text, so nothing else is allowed through.
bool IsValidIdentifier(std::string_view name);

} // namespace connstate::util
