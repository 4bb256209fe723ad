#include "internal/util/parse.hpp"

#include <cassert>
#include <iostream>
#include <limits>
#include <string>

#include "internal/db/api/types.hpp"

namespace {

using connstate::util::ParseCount;

void TestAcceptsPlainCounts() {
  assert(ParseCount("0") == std::optional<std::size_t>(0));
  assert(ParseCount("25") == std::optional<std::size_t>(25));
  assert(ParseCount(std::to_string(std::numeric_limits<std::size_t>::max())) ==
         std::optional<std::size_t>(std::numeric_limits<std::size_t>::max()));
}

void TestRejectsSignsAndJunk() {
  for (const std::string bad : {"", "-1", "-0", "+5", " 5", "5 ", "5x", "0x10", "1e3", "99999999999999999999999999"}) {
    assert(!ParseCount(bad).has_value() && "count must be rejected");
  }
}

void TestSqlBoundNeverGoesNegative() {
  using connstate::db::SqlBound;
  assert(SqlBound(0) == 0);
  assert(SqlBound(100) == 100);
  assert(SqlBound(std::numeric_limits<std::size_t>::max()) == std::numeric_limits<std::int64_t>::max());
}

} // namespace

int main() {
  TestAcceptsPlainCounts();
  TestRejectsSignsAndJunk();
  TestSqlBoundNeverGoesNegative();

  std::cout << "connstate_unit_parse: pass\n";
  return 0;
}
