#include "csv_cleaner/field_cleaner.hpp"
#include <iostream>
#include <string>
#include <vector>

static int failures = 0;

static void expect_clean(const std::string& in, const std::string& want) {
  const std::string got = cc::clean_field(in);
  if (got == want) { std::cout << "[PASS] clean(<" << in << ">) = <" << got << ">\n"; return; }
  std::cerr << "[FAIL] clean(<" << in << ">) = <" << got << ">, want <" << want << ">\n";
  ++failures;
}

int main(){
  expect_clean("  Ada  ", "Ada");
  expect_clean(",Ada", "Ada");
  expect_clean(" , Ada", "Ada");
  expect_clean("\"Ada\"", "Ada");
  expect_clean("\"Ada,\"", "Ada");
  expect_clean("\"a,b\"", "a,b");
  expect_clean("\"say \"hi\"\"", "say \"hi\"");
  expect_clean("Ada,", "Ada");
  expect_clean("Ada ,  ", "Ada");
  expect_clean("\"", "\"");
  expect_clean("\"\"", "");
  expect_clean("", "");
  expect_clean("a,b", "a,b");

  const std::vector<std::string> samples = {
    "Ada", " ,Ada, ", "\"x\"", "a,b", "\"a, b,\"", "+1 (415) 555-2671", "", "  "};
  for (const auto& s : samples) {
    const std::string once = cc::clean_field(s);
    if (cc::clean_field(once) != once) {
      std::cerr << "[FAIL] clean is not idempotent on <" << s << ">\n";
      ++failures;
    }
  }

  if (failures) { std::cerr << "[FAIL] " << failures << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] field cleaner\n";
  return 0;
}
