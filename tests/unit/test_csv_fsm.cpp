#include "csv_cleaner/token_csv_fsm.hpp"
#include "csv_cleaner/chunk_reader.hpp"
#include "csv_cleaner/csv_writer.hpp"
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

static int failures = 0;

static void check(bool ok, const std::string& what) {
  if (ok) { std::cout << "[PASS] " << what << "\n"; return; }
  std::cerr << "[FAIL] " << what << "\n";
  ++failures;
}

static bool same(const std::vector<cc::Row>& got, const std::vector<cc::Row>& want) {
  if (got == want) return true;
  std::cerr << "       got " << got.size() << " rows:";
  for (auto& r : got) { std::cerr << " ["; for (auto& f : r) std::cerr << "<" << f << ">"; std::cerr << "]"; }
  std::cerr << "\n";
  return false;
}

int main(){
  check(same(cc::tokenize_csv("a,b\n1,2\n"), {{"a","b"},{"1","2"}}),
        "simple rows, trailing newline");

  check(same(cc::tokenize_csv("\"line1\nline2\",ok"), {{"line1\nline2","ok"}}),
        "quoted field spans two physical lines");

  check(same(cc::tokenize_csv("\"say \"\"hi\"\"\",x"), {{"say \"hi\"","x"}}),
        "escaped quotes collapse to one");

  check(same(cc::tokenize_csv("a,b\n\n , \n,,\n1,2"), {{"a","b"},{"1","2"}}),
        "blank and all-empty rows are dropped");

  check(same(cc::tokenize_csv("  a ,\tb  "), {{"a","b"}}),
        "fields are trimmed");

  check(same(cc::tokenize_csv("a,b,"), {{"a","b",""}}),
        "trailing separator yields an empty last field");

  check(same(cc::tokenize_csv("a,b,c\n1,2"), {{"a","b","c"},{"1","2"}}),
        "rows may differ in width");

  check(same(cc::tokenize_csv("a,\"b\nc"), {{"a","b\nc"}}),
        "unterminated quote closes at end of input");

  check(same(cc::tokenize_csv("a,\"x,y\",b"), {{"a","x,y","b"}}),
        "separator inside quotes is data");

  {
    cc::CsvFsm fsm;
    std::vector<cc::Row> rows;
    auto sink = [&](cc::Row&& r){ rows.push_back(std::move(r)); };
    fsm.feed("id,\"note", sink);
    check(fsm.in_quotes() && rows.empty(), "open quote carries over the line end");
    fsm.feed("more\"", sink);
    check(!fsm.in_quotes() && rows.size() == 1 && rows[0][1] == "note\nmore",
          "continuation line completes the row");
    fsm.finish(sink);
    check(fsm.rows() == 1 && fsm.lines() == 2, "row and line counters");
  }

  {
    const std::string clean = "name,email\nAda,ada@x.com\nBob,bob@y.org";
    check(cc::serialize_csv(cc::tokenize_csv(clean)) == clean,
          "clean unquoted input round-trips exactly");
  }

  const fs::path f = "tests/data/multi_line.csv";
  if (!fs::exists(f)) { std::cerr << "[ERR] missing: " << f << "\n"; return 2; }
  {
    cc::CsvFsm fsm;
    cc::ChunkReader r(f.string());
    std::uint64_t n = 0;
    bool ok = r.for_each_line([&](std::string_view s){ fsm.feed(s, [&](cc::Row&&){ ++n; }); });
    fsm.finish([&](cc::Row&&){ ++n; });
    check(ok && n == 4, "streamed fixture yields header + 3 rows (got " + std::to_string(n) + ")");
  }

  if (failures) { std::cerr << "[FAIL] " << failures << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] csv fsm\n";
  return 0;
}
