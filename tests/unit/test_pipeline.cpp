#include "csv_cleaner/pipeline.hpp"
#include "csv_cleaner/csv_writer.hpp"
#include "csv_cleaner/metrics.hpp"
#include <iostream>
#include <string>
#include <vector>

static int failures = 0;

static void check(bool ok, const std::string& what) {
  if (ok) { std::cout << "[PASS] " << what << "\n"; return; }
  std::cerr << "[FAIL] " << what << "\n";
  ++failures;
}

// True when run() throws a StructureError of `kind`.
static bool throws_kind(const std::string& text, const std::vector<std::string>& cols,
                        cc::StructureError::Kind kind, std::string* msg = nullptr) {
  try {
    (void)cc::Pipeline().run(text, cols);
  } catch (const cc::StructureError& e) {
    if (msg) *msg = e.what();
    return e.kind() == kind;
  }
  return false;
}

int main(){
  const cc::Pipeline pipeline;

  {
    cc::MetricsRegistry m;
    auto res = pipeline.run("name,email\nAda,ada@x.con\nBob,not-an-email\n", {"name", "email"}, &m);
    check(res.valid_rows.size() == 2, "header + one accepted row");
    check(res.valid_rows[0] == cc::Row{"name", "email"}, "cleaned header first");
    check(res.valid_rows[1] == cc::Row{"Ada", "ada@x.com"}, "email normalised in output");
    check(res.invalid_row_count == 1, "one row rejected");
    check(res.rejects_by_reason["invalid_email"] == 1, "rejection reason recorded");
    check(res.emails_corrected == 1, "correction counted");

    auto s = m.snapshot(1.0);
    check(s.rows_total == 2 && s.rows_valid == 1 && s.rows_invalid == 1, "metrics row accounting");
    check(s.stages.size() == 2 && s.stages[0].name == "tokenize" && s.stages[1].name == "validate",
          "metrics stage order");
  }
  {
    auto res = pipeline.run("name,email,phone\nBob,bob@x.com,123\n", {"name", "email", "phone"});
    check(res.valid_rows.size() == 2 && res.valid_rows[1] == cc::Row{"Bob", "bob@x.com", ""},
          "invalid phone cleared, row kept");
    check(res.invalid_row_count == 0 && res.phones_cleared == 1, "phone clearing is not a rejection");
  }
  {
    auto res = pipeline.run("\"Name\",\"EMAIL\"\nAda,ada@x.com", {"name", " Email "});
    check(res.valid_rows[0] == cc::Row{"Name", "EMAIL"}, "header match is case-insensitive and trims");
  }
  {
    auto res = pipeline.run("name,email\nAda,ada@x.com,extra\nBob,bob@x.com", {"name", "email"});
    check(res.invalid_row_count == 1 && res.rejects_by_reason["width_mismatch"] == 1,
          "wrong width is a row rejection");
  }
  {
    auto res = pipeline.run("id,email,notes\n1,a@x.com,\"l1\nl2\"\n2,b@x.com,x", {"id", "email", "notes"});
    check(cc::serialize_csv(res.valid_rows) == "id,email,notes\n1,a@x.com,\"l1\nl2\"\n2,b@x.com,x",
          "multi-line field survives the pipeline");
  }
  {
    auto res = pipeline.run("name,contact_email,phone\nAda,ada@x.com,4155552671\n",
                            {"name", "contact_email", "phone"});
    check(res.valid_rows.size() == 2 && res.valid_rows[1] == cc::Row{"Ada", "ada@x.com", "4155552671"},
          "email in a contact_email column is kept");
    check(res.phones_cleared == 0, "contact_email column not treated as phone");
  }
  {
    auto res = pipeline.run("id,email,notes\n1,a@x.com,\"He said \"\"hi\"\"\nand, more\"",
                            {"id", "email", "notes"});
    check(res.invalid_row_count == 0 && res.valid_rows.size() == 2 &&
          res.valid_rows[1][2] == "He said \"hi\"\nand, more",
          "quote and comma on different lines of a note are accepted");
  }
  {
    auto res = pipeline.run("name,email\nZed,z@x.com\nAmy,a@x.com\nBad,bad\nMid,m@x.com", {"name", "email"});
    check(res.valid_rows.size() == 4 && res.valid_rows[1][0] == "Zed" &&
          res.valid_rows[2][0] == "Amy" && res.valid_rows[3][0] == "Mid",
          "input order preserved");
  }

  try {
    (void)pipeline.run("name,email\nAda,ada@x.com", {"name", "email", "phone"});
    check(false, "column count mismatch throws");
  } catch (const cc::StructureError& e) {
    check(e.expected_count() == 3 && e.actual_count() == 2, "column count carried on the error");
  }
  {
    std::string msg;
    check(throws_kind("name,email\nAda,ada@x.com", {"name", "email", "phone"},
                      cc::StructureError::Kind::ColumnCount, &msg) &&
          msg.find("expected 3, found 2") != std::string::npos,
          "column count mismatch message");
  }
  {
    try {
      (void)pipeline.run("name,mail\nAda,ada@x.com", {"name", "email"});
      check(false, "column name mismatch throws");
    } catch (const cc::StructureError& e) {
      check(e.kind() == cc::StructureError::Kind::ColumnName && e.position() == 2 &&
            e.expected_name() == "email" && e.actual_name() == "mail",
            std::string("column name mismatch: ") + e.what());
    }
  }
  check(throws_kind("", {"name"}, cc::StructureError::Kind::EmptyInput), "empty input");
  check(throws_kind(" \n\t\n", {"name"}, cc::StructureError::Kind::EmptyInput), "blank input");
  check(throws_kind(",,\n", {"name"}, cc::StructureError::Kind::EmptyInput), "input without any row");
  check(throws_kind("name\nAda", {}, cc::StructureError::Kind::NoColumns), "no expected columns");

  {
    auto r = cc::resolve_column_roles({"Full Name", "Work Email", "Mobile No", "Contact"});
    check(r.email && *r.email == 1 && r.phone && *r.phone == 2, "roles: email 1, phone 2");
    r = cc::resolve_column_roles({"contact", "phone"});
    check(r.phone && *r.phone == 1 && !r.email, "roles: phone key beats contact key");
    r = cc::resolve_column_roles({"contact", "mobile"});
    check(r.phone && *r.phone == 1, "roles: mobile key beats contact key");
    r = cc::resolve_column_roles({"name", "contact_email", "phone"});
    check(r.email && *r.email == 1 && r.phone && *r.phone == 2, "roles: contact_email is email only");
    r = cc::resolve_column_roles({"contact_email"});
    check(r.email && *r.email == 0 && !r.phone, "roles: phone never shares the email column");
    r = cc::resolve_column_roles({"name"});
    check(!r.email && !r.phone, "roles: none");
  }

  check(cc::normalize_columns({" name ", "", "email", "name", "  "}) ==
        std::vector<std::string>{"name", "email"}, "normalize_columns trims and dedupes");
  check(cc::split_column_list("name, email,,phone") ==
        std::vector<std::string>{"name", "email", "phone"}, "split_column_list");

  {
    std::string text = "name,email,phone\n";
    for (int i = 0; i < 5000; ++i) {
      text += "u" + std::to_string(i) + ",";
      text += (i % 9 == 0) ? "broken" : "u" + std::to_string(i) + "@x.con";
      text += (i % 4 == 0) ? ",12\n" : ",4155550100\n";
    }
    const std::vector<std::string> cols = {"name", "email", "phone"};
    cc::PipelineConfig pcfg;
    pcfg.workers = 4;
    pcfg.parallel_min_rows = 100;
    auto seq = cc::Pipeline().run(text, cols);
    auto par = cc::Pipeline(pcfg).run(text, cols);
    check(seq.valid_rows == par.valid_rows && seq.invalid_row_count == par.invalid_row_count &&
          seq.phones_cleared == par.phones_cleared && seq.emails_corrected == par.emails_corrected,
          "threaded validation matches sequential output");
    check(seq.invalid_row_count == 556, "every 9th row rejected (got " +
          std::to_string(seq.invalid_row_count) + ")");
  }

  if (failures) { std::cerr << "[FAIL] " << failures << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] pipeline\n";
  return 0;
}
