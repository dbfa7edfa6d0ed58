#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace cc {

// Body of POST /api/clean:
//   {"columns":["name","email"], "filename":"x.csv", "csv":"...", "report":true}
struct CleanRequest {
  std::vector<std::string> columns;
  std::string filename;
  std::string csv;
  bool report = false;
};

bool parse_clean_request(std::string_view body, CleanRequest& out, std::string& err);

// Either a bare array of names or an object with a "columns" array.
bool parse_columns_json(std::string_view json, std::vector<std::string>& out, std::string& err);

}
