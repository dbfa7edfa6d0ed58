#include "csv_cleaner/request_json.hpp"

#include <simdjson.h>
#include <string>
#include <string_view>

namespace cc {

static bool read_string_array(simdjson::ondemand::array arr,
                              std::vector<std::string>& out, std::string& err) {
  for (auto el : arr) {
    std::string_view s;
    if (el.get_string().get(s)) { err = "\"columns\" must be an array of strings"; return false; }
    out.emplace_back(s);
  }
  return true;
}

bool parse_clean_request(std::string_view body, CleanRequest& out, std::string& err) {
  out = CleanRequest{};
  bool have_columns = false, have_csv = false;

  try {
    simdjson::ondemand::parser parser;
    simdjson::padded_string json(body);
    auto doc = parser.iterate(json);

    simdjson::ondemand::object obj;
    if (doc.get_object().get(obj)) { err = "request body must be a JSON object"; return false; }

    for (auto field : obj) {
      std::string_view key;
      if (field.unescaped_key().get(key)) { err = "malformed key"; return false; }

      if (key == "columns") {
        simdjson::ondemand::array arr;
        if (field.value().get_array().get(arr)) { err = "\"columns\" must be an array"; return false; }
        if (!read_string_array(arr, out.columns, err)) return false;
        have_columns = true;
      } else if (key == "filename") {
        std::string_view s;
        if (field.value().get_string().get(s)) { err = "\"filename\" must be a string"; return false; }
        out.filename.assign(s);
      } else if (key == "csv") {
        std::string_view s;
        if (field.value().get_string().get(s)) { err = "\"csv\" must be a string"; return false; }
        out.csv.assign(s);
        have_csv = true;
      } else if (key == "report") {
        bool b = false;
        if (field.value().get_bool().get(b)) { err = "\"report\" must be a boolean"; return false; }
        out.report = b;
      }
      // unknown keys are ignored
    }
  } catch (const simdjson::simdjson_error& e) {
    err = e.what();
    return false;
  }

  if (!have_columns) { err = "missing \"columns\""; return false; }
  if (!have_csv) { err = "missing \"csv\""; return false; }
  return true;
}

bool parse_columns_json(std::string_view json_text, std::vector<std::string>& out, std::string& err) {
  out.clear();
  try {
    simdjson::ondemand::parser parser;
    simdjson::padded_string json(json_text);
    auto doc = parser.iterate(json);

    simdjson::ondemand::json_type t;
    if (doc.type().get(t)) { err = "not a JSON document"; return false; }

    simdjson::ondemand::array arr;
    if (t == simdjson::ondemand::json_type::array) {
      if (doc.get_array().get(arr)) { err = "malformed array"; return false; }
    } else if (t == simdjson::ondemand::json_type::object) {
      if (doc.find_field_unordered("columns").get_array().get(arr)) {
        err = "object has no \"columns\" array";
        return false;
      }
    } else {
      err = "expected an array or an object with \"columns\"";
      return false;
    }
    return read_string_array(arr, out, err);
  } catch (const simdjson::simdjson_error& e) {
    err = e.what();
    return false;
  }
}

}
