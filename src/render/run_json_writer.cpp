#include "csv_cleaner/run_json.hpp"
#include <cmath> // std::isfinite
#include <cstdio>
#include <sstream>

namespace cc {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          o << buf;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string json_quote(const std::string& s) {
  std::ostringstream o;
  esc(o, s);
  return o.str();
}

std::string RunJsonWriter::to_json(const RunJsonPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"rows_total\":" << p.rows_total << ",";
  o << "\"rows_valid\":" << p.rows_valid << ",";
  o << "\"invalid_row_count\":" << p.invalid_row_count << ",";
  o << "\"emails_corrected\":" << p.emails_corrected << ",";
  o << "\"phones_cleared\":" << p.phones_cleared << ",";
  o << "\"bytes\":" << p.bytes << ",";
  o << "\"wall_time_ms\":" << safe_num(p.wall_time_ms) << ",";
  o << "\"rows_per_sec\":" << safe_num(p.rows_per_sec) << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<p.stage_times.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, p.stage_times[i].first);
    o << ",\"duration_ms\":" << safe_num(p.stage_times[i].second) << "}";
  }
  o << "],";

  o << "\"rejects_by_reason\":{";
  bool first=true;
  for (auto& kv : p.rejects_by_reason) {
    if (!first) o << ",";
    first=false;
    esc(o, kv.first); o << ":" << kv.second;
  }
  o << "},";

  o << "\"columns\":[";
  for (size_t i=0;i<p.columns.size();++i){
    if (i) o << ",";
    esc(o, p.columns[i]);
  }
  o << "],";
  o << "\"email_column\":" << p.email_column << ",";
  o << "\"phone_column\":" << p.phone_column << ",";

  o << "\"filename\":";    esc(o, p.filename);    o << ",";
  o << "\"output_name\":"; esc(o, p.output_name); o << ",";
  o << "\"message\":";     esc(o, p.message);

  o << "}";
  return o.str();
}

}
