#pragma once
#include "csv_cleaner/mustache_renderer.hpp"
#include <string>

namespace cc {

struct ReportArtifacts {
  std::string output_name;  // e.g. "cleaned_contacts.csv"
  std::string cleaned_csv;
  std::string run_json;
  RenderContext view;       // data for report.mustache
};

// Write `text` to `path`, creating parent directories.
bool write_text_file(const std::string& path, const std::string& text,
                     std::string* err_out = nullptr);

// Writes:
//   <artifact_root>/<slug>/<output_name>
//   <artifact_root>/<slug>/run.json
//   <artifact_root>/<slug>/report.html (+ report.css)
bool write_report_dir(const std::string& artifact_root,
                      const std::string& slug,
                      const ReportArtifacts& artifacts,
                      std::string* err_out = nullptr);

}
