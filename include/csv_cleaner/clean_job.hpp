#pragma once
#include "csv_cleaner/metrics.hpp"
#include "csv_cleaner/pipeline.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace cc {

// One cleaning request as the CLI / HTTP layers see it.
struct CleanJob {
  std::string filename;               // original file name, may be empty
  std::string csv_text;
  std::vector<std::string> columns;   // normalised by run_clean_job
  PipelineConfig pipeline;

  bool write_report = false;
  std::string artifact_root = "artifacts/csv-cleaner";
  std::string slug_mode = "hashprefix"; // hashprefix|basename
  int slug_len = 12;
};

enum class JobStatus { Ok, BadInput, Structure, IoError };

struct CleanJobResult {
  JobStatus status = JobStatus::BadInput;
  std::string error;

  std::string cleaned_csv;
  std::string output_name;     // cleaned_<filename>
  std::size_t valid_rows = 0;  // data rows, header excluded
  std::size_t invalid_row_count = 0;
  std::string message;
  std::string run_json;
  std::string report_dir;      // set when the report was written
  RunStats stats;

  bool ok() const noexcept { return status == JobStatus::Ok; }
};

// "CSV processed successfully! Removed 2 invalid rows." and friends.
std::string summary_message(std::size_t invalid_rows);

CleanJobResult run_clean_job(const CleanJob& job);

}
