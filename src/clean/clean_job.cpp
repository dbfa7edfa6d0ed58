#include "csv_cleaner/clean_job.hpp"
#include "csv_cleaner/artifact_writer.hpp"
#include "csv_cleaner/csv_writer.hpp"
#include "csv_cleaner/path_utils.hpp"
#include "csv_cleaner/run_json.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <string>

namespace cc {

std::string summary_message(std::size_t invalid_rows) {
  if (invalid_rows == 0) return "CSV processed successfully! No invalid rows found.";
  return "CSV processed successfully! Removed " + std::to_string(invalid_rows) +
         (invalid_rows == 1 ? " invalid row." : " invalid rows.");
}

static std::string fmt_ms(double ms) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.3f", ms);
  return buf;
}

static RunJsonPayload make_payload(const CleanJob& job,
                                   const std::vector<std::string>& columns,
                                   const ParseResult& res,
                                   const CleanJobResult& r) {
  RunJsonPayload p{};
  p.rows_total = r.stats.rows_total;
  p.rows_valid = r.stats.rows_valid;
  p.invalid_row_count = r.stats.rows_invalid;
  p.emails_corrected = r.stats.emails_corrected;
  p.phones_cleared = r.stats.phones_cleared;
  p.bytes = r.stats.bytes;
  p.wall_time_ms = r.stats.wall_time_ms;
  p.rows_per_sec = r.stats.rows_per_sec;
  for (const auto& s : r.stats.stages) p.stage_times.emplace_back(s.name, s.duration_ms);
  p.rejects_by_reason = r.stats.rejects_by_reason;
  p.filename = job.filename;
  p.output_name = r.output_name;
  p.columns = columns;
  p.email_column = res.roles.email ? static_cast<long long>(*res.roles.email) : -1;
  p.phone_column = res.roles.phone ? static_cast<long long>(*res.roles.phone) : -1;
  p.message = r.message;
  return p;
}

static RenderContext make_view(const RunJsonPayload& p, const std::string& run_json) {
  RenderContext v;
  v.values["filename"] = p.filename.empty() ? "(pasted text)" : p.filename;
  v.values["output_name"] = p.output_name;
  v.values["message"] = p.message;
  v.values["rows_total"] = std::to_string(p.rows_total);
  v.values["rows_valid"] = std::to_string(p.rows_valid);
  v.values["invalid_row_count"] = std::to_string(p.invalid_row_count);
  v.values["emails_corrected"] = std::to_string(p.emails_corrected);
  v.values["phones_cleared"] = std::to_string(p.phones_cleared);
  v.values["wall_time_ms"] = fmt_ms(p.wall_time_ms);

  auto& cols = v.lists["columns"];
  for (std::size_t i = 0; i < p.columns.size(); ++i) {
    std::string role;
    if (static_cast<long long>(i) == p.email_column) role = "email";
    if (static_cast<long long>(i) == p.phone_column) role = role.empty() ? "phone" : role + ", phone";
    cols.push_back({{"name", p.columns[i]}, {"role", role}});
  }
  auto& rejects = v.lists["rejects"];
  for (const auto& kv : p.rejects_by_reason)
    rejects.push_back({{"reason", kv.first}, {"count", std::to_string(kv.second)}});
  auto& stages = v.lists["stages"];
  for (const auto& s : p.stage_times)
    stages.push_back({{"stage", s.first}, {"duration_ms", fmt_ms(s.second)}});

  v.ctx_json = run_json;
  return v;
}

CleanJobResult run_clean_job(const CleanJob& job) {
  namespace ch = std::chrono;
  CleanJobResult r;

  if (!job.filename.empty() && !is_csv_path(job.filename)) {
    r.status = JobStatus::BadInput;
    r.error = "Please upload a CSV file only.";
    return r;
  }
  const std::vector<std::string> columns = normalize_columns(job.columns);

  const auto t0 = ch::steady_clock::now();
  MetricsRegistry metrics;
  ParseResult res;
  try {
    Pipeline pipeline(job.pipeline);
    res = pipeline.run(job.csv_text, columns, &metrics);
  } catch (const StructureError& e) {
    r.status = JobStatus::Structure;
    r.error = e.what();
    return r;
  }

  {
    StageTimer t(&metrics, "serialize");
    r.cleaned_csv = serialize_csv(res.valid_rows);
  }
  const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();

  r.stats = metrics.snapshot(wall_ms);
  r.valid_rows = res.valid_rows.size() - 1;
  r.invalid_row_count = res.invalid_row_count;
  r.output_name = cleaned_file_name(job.filename);
  r.message = summary_message(res.invalid_row_count);

  const RunJsonPayload payload = make_payload(job, columns, res, r);
  r.run_json = RunJsonWriter::to_json(payload);
  r.status = JobStatus::Ok;

  if (job.write_report) {
    const std::string key = job.slug_mode == "basename"
        ? (job.filename.empty() ? r.output_name : job.filename)
        : job.filename + '\n' + job.csv_text;
    const std::string slug = make_slug(key, job.slug_mode, job.slug_len);

    ReportArtifacts a;
    a.output_name = r.output_name;
    a.cleaned_csv = r.cleaned_csv;
    a.run_json = r.run_json;
    a.view = make_view(payload, r.run_json);

    std::string err;
    if (!write_report_dir(job.artifact_root, slug, a, &err)) {
      r.status = JobStatus::IoError;
      r.error = "report write failed: " + err;
      return r;
    }
    r.report_dir = (std::filesystem::path(job.artifact_root) / slug).string();
  }
  return r;
}

}
