#include "csv_cleaner/chunk_reader.hpp"
#include "csv_cleaner/clean_job.hpp"
#include "csv_cleaner/artifact_writer.hpp"
#include "csv_cleaner/http_server.hpp"
#include "csv_cleaner/path_utils.hpp"
#include "csv_cleaner/pipeline.hpp"
#include "csv_cleaner/request_json.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct Cli {
  std::vector<std::string> columns;
  std::string columns_json;             // file with a JSON column list
  std::vector<std::string> inputs;      // explicit CSV paths
  std::string out_dir;                  // default: next to the input
  std::string artifact_root = "artifacts/csv-cleaner";
  bool report = false;
  std::string slug_mode = "hashprefix"; // hashprefix|basename
  int slug_len = 12;
  int workers = 1;
  bool serve = false;
  int port = 8080;
  bool quiet = false;
};

void usage() {
  std::cout <<
    "Usage: csv-cleaner --columns=a,b,c | --columns-json=<file>\n"
    "                   [--clean <file>|--clean=<file>]... [--out-dir=DIR]\n"
    "                   [--report] [--artifact-root=DIR]\n"
    "                   [--slug-mode=hashprefix|basename] [--slug-len=N]\n"
    "                   [--workers=N] [--quiet]\n"
    "       csv-cleaner --serve [--port=N] [--artifact-root=DIR] [--report] [--workers=N]\n";
}

Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_i = [&](const char* pfx, int* out){
      if (a.rfind(pfx, 0) == 0) { *out = std::stoi(a.substr(std::string(pfx).size())); return true; }
      return false;
    };
    std::string list;
    if (eat("--columns=", &list)) { c.columns = cc::split_column_list(list); continue; }
    if (eat("--columns-json=", &c.columns_json)) continue;
    if (eat("--out-dir=", &c.out_dir)) continue;
    if (eat("--artifact-root=", &c.artifact_root)) continue;
    if (eat("--slug-mode=", &c.slug_mode)) continue;
    if (eat_i("--slug-len=", &c.slug_len)) continue;
    if (eat_i("--workers=", &c.workers)) continue;
    if (eat_i("--port=", &c.port)) continue;
    if (a == "--report") { c.report = true; continue; }
    if (a == "--serve")  { c.serve  = true; continue; }
    if (a == "--quiet")  { c.quiet  = true; continue; }
    if (a == "--clean" && i+1 < argc) { c.inputs.push_back(argv[++i]); continue; }
    if (eat("--clean=", &list)) { c.inputs.push_back(list); continue; }
    if (a == "-h" || a == "--help") { usage(); std::exit(0); }
    throw std::invalid_argument("unknown argument: " + a);
  }
  return c;
}

bool load_columns_json(const std::string& path, std::vector<std::string>& out) {
  cc::ChunkReader reader(path);
  std::string text, err;
  if (!reader.read_all(text)) {
    std::cerr << "[clean] cannot read " << path << ": " << reader.error() << "\n";
    return false;
  }
  if (!cc::parse_columns_json(text, out, err)) {
    std::cerr << "[clean] bad column list in " << path << ": " << err << "\n";
    return false;
  }
  out = cc::normalize_columns(out);
  return true;
}

int clean_one_file(const std::string& filepath, const Cli& cli) {
  cc::CleanJob job;
  job.filename = std::filesystem::path(filepath).filename().string();
  job.columns = cli.columns;
  job.pipeline.workers = static_cast<unsigned>(std::max(1, cli.workers));
  job.write_report = cli.report;
  job.artifact_root = cli.artifact_root;
  job.slug_mode = cli.slug_mode;
  job.slug_len = cli.slug_len;

  if (!cc::is_csv_path(filepath)) {
    std::cerr << "[clean] skip " << filepath << ": Please upload a CSV file only.\n";
    return 4;
  }

  cc::ChunkReader reader(filepath);
  if (!reader.read_all(job.csv_text)) {
    std::cerr << "[clean] read failed: " << reader.error() << "\n";
    return 2;
  }

  const cc::CleanJobResult r = cc::run_clean_job(job);
  switch (r.status) {
    case cc::JobStatus::Ok: break;
    case cc::JobStatus::Structure:
      std::cerr << "[clean] structure error in " << filepath << ": " << r.error << "\n";
      return 3;
    case cc::JobStatus::BadInput:
      std::cerr << "[clean] " << filepath << ": " << r.error << "\n";
      return 4;
    case cc::JobStatus::IoError:
      std::cerr << "[clean] " << filepath << ": " << r.error << "\n";
      return 5;
  }

  const std::filesystem::path dir = cli.out_dir.empty()
      ? std::filesystem::path(filepath).parent_path()
      : std::filesystem::path(cli.out_dir);
  const std::string out_path = (dir / r.output_name).string();

  std::string err;
  if (!cc::write_text_file(out_path, r.cleaned_csv, &err)) {
    std::cerr << "[clean] " << err << "\n";
    return 5;
  }

  if (!cli.quiet) {
    std::cout << "[clean] ok: " << filepath << " -> " << out_path
              << " (valid=" << r.valid_rows << " invalid=" << r.invalid_row_count << ")\n"
              << "[clean] " << r.message << "\n";
    if (!r.report_dir.empty())
      std::cout << "[clean] report: " << r.report_dir << "/report.html\n";
  }
  return 0;
}

int serve(const Cli& cli) {
  cc::HttpServer::Config cfg;
  cfg.port = cli.port;
  cfg.artifact_root = cli.artifact_root;
  cfg.write_reports = cli.report;
  cfg.slug_mode = cli.slug_mode;
  cfg.slug_len = cli.slug_len;
  cfg.pipeline.workers = static_cast<unsigned>(std::max(1, cli.workers));

  cc::HttpServer server(cfg);
  int rc = server.run();
  if (rc != 0) {
    std::cerr << "[serve] failed to start on port " << cfg.port << "\n";
    return rc;
  }
  return 0;
}

}

int main(int argc, char** argv) {
  Cli cli;
  try {
    cli = parse_cli(argc, argv);
  } catch (const std::logic_error& e) {
    std::cerr << "[clean] " << e.what() << "\n";
    usage();
    return 64;
  }

  if (cli.serve) return serve(cli);

  if (!cli.columns_json.empty() && !load_columns_json(cli.columns_json, cli.columns)) return 64;
  if (cli.columns.empty()) {
    std::cerr << "[clean] Please add at least one column name.\n";
    usage();
    return 64;
  }
  if (cli.inputs.empty()) {
    std::cerr << "[clean] nothing to clean (use --clean <file>)\n";
    usage();
    return 64;
  }

  int worst = 0;
  for (const auto& f : cli.inputs) worst = std::max(worst, clean_one_file(f, cli));
  return worst;
}
