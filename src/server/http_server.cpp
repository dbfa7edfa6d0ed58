#include "csv_cleaner/http_server.hpp"
#include "csv_cleaner/clean_job.hpp"
#include "csv_cleaner/request_json.hpp"
#include "csv_cleaner/run_json.hpp"

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace cc {

static std::string guess_mime(const std::string& name) {
  auto ends = [&](const char* s){
    const size_t n = std::strlen(s), m = name.size();
    return m >= n && std::equal(s, s+n, name.c_str() + (m - n),
                                [](char a, char b){ return std::tolower(a)==std::tolower(b); });
  };
  if (ends(".html")) return "text/html; charset=utf-8";
  if (ends(".css"))  return "text/css; charset=utf-8";
  if (ends(".json")) return "application/json; charset=utf-8";
  if (ends(".csv"))  return "text/csv; charset=utf-8";
  return "application/octet-stream";
}

static std::string html_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      default:  out.push_back(c); break;
    }
  }
  return out;
}

// Quote and control characters cannot appear in a header value.
static std::string header_safe(std::string s) {
  for (auto& c : s) if (c == '"' || static_cast<unsigned char>(c) < 0x20) c = '_';
  return s;
}

static void json_error(httplib::Response& res, int status, const std::string& msg) {
  res.status = status;
  res.set_content("{\"error\":" + json_quote(msg) + "}", "application/json; charset=utf-8");
}

struct HttpServer::Impl {
  Config cfg;
  httplib::Server svr;
  int bound_port{-1};

  explicit Impl(Config c) : cfg(std::move(c)) {}

  std::vector<std::string> slugs() const {
    std::vector<std::string> out;
    std::error_code ec;
    std::filesystem::path root(cfg.artifact_root);
    if (!std::filesystem::exists(root, ec)) return out;
    for (auto& d : std::filesystem::directory_iterator(root, ec)) {
      if (d.is_directory()) out.push_back(d.path().filename().string());
    }
    std::sort(out.begin(), out.end());
    return out;
  }

  std::string index_html() const {
    const std::string title = html_escape(cfg.index_title);
    std::string html = "<!doctype html><html><head><meta charset='utf-8'><title>";
    html += title + "</title></head><body><h1>" + title + "</h1>";
    html += "<p>POST a JSON body <code>{\"columns\":[...],\"filename\":\"x.csv\",\"csv\":\"...\"}</code>"
            " to <code>/api/clean</code>.</p><h2>Reports</h2><ul>";
    for (auto& s : slugs()) {
      const std::string e = html_escape(s);
      html += "<li><a href=\"/reports/" + e + "/report.html\">" + e + "</a></li>";
    }
    html += "</ul></body></html>";
    return html;
  }

  // Serve a file under artifact_root/<slug>/<rel>, preventing traversal.
  void serve_under_slug(const std::string& slug,
                        const std::string& rel,
                        httplib::Response& res) const {
    if (slug.find("..") != std::string::npos || rel.find("..") != std::string::npos) {
      res.status = 400;
      return;
    }

    std::filesystem::path base = std::filesystem::path(cfg.artifact_root) / slug;
    std::error_code ec;
    auto base_canon = std::filesystem::weakly_canonical(base, ec);
    if (ec) { res.status = 404; return; }

    auto target_canon = std::filesystem::weakly_canonical(base_canon / rel, ec);
    if (ec) { res.status = 404; return; }

    // Ensure target is inside base
    auto mismatch = std::mismatch(base_canon.begin(), base_canon.end(), target_canon.begin(), target_canon.end());
    if (mismatch.first != base_canon.end()) { res.status = 403; return; }

    std::ifstream in(target_canon, std::ios::binary);
    if (!in) { res.status = 404; return; }

    std::ostringstream ss; ss << in.rdbuf();
    res.set_content(ss.str(), guess_mime(target_canon.filename().string()).c_str());
  }

  void handle_clean(const httplib::Request& req, httplib::Response& res) const {
    CleanRequest creq;
    std::string err;
    if (!parse_clean_request(req.body, creq, err)) {
      std::cerr << "[serve] bad request: " << err << "\n";
      json_error(res, 400, err);
      return;
    }

    CleanJob job;
    job.filename = std::move(creq.filename);
    job.csv_text = std::move(creq.csv);
    job.columns = std::move(creq.columns);
    job.pipeline = cfg.pipeline;
    job.write_report = creq.report || cfg.write_reports;
    job.artifact_root = cfg.artifact_root;
    job.slug_mode = cfg.slug_mode;
    job.slug_len = cfg.slug_len;

    CleanJobResult r = run_clean_job(job);
    switch (r.status) {
      case JobStatus::Ok: break;
      case JobStatus::BadInput:
        json_error(res, 400, r.error);
        return;
      case JobStatus::Structure:
        std::cerr << "[serve] structure error: " << r.error << "\n";
        json_error(res, 422, r.error);
        return;
      case JobStatus::IoError:
        std::cerr << "[serve] " << r.error << "\n";
        json_error(res, 500, r.error);
        return;
    }

    std::cerr << "[serve] cleaned " << (job.filename.empty() ? "<body>" : job.filename)
              << " valid=" << r.valid_rows << " invalid=" << r.invalid_row_count << "\n";

    res.set_header("Content-Disposition", "attachment; filename=\"" + header_safe(r.output_name) + "\"");
    res.set_header("X-Invalid-Row-Count", std::to_string(r.invalid_row_count));
    res.set_header("X-Clean-Message", r.message);
    if (!r.report_dir.empty()) {
      res.set_header("X-Report-Path",
                     "/reports/" + std::filesystem::path(r.report_dir).filename().string() + "/report.html");
    }
    res.set_content(r.cleaned_csv, "text/csv; charset=utf-8");
  }

  void routes() {
    svr.Get("/", [this](const httplib::Request&, httplib::Response& res) {
      res.set_content(index_html(), "text/html; charset=utf-8");
    });

    svr.Post("/api/clean", [this](const httplib::Request& req, httplib::Response& res) {
      handle_clean(req, res);
    });

    svr.Get(R"(/reports/([^/]+)/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
      serve_under_slug(req.matches[1].str(), req.matches[2].str(), res);
    });
  }
};

HttpServer::HttpServer(Config cfg) : p_(new Impl(std::move(cfg))) { p_->routes(); }
HttpServer::~HttpServer() { delete p_; }

bool HttpServer::start() {
  if (p_->cfg.port == 0) {
    p_->bound_port = p_->svr.bind_to_any_port(p_->cfg.host);
    return p_->bound_port > 0;
  }
  if (!p_->svr.bind_to_port(p_->cfg.host, p_->cfg.port)) return false;
  p_->bound_port = p_->cfg.port;
  return true;
}

bool HttpServer::listen() { return p_->svr.listen_after_bind(); }

int HttpServer::run() {
  if (!start()) return -1;
  std::cerr << "[serve] listening on " << p_->cfg.host << ":" << p_->bound_port << "\n";
  return listen() ? 0 : 1;
}

void HttpServer::stop() { p_->svr.stop(); }

int HttpServer::port() const noexcept { return p_->bound_port; }

}
