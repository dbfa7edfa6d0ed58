#pragma once
#include "csv_cleaner/pipeline.hpp"
#include <string>

namespace cc {

// Tiny wrapper around cpp-httplib:
//   GET  /                         index of report directories
//   POST /api/clean                JSON request -> cleaned CSV attachment
//   GET  /reports/<slug>/<file>    report artifacts
class HttpServer {
public:
  struct Config {
    std::string host          = "0.0.0.0";
    int port                  = 8080;     // 0 picks a free port
    std::string artifact_root = "artifacts/csv-cleaner";
    std::string index_title   = "CSV Cleaner";
    bool write_reports        = false;    // default for requests without "report"
    std::string slug_mode     = "hashprefix";
    int slug_len              = 12;
    PipelineConfig pipeline;
  };

  explicit HttpServer(Config cfg);
  ~HttpServer();
  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Bind only; returns false on bind error.
  bool start();

  // Blocking accept loop after start(); returns when stopped.
  bool listen();

  // start() + listen(); non-zero on failure.
  int run();

  void stop();

  // Actual bound port (after start()).
  int port() const noexcept;

private:
  struct Impl;
  Impl* p_;
};

}
