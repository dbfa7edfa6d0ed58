#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cc {

struct StageTiming {
  std::string name;
  double duration_ms = 0.0;
};

struct RunStats {
  std::uint64_t rows_total = 0;   // data rows seen (header excluded)
  std::uint64_t rows_valid = 0;
  std::uint64_t rows_invalid = 0;
  std::uint64_t emails_corrected = 0;
  std::uint64_t phones_cleared = 0;
  std::uint64_t bytes = 0;
  double wall_time_ms = 0.0;
  double rows_per_sec = 0.0;

  std::vector<StageTiming> stages;                        // in first-start order
  std::map<std::string, std::uint64_t> rejects_by_reason; // sorted for stable output
};

// Single-threaded counters for one cleaning run.
class MetricsRegistry {
public:
  void add_bytes(std::uint64_t b) noexcept { bytes_ += b; }
  void add_row(bool valid) noexcept { ++rows_; if (!valid) ++invalid_; }
  void add_email_corrected() noexcept { ++emails_corrected_; }
  void add_phone_cleared() noexcept { ++phones_cleared_; }
  void add_reject(std::string_view reason);

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  std::uint64_t rows() const noexcept { return rows_; }
  std::uint64_t invalid() const noexcept { return invalid_; }

  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t rows_{0};
  std::uint64_t invalid_{0};
  std::uint64_t emails_corrected_{0};
  std::uint64_t phones_cleared_{0};
  std::uint64_t bytes_{0};
  std::map<std::string, std::uint64_t> rejects_;
  std::vector<std::string> stage_order_;
  std::unordered_map<std::string, double> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

// Times a stage for the lifetime of the guard; no-op with a null registry.
class StageTimer {
public:
  StageTimer(MetricsRegistry* m, std::string_view name) : m_(m), name_(name) {
    if (m_) m_->start_stage(name_);
  }
  ~StageTimer() { if (m_) m_->end_stage(name_); }
  StageTimer(const StageTimer&) = delete;
  StageTimer& operator=(const StageTimer&) = delete;

private:
  MetricsRegistry* m_;
  std::string name_;
};

}
