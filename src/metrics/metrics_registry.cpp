#include "csv_cleaner/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace cc {

void MetricsRegistry::add_reject(std::string_view reason) {
  ++rejects_[std::string(reason)];
}

void MetricsRegistry::start_stage(std::string_view name) {
  std::string key(name);
  if (std::find(stage_order_.begin(), stage_order_.end(), key) == stage_order_.end())
    stage_order_.push_back(key);
  stage_starts_[key] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  const double ms = std::chrono::duration<double, std::milli>(
                      std::chrono::steady_clock::now() - it->second).count();
  stage_accum_ms_[key] += ms;
  stage_starts_.erase(it);
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.rows_total = rows_;
  r.rows_invalid = invalid_;
  r.rows_valid = rows_ - invalid_;
  r.emails_corrected = emails_corrected_;
  r.phones_cleared = phones_cleared_;
  r.bytes = bytes_;
  r.wall_time_ms = wall_ms;
  r.rows_per_sec = (wall_ms > 0.0) ? rows_ / (wall_ms / 1000.0) : 0.0;
  r.rejects_by_reason = rejects_;

  r.stages.reserve(stage_order_.size());
  for (const auto& name : stage_order_) {
    auto it = stage_accum_ms_.find(name);
    r.stages.push_back(StageTiming{name, it == stage_accum_ms_.end() ? 0.0 : it->second});
  }
  return r;
}

}
