#include "typed_csv/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace tc {

double ReadMetrics::stage_ms(std::string_view name) const {
  for (const auto& s : stages) if (s.name == name) return s.duration_ms;
  return 0.0;
}

void MetricsRegistry::reset() {
  rows_ = bytes_ = windows_ = 0;
  stage_order_.clear();
  stage_accum_ms_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::start_stage(std::string_view name) {
  auto key = std::string(name);
  if (!stage_accum_ms_.count(key)) {
    stage_accum_ms_[key] = 0.0;
    stage_order_.push_back(key);
  }
  stage_starts_[key] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  std::chrono::duration<double, std::milli> ms = std::chrono::steady_clock::now() - it->second;
  stage_accum_ms_[key] += ms.count();
  stage_starts_.erase(it);
}

void MetricsRegistry::merge(const ReadMetrics& m) {
  rows_ += m.rows;
  bytes_ += m.bytes;
  windows_ += m.windows;
  for (const auto& s : m.stages) {
    if (!stage_accum_ms_.count(s.name)) stage_order_.push_back(s.name);
    stage_accum_ms_[s.name] += s.duration_ms;
  }
}

ReadMetrics MetricsRegistry::snapshot(double wall_ms) const {
  ReadMetrics r;
  r.rows = rows_;
  r.bytes = bytes_;
  r.windows = windows_;
  r.wall_ms = wall_ms;
  r.throughput_mb_s = (wall_ms > 0.0) ? (bytes_ / (1024.0*1024.0)) / (wall_ms / 1000.0) : 0.0;

  r.stages.reserve(stage_order_.size());
  for (const auto& name : stage_order_) r.stages.push_back(StageTiming{name, stage_accum_ms_.at(name)});
  return r;
}

}
