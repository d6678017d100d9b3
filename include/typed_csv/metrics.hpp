#pragma once
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tc {

struct StageTiming {
  std::string name;
  double duration_ms = 0.0;
};

struct ReadMetrics {
  std::uint64_t rows = 0;          // data rows converted
  std::uint64_t bytes = 0;         // bytes pulled from the source
  std::uint64_t windows = 0;
  double wall_ms = 0.0;
  double throughput_mb_s = 0.0;

  std::vector<StageTiming> stages; // tokenize, infer, convert

  double stage_ms(std::string_view name) const;
};

class MetricsRegistry {
public:
  void reset();
  void add_rows(std::uint64_t n) noexcept { rows_ += n; }
  void add_bytes(std::uint64_t b) noexcept { bytes_ += b; }
  void add_window() noexcept { ++windows_; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  // Folds another registry's counters and stage times into this one.
  void merge(const ReadMetrics& m);

  ReadMetrics snapshot(double wall_ms) const;

private:
  std::uint64_t rows_{0};
  std::uint64_t bytes_{0};
  std::uint64_t windows_{0};
  std::vector<std::string> stage_order_;
  std::unordered_map<std::string, double> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
