#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace fc {

struct StageTiming {
  std::string name;
  double duration_ms = 0.0;
};

struct RunStats {
  std::uint64_t rows = 0;
  std::uint64_t chunks = 0;
  std::uint64_t bytes_in = 0;
  std::uint64_t bytes_out = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0; // input bytes over wall time
  double rows_per_sec = 0.0;

  std::vector<StageTiming> stages; // in the order they were first started
};

// Single-threaded bookkeeping for one run; workers never touch it.
class MetricsRegistry {
public:
  void add_rows(std::uint64_t n) noexcept { rows_ += n; }
  void add_chunks(std::uint64_t n) noexcept { chunks_ += n; }
  void add_bytes_in(std::uint64_t b) noexcept { bytes_in_ += b; }
  void add_bytes_out(std::uint64_t b) noexcept { bytes_out_ += b; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t rows_{0};
  std::uint64_t chunks_{0};
  std::uint64_t bytes_in_{0};
  std::uint64_t bytes_out_{0};
  std::vector<std::string> stage_order_;
  std::unordered_map<std::string, double> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

// Starts a stage on construction, ends it on destruction.
class StageTimer {
public:
  StageTimer(MetricsRegistry& m, std::string_view name) : m_(m), name_(name) { m_.start_stage(name_); }
  ~StageTimer() { m_.end_stage(name_); }
  StageTimer(const StageTimer&) = delete;
  StageTimer& operator=(const StageTimer&) = delete;

private:
  MetricsRegistry& m_;
  std::string name_;
};

}
