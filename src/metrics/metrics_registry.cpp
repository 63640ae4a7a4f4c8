#include "fieldcut/metrics.hpp"
#include <chrono>

namespace fc {

void MetricsRegistry::start_stage(std::string_view name) {
  auto key = std::string(name);
  if (stage_accum_ms_.find(key) == stage_accum_ms_.end()) {
    stage_order_.push_back(key);
    stage_accum_ms_[key] = 0.0;
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

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.rows = rows_;
  r.chunks = chunks_;
  r.bytes_in = bytes_in_;
  r.bytes_out = bytes_out_;
  r.wall_time_ms = wall_ms;
  const double sec = wall_ms / 1000.0;
  r.throughput_mb_s = (sec > 0.0) ? (bytes_in_ / (1024.0 * 1024.0)) / sec : 0.0;
  r.rows_per_sec = (sec > 0.0) ? rows_ / sec : 0.0;

  r.stages.reserve(stage_order_.size());
  for (const auto& name : stage_order_) r.stages.push_back(StageTiming{name, stage_accum_ms_.at(name)});
  return r;
}

}
