#pragma once
#include "fieldcut/metrics.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fc {

struct RunJsonPayload {
  // Top-level KPIs
  std::uint64_t rows = 0;
  std::uint64_t chunks = 0;
  std::uint64_t threads = 0;
  std::uint64_t bytes_in = 0;
  std::uint64_t bytes_out = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double rows_per_sec = 0.0;

  std::vector<std::pair<std::string, double>> stage_times;

  // Run configuration
  std::string input;
  std::string output;
  char delimiter = ':';
  std::vector<std::size_t> fields;
  std::optional<std::pair<std::size_t, std::size_t>> filter_equal;
  std::string empty_fields = "omit";
};

// Copies the counters and stage timings of `s` into `p`.
void fill_from_stats(RunJsonPayload& p, const RunStats& s);

class RunJsonWriter {
public:
  static std::string to_json(const RunJsonPayload& p);
};

// Writes `json` to `path`, creating parent directories.
bool write_run_json(const std::string& path, const std::string& json, std::string* err_out = nullptr);

}
