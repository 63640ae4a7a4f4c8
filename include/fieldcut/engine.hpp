#pragma once
#include "fieldcut/line_transformer.hpp"
#include "fieldcut/metrics.hpp"
#include "fieldcut/parallel_dispatcher.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace fc {

struct EngineConfig {
  std::string input;
  std::string output;
  std::size_t threads = 0; // 0 = default_parallelism(); also the chunk target
  TransformConfig transform;
};

struct RunResult {
  bool ok = false;
  std::string error;     // set when !ok
  int last_errno = 0;
  std::size_t threads = 0;
  RunStats stats;
};

// FileView -> ChunkPlanner -> ParallelDispatcher -> OutputAssembler.
class Engine {
public:
  explicit Engine(EngineConfig cfg, ProgressCounter progress = nullptr);

  // Whole run against the configured paths. I/O failures come back in
  // RunResult; allocation failure in a worker propagates as an exception.
  RunResult run() const;

  // Same pipeline over an in-memory buffer; returns the output bytes.
  std::string transform_buffer(std::string_view bytes, std::uint64_t* rows_out = nullptr) const;


private:
  EngineConfig cfg_;
  ProgressCounter progress_;
};

}
