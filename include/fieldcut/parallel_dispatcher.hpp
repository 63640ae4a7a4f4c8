#pragma once
#include "fieldcut/chunk_planner.hpp"
#include "fieldcut/line_transformer.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace fc {

// Shared row counter: the dispatcher adds to it, a reporter polls it.
using ProgressCounter = std::shared_ptr<std::atomic<std::uint64_t>>;

inline ProgressCounter make_progress_counter() {
  return std::make_shared<std::atomic<std::uint64_t>>(0);
}

// Number of workers used when none is configured (never 0).
std::size_t default_parallelism() noexcept;

class ParallelDispatcher {
public:
  struct Config {
    std::size_t threads = 0; // 0 = default_parallelism()
  };

  explicit ParallelDispatcher(Config cfg, ProgressCounter progress = nullptr);

  // Transforms every chunk of `bytes`; result[i] belongs to chunks[i]
  // whatever order the workers finish in. Blocks until all workers join.
  // A worker exception (allocation failure) is rethrown here.
  std::vector<ChunkOutput> run(std::string_view bytes,
                               const std::vector<Chunk>& chunks,
                               const LineTransformer& xf) const;

  std::size_t threads() const noexcept { return threads_; }

private:
  std::size_t threads_;
  ProgressCounter progress_;
};

}
