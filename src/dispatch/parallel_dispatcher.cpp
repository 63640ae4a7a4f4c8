#include "fieldcut/parallel_dispatcher.hpp"
#include <algorithm>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>

namespace fc {

std::size_t default_parallelism() noexcept {
  unsigned n = std::thread::hardware_concurrency();
  return n ? static_cast<std::size_t>(n) : 1;
}

ParallelDispatcher::ParallelDispatcher(Config cfg, ProgressCounter progress)
  : threads_(cfg.threads ? cfg.threads : default_parallelism()),
    progress_(std::move(progress)) {}

std::vector<ChunkOutput> ParallelDispatcher::run(std::string_view bytes,
                                                 const std::vector<Chunk>& chunks,
                                                 const LineTransformer& xf) const {
  std::vector<ChunkOutput> results(chunks.size());
  if (chunks.empty()) return results;

  std::atomic<std::size_t> next{0};
  std::atomic<bool> failed{false};
  std::exception_ptr first_error;
  std::mutex err_mu;

  auto worker = [&]() {
    try {
      while (!failed.load(std::memory_order_relaxed)) {
        std::size_t i = next.fetch_add(1, std::memory_order_relaxed);
        if (i >= chunks.size()) break;
        const Chunk& c = chunks[i];
        results[i] = xf.transform(c.slice(bytes), c.first);
        if (progress_) progress_->fetch_add(results[i].rows, std::memory_order_relaxed);
      }
    } catch (...) {
      std::lock_guard<std::mutex> lk(err_mu);
      if (!first_error) first_error = std::current_exception();
      failed.store(true, std::memory_order_relaxed);
    }
  };

  const std::size_t n = std::min(threads_, chunks.size());
  if (n == 1) {
    worker();
  } else {
    std::vector<std::thread> pool;
    pool.reserve(n);
    try {
      for (std::size_t t = 0; t < n; ++t) pool.emplace_back(worker);
    } catch (...) {
      // Could not spawn a thread: stop the ones running, then report.
      failed.store(true, std::memory_order_relaxed);
      for (auto& th : pool) th.join();
      throw;
    }
    for (auto& th : pool) th.join();
  }

  if (first_error) std::rethrow_exception(first_error);
  return results;
}

}
