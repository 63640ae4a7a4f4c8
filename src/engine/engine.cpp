#include "fieldcut/engine.hpp"
#include "fieldcut/chunk_planner.hpp"
#include "fieldcut/file_view.hpp"
#include "fieldcut/output_assembler.hpp"

#include <chrono>
#include <utility>
#include <vector>

namespace fc {

Engine::Engine(EngineConfig cfg, ProgressCounter progress)
  : cfg_(std::move(cfg)), progress_(std::move(progress)) {}

RunResult Engine::run() const {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  RunResult res;
  MetricsRegistry metrics;
  ParallelDispatcher dispatcher(ParallelDispatcher::Config{cfg_.threads}, progress_);
  res.threads = dispatcher.threads();
  auto finish = [&](bool ok) {
    const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();
    res.stats = metrics.snapshot(wall_ms);
    res.ok = ok;
    return res;
  };

  FileView view;
  {
    StageTimer st(metrics, "map");
    if (!view.open(cfg_.input)) {
      res.error = view.error();
      res.last_errno = view.last_error();
      return finish(false);
    }
  }
  metrics.add_bytes_in(view.size());

  std::vector<Chunk> chunks;
  {
    StageTimer st(metrics, "plan");
    ChunkPlanner::Config pcfg;
    pcfg.parallelism = dispatcher.threads();
    pcfg.terminator = cfg_.transform.terminator;
    chunks = ChunkPlanner(pcfg).plan(view.bytes());
  }
  metrics.add_chunks(chunks.size());

  std::vector<ChunkOutput> outputs;
  {
    StageTimer st(metrics, "transform");
    LineTransformer xf(cfg_.transform);
    outputs = dispatcher.run(view.bytes(), chunks, xf);
  }
  for (const auto& o : outputs) metrics.add_rows(o.rows);

  {
    StageTimer st(metrics, "write");
    OutputAssembler out(cfg_.output);
    const bool wrote = out.write_all(outputs);
    metrics.add_bytes_out(out.bytes_written());
    if (!wrote) {
      res.error = out.error();
      res.last_errno = out.last_error();
      return finish(false);
    }
  }

  return finish(true);
}

std::string Engine::transform_buffer(std::string_view bytes, std::uint64_t* rows_out) const {
  ParallelDispatcher dispatcher(ParallelDispatcher::Config{cfg_.threads}, progress_);
  ChunkPlanner::Config pcfg;
  pcfg.parallelism = dispatcher.threads();
  pcfg.terminator = cfg_.transform.terminator;
  auto chunks = ChunkPlanner(pcfg).plan(bytes);
  auto outputs = dispatcher.run(bytes, chunks, LineTransformer(cfg_.transform));

  std::string out;
  std::uint64_t rows = 0;
  for (const auto& o : outputs) { out += o.bytes; rows += o.rows; }
  if (rows_out) *rows_out = rows;
  return out;
}

}
