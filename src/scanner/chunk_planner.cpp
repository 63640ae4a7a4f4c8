#include "fieldcut/chunk_planner.hpp"
#include <algorithm>

namespace fc {

// First offset past the terminator at or after `pos`, or bytes.size().
std::size_t ChunkPlanner::next_boundary(std::string_view bytes, std::size_t pos) const {
  if (pos >= bytes.size()) return bytes.size();
  std::size_t nl = bytes.find(cfg_.terminator, pos);
  return (nl == std::string_view::npos) ? bytes.size() : nl + 1;
}

std::vector<std::size_t> ChunkPlanner::boundaries(std::string_view bytes) const {
  const std::size_t len = bytes.size();
  const std::size_t parts = std::max<std::size_t>(cfg_.parallelism, 1);
  const std::size_t stride = len / parts;

  std::vector<std::size_t> out;
  // Never more chunks than bytes, whatever parallelism was asked for.
  out.reserve(std::min(parts, len) + 1);
  out.push_back(0);
  if (len == 0) { out.push_back(0); return out; }

  std::size_t pos = 0;
  while (pos < len) {
    std::size_t tentative = std::min(pos + stride, len);
    // Always > pos: the scan from a boundary consumes at least one byte.
    std::size_t b = next_boundary(bytes, tentative);
    out.push_back(b);
    pos = b;
  }

  if (out.back() != len) out.push_back(len);
  return out;
}

std::vector<Chunk> ChunkPlanner::plan(std::string_view bytes) const {
  auto b = boundaries(bytes);
  std::vector<Chunk> chunks;
  chunks.reserve(b.size() - 1);
  for (std::size_t i = 0; i + 1 < b.size(); ++i) {
    chunks.push_back(Chunk{i, b[i], b[i + 1], b[i] == 0});
  }
  return chunks;
}

}
