#pragma once
#include <cstddef>
#include <string_view>
#include <vector>

namespace fc {

// Half-open byte range [begin, end) of the input. `first` marks the chunk that
// starts at offset 0 and therefore carries the header line.
struct Chunk {
  std::size_t index = 0;
  std::size_t begin = 0;
  std::size_t end   = 0;
  bool        first = false;

  std::size_t size() const noexcept { return end - begin; }
  std::string_view slice(std::string_view whole) const {
    return whole.substr(begin, end - begin);
  }
};

class ChunkPlanner {
public:
  struct Config {
    std::size_t parallelism = 1;   // 0 = unknown, treated as 1
    char        terminator  = '\n';
  };

  ChunkPlanner() = default;
  explicit ChunkPlanner(Config cfg) : cfg_(cfg) {}

  // Boundaries b0 = 0 < b1 < ... < bn = bytes.size(); every interior boundary
  // sits just past a terminator. Empty input yields {0, 0}.
  std::vector<std::size_t> boundaries(std::string_view bytes) const;

  std::vector<Chunk> plan(std::string_view bytes) const;


private:
  std::size_t next_boundary(std::string_view bytes, std::size_t pos) const;

  Config cfg_;
};

}
