#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fc {

// Ordered 0-based column indices; duplicates and reordering allowed.
using FieldSelector = std::vector<std::size_t>;

// Drop a row when both columns exist and hold byte-equal values.
struct FilterPredicate {
  std::size_t col1 = 0;
  std::size_t col2 = 0;
};

enum class EmptyFieldMode {
  Omit, // empty selected field writes nothing; all-empty rows are dropped
  Keep  // empty selected field writes an empty column
};

struct TransformConfig {
  char delimiter  = ':';
  char terminator = '\n';
  char separator  = ',';   // output column separator
  bool strip_cr   = false; // trim one trailing '\r' per line (CRLF input)
  EmptyFieldMode empty_fields = EmptyFieldMode::Omit;
  FieldSelector selector{1, 2};
  std::optional<FilterPredicate> filter;
};

struct ChunkOutput {
  std::string   bytes;
  std::uint64_t rows = 0; // == number of terminators in `bytes`
};

class LineTransformer {
public:
  explicit LineTransformer(TransformConfig cfg);

  // Pure; safe to call concurrently from many threads.
  ChunkOutput transform(std::string_view chunk, bool is_first_chunk) const;

  // Appends the output line for `line` (without terminator) to `out`.
  // Returns false when the row is dropped; `out` is then left unchanged.
  bool transform_line(std::string_view line, std::string& out) const;


private:
  TransformConfig cfg_;
  std::size_t min_fields_; // 1 + max selector index
};

// Splits `line` on `delim` into `fields` (cleared first). No quoting.
void split_fields(std::string_view line, char delim, std::vector<std::string_view>& fields);

}
