#pragma once
#include "fieldcut/engine.hpp"
#include "fieldcut/line_transformer.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace fc {

struct Cli {
  std::string input;
  std::string output;
  char delimiter = ':';
  std::size_t threads = 0; // 0 = host parallelism
  FieldSelector fields{1, 2};
  std::optional<FilterPredicate> filter_equal;
  bool strip_cr = false;
  bool keep_empty = false;
  double progress_interval_sec = 0.1;
  bool progress = true;
  bool quiet = false;
  std::string run_json; // empty = no run report
  bool help = false;
  bool version = false;
};

// Parses argv. Returns false on a configuration error (message in `err`);
// nothing has touched the filesystem at that point. `--help`/`--version`
// succeed with the matching flag set and skip the required-path checks.
bool parse_cli(int argc, const char* const* argv, Cli& out, std::string& err);

std::string usage();

// "1,2, 5" -> {1,2,5}. Empty items, signs and non-digits are errors.
std::optional<FieldSelector> parse_index_list(std::string_view s, std::string* err = nullptr);

// Exactly two indices: "c1,c2".
std::optional<FilterPredicate> parse_filter(std::string_view s, std::string* err = nullptr);

// A single delimiter byte; accepts "\t" and "tab" for TAB.
std::optional<char> parse_delimiter(std::string_view s);

inline constexpr double kMaxProgressIntervalSec = 3600.0;

// Decimal seconds in (0, kMaxProgressIntervalSec], e.g. "0.25".
std::optional<double> parse_seconds(std::string_view s);

EngineConfig to_engine_config(const Cli& c);

}
