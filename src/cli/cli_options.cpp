#include "fieldcut/cli_options.hpp"
#include <charconv>
#include <cmath>
#include <system_error>
#include <utility>
#include <fast_float/fast_float.h>

namespace fc {

static std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

static std::optional<std::size_t> parse_index(std::string_view s) {
  s = trim(s);
  if (s.empty()) return std::nullopt;
  std::size_t v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

std::optional<FieldSelector> parse_index_list(std::string_view s, std::string* err) {
  FieldSelector out;
  std::size_t start = 0;
  while (true) {
    std::size_t comma = s.find(',', start);
    std::string_view item = s.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start);
    auto v = parse_index(item);
    if (!v) {
      if (err) *err = "invalid column index '" + std::string(trim(item)) + "' in '" + std::string(s) + "'";
      return std::nullopt;
    }
    out.push_back(*v);
    if (comma == std::string_view::npos) break;
    start = comma + 1;
  }
  return out;
}

std::optional<FilterPredicate> parse_filter(std::string_view s, std::string* err) {
  auto idx = parse_index_list(s, err);
  if (!idx) return std::nullopt;
  if (idx->size() != 2) {
    if (err) *err = "filter needs exactly two columns (col1,col2), got '" + std::string(s) + "'";
    return std::nullopt;
  }
  return FilterPredicate{(*idx)[0], (*idx)[1]};
}

std::optional<char> parse_delimiter(std::string_view s) {
  if (s == "\\t" || s == "tab") return '\t';
  if (s.size() != 1) return std::nullopt;
  if (s[0] == '\n') return std::nullopt;
  return s[0];
}

std::optional<double> parse_seconds(std::string_view s) {
  s = trim(s);
  double v = 0.0;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  if (!std::isfinite(v) || v <= 0.0 || v > kMaxProgressIntervalSec) return std::nullopt;
  return v;
}

std::string usage() {
  return
    "Usage: fieldcut -i <input> -o <output> [options]\n"
    "  -i, --input <path>          input file (required)\n"
    "  -o, --output <path>         output file (required)\n"
    "  -d, --delimiter <char>      field delimiter byte (default ':'; \\t or tab for TAB)\n"
    "  -t, --threads <n>           worker threads (default: host parallelism)\n"
    "  -f, --fields <i,j,...>      0-based columns to extract (default 1,2)\n"
    "      --filter-equal <c1,c2>  drop rows whose columns c1 and c2 are equal\n"
    "      --strip-cr              trim a trailing '\\r' from each line\n"
    "      --keep-empty            write empty selected fields as empty columns\n"
    "      --progress-interval=S   progress refresh in seconds (default 0.1)\n"
    "      --no-progress           do not print the progress line\n"
    "      --run-json=<path>       write a JSON run summary\n"
    "  -q, --quiet                 no progress, no summary\n"
    "  -h, --help                  show this help\n"
    "      --version               print version\n";
}

bool parse_cli(int argc, const char* const* argv, Cli& c, std::string& err) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    std::string val;

    // Matches "--long=value", "--long value" or "-s value".
    auto take = [&](const char* shrt, const char* lng) -> int {
      const std::string l(lng);
      if (a.rfind(l + "=", 0) == 0) { val = a.substr(l.size() + 1); return 1; }
      if (a == l || (shrt && a == shrt)) {
        if (i + 1 >= argc) { err = "missing value for " + a; return -1; }
        val = argv[++i];
        return 1;
      }
      return 0;
    };

    if (a == "-h" || a == "--help") { c.help = true; return true; }
    if (a == "--version")           { c.version = true; return true; }
    if (a == "--strip-cr")    { c.strip_cr = true; continue; }
    if (a == "--keep-empty")  { c.keep_empty = true; continue; }
    if (a == "--no-progress") { c.progress = false; continue; }
    if (a == "-q" || a == "--quiet") { c.quiet = true; c.progress = false; continue; }

    int r;
    if ((r = take("-i", "--input")) != 0) {
      if (r < 0) return false;
      c.input = val; continue;
    }
    if ((r = take("-o", "--output")) != 0) {
      if (r < 0) return false;
      c.output = val; continue;
    }
    if ((r = take("-d", "--delimiter")) != 0) {
      if (r < 0) return false;
      auto d = parse_delimiter(val);
      if (!d) { err = "delimiter must be a single byte, got '" + val + "'"; return false; }
      c.delimiter = *d; continue;
    }
    if ((r = take("-t", "--threads")) != 0) {
      if (r < 0) return false;
      auto n = parse_index(val);
      if (!n || *n == 0) { err = "threads must be a positive integer, got '" + val + "'"; return false; }
      c.threads = *n; continue;
    }
    if ((r = take("-f", "--fields")) != 0) {
      if (r < 0) return false;
      auto f = parse_index_list(val, &err);
      if (!f) return false;
      c.fields = std::move(*f); continue;
    }
    if ((r = take(nullptr, "--filter-equal")) != 0) {
      if (r < 0) return false;
      auto f = parse_filter(val, &err);
      if (!f) return false;
      c.filter_equal = *f; continue;
    }
    if ((r = take(nullptr, "--progress-interval")) != 0) {
      if (r < 0) return false;
      auto s = parse_seconds(val);
      if (!s) { err = "progress interval must be in (0, 3600] seconds, got '" + val + "'"; return false; }
      c.progress_interval_sec = *s; continue;
    }
    if ((r = take(nullptr, "--run-json")) != 0) {
      if (r < 0) return false;
      c.run_json = val; continue;
    }

    err = "unknown argument: " + a;
    return false;
  }

  if (c.input.empty())  { err = "missing required --input"; return false; }
  if (c.output.empty()) { err = "missing required --output"; return false; }
  return true;
}

EngineConfig to_engine_config(const Cli& c) {
  EngineConfig e;
  e.input = c.input;
  e.output = c.output;
  e.threads = c.threads;
  e.transform.delimiter = c.delimiter;
  e.transform.strip_cr = c.strip_cr;
  e.transform.empty_fields = c.keep_empty ? EmptyFieldMode::Keep : EmptyFieldMode::Omit;
  e.transform.selector = c.fields;
  e.transform.filter = c.filter_equal;
  return e;
}

}
