#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "fieldcut/engine.hpp"
#include "fieldcut/parallel_dispatcher.hpp"

namespace fs = std::filesystem;

static std::string make_synth(std::size_t rows, std::size_t cols) {
  fs::path p = fs::temp_directory_path() / "fc_bench_synth.txt";
  std::ofstream out(p, std::ios::binary);
  // header
  for (size_t c = 0; c < cols; ++c) { out << "col" << c; if (c+1<cols) out << ":"; }
  out << "\n";
  // rows
  for (size_t r = 0; r < rows; ++r) {
    for (size_t c = 0; c < cols; ++c) {
      if (c == 1) out << "user" << r << "@example.com";
      else out << (r%10) << "." << (c*37%1000);
      if (c+1<cols) out << ":";
    }
    out << "\n";
  }
  out.flush();
  return p.string();
}

struct Args {
  std::string path;            // if empty -> synth
  std::size_t rows = 2'000'000;
  std::size_t cols = 8;
  std::string fields = "1,2";
  int iters = 3;
};

static std::vector<std::size_t> parse_fields(const std::string& s) {
  std::vector<std::size_t> out;
  std::size_t start = 0;
  while (start <= s.size()) {
    auto comma = s.find(',', start);
    out.push_back(std::stoull(s.substr(start, comma - start)));
    if (comma == std::string::npos) break;
    start = comma + 1;
  }
  return out;
}

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i=1;i<argc;++i){
    std::string s(argv[i]);
    auto eq = s.find('=');
    auto key = s.substr(0, eq);
    auto val = (eq==std::string::npos) ? "" : s.substr(eq+1);
    if (key=="--input") a.path = val;
    else if (key=="--rows") a.rows = std::stoull(val);
    else if (key=="--cols") a.cols = std::stoull(val);
    else if (key=="--fields") a.fields = val;
    else if (key=="--iters") a.iters = std::stoi(val);
    else if (key=="--help" || key=="-h") {
      std::cout <<
        "Usage: fc_bench_transform [--input=path] [--rows=N] [--cols=M] [--fields=i,j] [--iters=K]\n"
        "If --input is omitted, a synthetic ':'-delimited file is generated.\n";
      std::exit(0);
    }
  }
  return a;
}

int main(int argc, char** argv){
  Args a = parse_args(argc, argv);

  std::string in = a.path;
  if (in.empty() || !fs::exists(in)) in = make_synth(a.rows, a.cols);
  const fs::path out = fs::temp_directory_path() / "fc_bench_out.txt";

  std::vector<std::size_t> thread_counts{1, 2, 4};
  const std::size_t host = fc::default_parallelism();
  if (host > 4) thread_counts.push_back(host);

  std::cout << "[bench] file=" << in << " iters=" << a.iters << "\n";
  for (std::size_t t : thread_counts) {
    for (int k=1;k<=a.iters;++k) {
      fc::EngineConfig cfg;
      cfg.input = in;
      cfg.output = out.string();
      cfg.threads = t;
      cfg.transform.selector = parse_fields(a.fields);

      fc::RunResult r = fc::Engine(cfg).run();
      if (!r.ok) { std::cerr << "[bench] error: " << r.error << "\n"; return 1; }

      std::cout << "  threads=" << t << " iter " << k
                << ": rows=" << r.stats.rows
                << " chunks=" << r.stats.chunks
                << " time=" << r.stats.wall_time_ms / 1000.0 << "s"
                << "  throughput=" << r.stats.throughput_mb_s << " MiB/s"
                << "  rows/s=" << r.stats.rows_per_sec;
      for (const auto& st : r.stats.stages) std::cout << "  " << st.name << "=" << st.duration_ms << "ms";
      std::cout << "\n";
    }
  }
  std::error_code ec;
  fs::remove(out, ec);
  return 0;
}
