#include "fieldcut/cli_options.hpp"
#include "fieldcut/engine.hpp"
#include "fieldcut/parallel_dispatcher.hpp"
#include "fieldcut/progress_reporter.hpp"
#include "fieldcut/run_json.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>

#ifndef FC_VERSION
#define FC_VERSION "0.0.0"
#endif

namespace {

int write_report(const fc::Cli& cli, const fc::RunResult& r) {
  fc::RunJsonPayload p{};
  fc::fill_from_stats(p, r.stats);
  p.threads = r.threads;
  p.input = cli.input;
  p.output = cli.output;
  p.delimiter = cli.delimiter;
  p.fields = cli.fields;
  if (cli.filter_equal) p.filter_equal = std::make_pair(cli.filter_equal->col1, cli.filter_equal->col2);
  p.empty_fields = cli.keep_empty ? "keep" : "omit";

  std::string err;
  if (!fc::write_run_json(cli.run_json, fc::RunJsonWriter::to_json(p), &err)) {
    std::cerr << "[fieldcut] run report not written: " << err << "\n";
    return 1;
  }
  return 0;
}

int run(const fc::Cli& cli) {
  auto counter = fc::make_progress_counter();

  fc::ProgressReporter::Config pcfg;
  pcfg.interval = std::chrono::milliseconds(
      std::max<long long>(1, static_cast<long long>(cli.progress_interval_sec * 1000.0)));
  fc::ProgressReporter progress(pcfg, counter, std::cerr);
  if (cli.progress) progress.start();

  fc::Engine engine(fc::to_engine_config(cli), counter);
  fc::RunResult r = engine.run();
  progress.stop();

  if (!r.ok) {
    std::cerr << "[fieldcut] I/O error: " << r.error << "\n";
    return 1;
  }

  if (!cli.quiet) {
    const double sec = r.stats.wall_time_ms / 1000.0;
    const double mb = r.stats.bytes_in / (1024.0 * 1024.0);
    std::cout << std::fixed << std::setprecision(1)
              << "Complete! " << r.stats.rows << " lines processed in " << sec << "s\n"
              << "Speed: " << (sec > 0.0 ? mb / sec : 0.0) << " MB/s"
              << " (" << r.stats.chunks << " chunks, " << r.threads << " threads)\n";
  }

  if (!cli.run_json.empty()) return write_report(cli, r);
  return 0;
}

}

int main(int argc, char** argv) {
  fc::Cli cli;
  std::string err;
  if (!fc::parse_cli(argc, argv, cli, err)) {
    std::cerr << "[fieldcut] " << err << "\n" << fc::usage();
    return 2;
  }
  if (cli.help)    { std::cout << fc::usage(); return 0; }
  if (cli.version) { std::cout << "fieldcut " << FC_VERSION << "\n"; return 0; }

  try {
    return run(cli);
  } catch (const std::exception& e) {
    std::cerr << "\n[fieldcut] fatal: " << e.what() << "\n";
    return 1;
  }
}
