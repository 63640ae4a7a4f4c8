#pragma once
#include "fieldcut/parallel_dispatcher.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>

namespace fc {

// Polls the shared row counter on a fixed interval and rewrites a single
// "\rProcessing: N lines | X MB/s" line. Advisory only: it never blocks the
// workers and nothing reads back what it prints.
class ProgressReporter {
public:
  struct Config {
    std::chrono::milliseconds interval{100};
    double bytes_per_row = 50.0; // throughput estimate, rows -> bytes
  };

  ProgressReporter(Config cfg, ProgressCounter counter, std::ostream& out);
  ~ProgressReporter();

  ProgressReporter(const ProgressReporter&) = delete;
  ProgressReporter& operator=(const ProgressReporter&) = delete;

  void start();
  // Wakes the poller, joins it and clears the progress line. Idempotent.
  void stop();

  // Lines printed so far; read after stop().
  std::uint64_t updates() const noexcept { return updates_; }

  static std::string format_line(std::uint64_t rows, double elapsed_sec, double bytes_per_row);

private:
  void loop();

  Config cfg_;
  ProgressCounter counter_;
  std::ostream& out_;
  std::chrono::steady_clock::time_point t0_;
  std::thread th_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool stop_{false};
  std::uint64_t updates_{0};
};

}
