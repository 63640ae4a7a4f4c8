#include "fieldcut/progress_reporter.hpp"
#include <cstdio>
#include <string>
#include <utility>

namespace fc {

ProgressReporter::ProgressReporter(Config cfg, ProgressCounter counter, std::ostream& out)
  : cfg_(cfg), counter_(std::move(counter)), out_(out) {}

ProgressReporter::~ProgressReporter() { stop(); }

std::string ProgressReporter::format_line(std::uint64_t rows, double elapsed_sec, double bytes_per_row) {
  const double mb = (rows * bytes_per_row) / (1024.0 * 1024.0);
  const double mb_s = elapsed_sec > 0.0 ? mb / elapsed_sec : 0.0;
  char buf[96];
  std::snprintf(buf, sizeof(buf), "\rProcessing: %llu lines | %.1f MB/s",
                static_cast<unsigned long long>(rows), mb_s);
  return buf;
}

void ProgressReporter::start() {
  if (th_.joinable() || !counter_) return;
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_ = false;
  }
  t0_ = std::chrono::steady_clock::now();
  th_ = std::thread([this]{ loop(); });
}

void ProgressReporter::stop() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_ = true;
  }
  cv_.notify_all();
  if (th_.joinable()) {
    th_.join();
    if (updates_) out_ << "\r" << std::flush;
  }
}

void ProgressReporter::loop() {
  std::uint64_t last = 0;
  std::unique_lock<std::mutex> lk(mu_);
  while (!cv_.wait_for(lk, cfg_.interval, [this]{ return stop_; })) {
    const std::uint64_t now_rows = counter_->load(std::memory_order_relaxed);
    if (now_rows <= last) continue;
    std::chrono::duration<double> el = std::chrono::steady_clock::now() - t0_;
    out_ << format_line(now_rows, el.count(), cfg_.bytes_per_row) << std::flush;
    last = now_rows;
    ++updates_;
  }
}

}
