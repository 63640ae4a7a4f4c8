#include "fieldcut/output_assembler.hpp"
#include <cerrno>
#include <cstring>
#include <utility>

namespace fc {

OutputAssembler::OutputAssembler(std::string path) : path_(std::move(path)) {}

OutputAssembler::~OutputAssembler() {
  if (f_) std::fclose(f_);
}

bool OutputAssembler::fail(const char* what) {
  last_errno_ = errno;
  err_ = std::string(what) + " failed for '" + path_ + "': " + std::strerror(last_errno_);
  if (f_) { std::fclose(f_); f_ = nullptr; }
  return false;
}

bool OutputAssembler::open() {
  if (f_) return true;
  f_ = std::fopen(path_.c_str(), "wb");
  if (!f_) return fail("create");
  bytes_ = 0;
  return true;
}

bool OutputAssembler::write_all(const std::vector<ChunkOutput>& outputs) {
  if (!f_ && !open()) return false;

  for (const auto& out : outputs) {
    if (out.bytes.empty()) continue;
    std::size_t n = std::fwrite(out.bytes.data(), 1, out.bytes.size(), f_);
    bytes_ += n;
    if (n != out.bytes.size()) return fail("write");
  }
  return close();
}

bool OutputAssembler::close() {
  if (!f_) return true;
  if (std::fflush(f_) != 0) return fail("flush");
  std::FILE* f = std::exchange(f_, nullptr);
  if (std::fclose(f) != 0) {
    last_errno_ = errno;
    err_ = "close failed for '" + path_ + "': " + std::strerror(last_errno_);
    return false;
  }
  return true;
}

}
