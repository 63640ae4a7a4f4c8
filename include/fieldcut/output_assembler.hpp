#pragma once
#include "fieldcut/line_transformer.hpp"

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace fc {

// Writes per-chunk outputs to the destination strictly in chunk order.
// Failures leave whatever was already written in place (no rollback).
class OutputAssembler {
public:
  explicit OutputAssembler(std::string path);
  ~OutputAssembler();

  OutputAssembler(const OutputAssembler&) = delete;
  OutputAssembler& operator=(const OutputAssembler&) = delete;

  // Creates or truncates the destination.
  bool open();

  // Writes outputs[0], outputs[1], ... skipping empty buffers, then flushes
  // and closes. Opens first if open() was not called.
  bool write_all(const std::vector<ChunkOutput>& outputs);

  bool close();

  std::uint64_t bytes_written() const noexcept { return bytes_; }
  int last_error() const noexcept { return last_errno_; }
  const std::string& error() const { return err_; }
  const std::string& path() const { return path_; }

private:
  bool fail(const char* what);

  std::string path_;
  std::FILE* f_{nullptr};
  std::uint64_t bytes_{0};
  int last_errno_{0};
  std::string err_;
};

}
