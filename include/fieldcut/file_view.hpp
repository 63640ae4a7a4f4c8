#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace fc {

// Read-only, zero-copy view of a whole file (mmap). The mapping lives exactly
// as long as the FileView; chunks handed out by the planner borrow from it.
class FileView {
public:
  FileView() = default;
  explicit FileView(const std::string& path) { (void)open(path); }
  ~FileView();

  FileView(const FileView&) = delete;
  FileView& operator=(const FileView&) = delete;
  FileView(FileView&& other) noexcept;
  FileView& operator=(FileView&& other) noexcept;

  // Maps `path`. On failure returns false; last_error()/error() say why.
  // An empty file opens successfully as an empty view.
  bool open(const std::string& path);
  void close() noexcept;

  bool is_open() const noexcept { return open_; }
  const char* data() const noexcept { return data_; }
  std::size_t size() const noexcept { return size_; }
  std::string_view bytes() const noexcept { return std::string_view(data_, size_); }

  int last_error() const noexcept { return last_errno_; }
  const std::string& error() const { return err_; }

private:
  bool fail(const char* what, const std::string& path);

  int fd_{-1};
  const char* data_{nullptr};
  std::size_t size_{0};
  bool mapped_{false};
  bool open_{false};
  int last_errno_{0};
  std::string err_;
};

}
