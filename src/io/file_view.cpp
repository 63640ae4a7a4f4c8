#include "fieldcut/file_view.hpp"
#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fc {

FileView::~FileView() { close(); }

FileView::FileView(FileView&& other) noexcept
  : fd_(std::exchange(other.fd_, -1)),
    data_(std::exchange(other.data_, nullptr)),
    size_(std::exchange(other.size_, 0)),
    mapped_(std::exchange(other.mapped_, false)),
    open_(std::exchange(other.open_, false)),
    last_errno_(other.last_errno_),
    err_(std::move(other.err_)) {}

FileView& FileView::operator=(FileView&& other) noexcept {
  if (this != &other) {
    close();
    fd_         = std::exchange(other.fd_, -1);
    data_       = std::exchange(other.data_, nullptr);
    size_       = std::exchange(other.size_, 0);
    mapped_     = std::exchange(other.mapped_, false);
    open_       = std::exchange(other.open_, false);
    last_errno_ = other.last_errno_;
    err_        = std::move(other.err_);
  }
  return *this;
}

bool FileView::fail(const char* what, const std::string& path) {
  last_errno_ = errno;
  err_ = std::string(what) + " failed for '" + path + "': " + std::strerror(last_errno_);
  close();
  return false;
}

bool FileView::open(const std::string& path) {
  close();
  last_errno_ = 0;
  err_.clear();

  fd_ = ::open(path.c_str(), O_RDONLY);
  if (fd_ < 0) return fail("open", path);

  struct stat sb;
  if (::fstat(fd_, &sb) != 0) return fail("fstat", path);
  if (!S_ISREG(sb.st_mode)) {
    errno = EINVAL;
    return fail("open (not a regular file)", path);
  }

  size_ = static_cast<std::size_t>(sb.st_size);
  if (size_ == 0) {
    // mmap rejects zero-length mappings; an empty file is simply an empty view.
    open_ = true;
    return true;
  }

  void* p = ::mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
  if (p == MAP_FAILED) return fail("mmap", path);
  data_ = static_cast<const char*>(p);
  mapped_ = true;

  // Advisory only.
  (void)::posix_madvise(p, size_, POSIX_MADV_SEQUENTIAL);

  open_ = true;
  return true;
}

void FileView::close() noexcept {
  if (mapped_) ::munmap(const_cast<char*>(data_), size_);
  if (fd_ >= 0) ::close(fd_);
  fd_ = -1;
  data_ = nullptr;
  size_ = 0;
  mapped_ = false;
  open_ = false;
}

}
