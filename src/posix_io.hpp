#pragma once
/*
 * POSIX RAII helpers
 *
 * UniqueFd: owns a file descriptor, closes on destruction.
 * MappedFile: read-only private mapping of a whole file (madvise sequential).
 */
#include <cstddef>
#include <string_view>
#include <sys/mman.h>
#include <unistd.h>

class UniqueFd {
public:
  UniqueFd() : fd_(-1) {}
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) { reset(other.fd_); other.fd_ = -1; }
    return *this;
  }
  ~UniqueFd() { reset(); }
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  void reset(int fd = -1) { if (fd_ >= 0) ::close(fd_); fd_ = fd; }
private:
  int fd_;
};

class MappedFile {
public:
  MappedFile() = default;
  MappedFile(const MappedFile&) = delete;
  MappedFile& operator=(const MappedFile&) = delete;
  ~MappedFile() { unmap(); }

  bool map(int fd, size_t size) {
    unmap();
    void* mem = ::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
    if (mem == MAP_FAILED) return false;
    data_ = static_cast<const char*>(mem);
    size_ = size;
    (void)::madvise(mem, size_, MADV_SEQUENTIAL);
    return true;
  }
  std::string_view view() const { return std::string_view(data_, size_); }
private:
  void unmap() {
    if (data_) ::munmap(const_cast<char*>(data_), size_);
    data_ = nullptr;
    size_ = 0;
  }
  const char* data_ = nullptr;
  size_t size_ = 0;
};
