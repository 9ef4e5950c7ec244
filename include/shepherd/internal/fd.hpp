#pragma once

#include <fcntl.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <utility>

#include "shepherd/platform.hpp"
#include "shepherd/result.hpp"

namespace shepherd::internal {

class unique_fd {
 public:
  unique_fd() = default;
  explicit unique_fd(int fd) : fd_(fd) {}
  unique_fd(unique_fd&& other) noexcept : fd_(other.release()) {}
  unique_fd& operator=(unique_fd&& other) noexcept {
    if (this != &other) {
      reset(other.release());
    }
    return *this;
  }
  unique_fd(const unique_fd&) = delete;
  unique_fd& operator=(const unique_fd&) = delete;
  ~unique_fd() { reset(-1); }

  [[nodiscard]] int get() const noexcept { return fd_; }
  [[nodiscard]] int release() noexcept { return std::exchange(fd_, -1); }

  void reset(int fd) noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

  explicit operator bool() const noexcept { return fd_ >= 0; }

 private:
  int fd_{-1};
};

inline Error errno_error(const char* context) {
  return Error{.code = std::error_code(errno, std::system_category()), .context = context};
}

inline Result<void> set_fd_flag(int fd, int flag) {
  int flags = ::fcntl(fd, F_GETFD);
  if (flags == -1) {
    return errno_error("fcntl(F_GETFD)");
  }
  if (::fcntl(fd, F_SETFD, flags | flag) == -1) {
    return errno_error("fcntl(F_SETFD)");
  }
  return {};
}

inline Result<void> set_nonblocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL);
  if (flags == -1) {
    return errno_error("fcntl(F_GETFL)");
  }
  if (::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
    return errno_error("fcntl(F_SETFL)");
  }
  return {};
}

struct PipeEnds {
  unique_fd read;
  unique_fd write;
};

// Both ends are close-on-exec; the spawn path dup2()s the child's end onto 0/1/2.
inline Result<PipeEnds> create_pipe() {
  std::array<int, 2> fds{};
#if SHEPHERD_PLATFORM_LINUX
  if (::pipe2(fds.data(), O_CLOEXEC) == -1) {
    return errno_error("pipe2");
  }
  return PipeEnds{unique_fd(fds[0]), unique_fd(fds[1])};
#else
  if (::pipe(fds.data()) == -1) {
    return errno_error("pipe");
  }
  PipeEnds ends{unique_fd(fds[0]), unique_fd(fds[1])};
  auto read_flag = set_fd_flag(ends.read.get(), FD_CLOEXEC);
  if (!read_flag) {
    return read_flag.error();
  }
  auto write_flag = set_fd_flag(ends.write.get(), FD_CLOEXEC);
  if (!write_flag) {
    return write_flag.error();
  }
  return ends;
#endif
}

}  // namespace shepherd::internal
