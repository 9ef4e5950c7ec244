#include "shepherd/cancellation.hpp"

#include <poll.h>

#include <atomic>
#include <cerrno>
#include <system_error>
#include <utility>

#include "shepherd/internal/fd.hpp"

namespace shepherd {

namespace internal {

struct CancelState {
  std::atomic<bool> cancelled{false};
  unique_fd read_end;
  unique_fd write_end;
};

}  // namespace internal

CancelToken::CancelToken(std::shared_ptr<internal::CancelState> state) : state_(std::move(state)) {}

bool CancelToken::cancelled() const noexcept {
  return state_ && state_->cancelled.load(std::memory_order_acquire);
}

int CancelToken::native_handle() const noexcept { return state_ ? state_->read_end.get() : -1; }

bool CancelToken::wait_for(std::chrono::milliseconds timeout) const {
  if (!state_) {
    return false;
  }
  if (cancelled()) {
    return true;
  }
  pollfd pfd{.fd = state_->read_end.get(), .events = POLLIN, .revents = 0};
  int rc = -1;
  do {
    rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  } while (rc == -1 && errno == EINTR);
  return cancelled();
}

CancelSource::CancelSource() : state_(std::make_shared<internal::CancelState>()) {
  auto pipe_result = internal::create_pipe();
  if (!pipe_result) {
    internal::throw_error(pipe_result.error());
  }
  auto nonblocking = internal::set_nonblocking(pipe_result->write.get());
  if (!nonblocking) {
    internal::throw_error(nonblocking.error());
  }
  state_->read_end = std::move(pipe_result->read);
  state_->write_end = std::move(pipe_result->write);
}

void CancelSource::cancel() noexcept {
  if (state_->cancelled.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  const char byte = 1;
  while (::write(state_->write_end.get(), &byte, 1) == -1 && errno == EINTR) {
  }
}

bool CancelSource::cancelled() const noexcept {
  return state_->cancelled.load(std::memory_order_acquire);
}

CancelToken CancelSource::token() const { return CancelToken(state_); }

}  // namespace shepherd
