#include "shepherd/status.hpp"

namespace shepherd {

ExitStatus ExitStatus::exited(int code) noexcept {
  ExitStatus status;
  status.kind_ = Kind::exited;
  status.value_ = code;
  return status;
}

ExitStatus ExitStatus::signaled(int signo) noexcept {
  ExitStatus status;
  status.kind_ = Kind::signaled;
  status.value_ = signo;
  return status;
}

std::optional<int> ExitStatus::code() const noexcept {
  if (kind_ != Kind::exited) {
    return std::nullopt;
  }
  return value_;
}

std::optional<int> ExitStatus::signal() const noexcept {
  if (kind_ != Kind::signaled) {
    return std::nullopt;
  }
  return value_;
}

int ExitStatus::effective_code() const noexcept {
  return kind_ == Kind::exited ? value_ : kSignalExitBase + value_;
}

}  // namespace shepherd
