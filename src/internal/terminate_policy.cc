#include "shepherd/internal/terminate_policy.hpp"

#include <cerrno>

namespace shepherd::internal {

namespace {

// The group may already be gone (the leader exited and was not yet reaped).
bool already_gone(const Error& error) {
  return error.code == std::error_code(ESRCH, std::system_category());
}

}  // namespace

Result<ExitStatus> terminate_and_reap(TerminateOps& ops, Clock& clock,
                                      std::chrono::milliseconds kill_grace) {
  constexpr auto kSleepStep = std::chrono::milliseconds(1);

  // A failed SIGTERM skips the grace period and escalates straight to SIGKILL.
  auto term_result = ops.terminate();
  bool term_sent = term_result || already_gone(term_result.error());

  auto grace_deadline = clock.now() + kill_grace;
  while (term_sent && clock.now() < grace_deadline) {
    auto wait_result = ops.try_wait();
    if (!wait_result) {
      return wait_result.error();
    }
    if (wait_result->has_value()) {
      return **wait_result;
    }
    clock.sleep_for(kSleepStep);
  }

  auto kill_result = ops.kill();
  if (!kill_result && !already_gone(kill_result.error())) {
    return kill_result.error();
  }
  return ops.wait_blocking();
}

}  // namespace shepherd::internal
