#pragma once

#include <chrono>
#include <functional>
#include <optional>

#include "shepherd/clock.hpp"
#include "shepherd/result.hpp"
#include "shepherd/status.hpp"

namespace shepherd::internal {

struct TerminateOps {
  std::function<Result<std::optional<ExitStatus>>()> try_wait;
  std::function<Result<ExitStatus>()> wait_blocking;
  std::function<Result<void>()> terminate;
  std::function<Result<void>()> kill;
};

// SIGTERM, poll for exit until `kill_grace` elapses, then SIGKILL. Always reaps
// the child before returning, so no zombie or orphan survives the call.
Result<ExitStatus> terminate_and_reap(TerminateOps& ops, Clock& clock,
                                      std::chrono::milliseconds kill_grace);

}  // namespace shepherd::internal
