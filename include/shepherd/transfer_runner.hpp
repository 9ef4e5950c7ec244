#pragma once

#include <cstdint>
#include <string>

#include "shepherd/clock.hpp"
#include "shepherd/process_result.hpp"
#include "shepherd/provider_profile.hpp"
#include "shepherd/restic_command.hpp"
#include "shepherd/retry_coordinator.hpp"
#include "shepherd/supervisor.hpp"
#include "shepherd/transfer_registry.hpp"
#include "shepherd/transfer_tuner.hpp"

namespace shepherd {

/// @brief One tracked restic operation against a remote provider.
struct TransferRequest {
  /// @brief Registry key.
  std::string id;
  Provider provider = Provider::s3;
  ResticOperation operation;
  /// @brief Expected size in bytes; 0 when unknown.
  std::uint64_t total_bytes = 0;
  /// @brief Conditions used to tune the first attempt.
  NetworkConditions conditions;
};

/// @brief Final result of a transfer after all attempts.
struct TransferReport {
  Outcome outcome;
  /// @brief Profile used by the last attempt.
  ProviderProfile profile;
  /// @brief Attempts made, including the first.
  int attempts = 0;
};

/// @brief Drives a transfer through supervisor runs, backoff and registry bookkeeping.
///
/// Each attempt is tuned for the request's conditions; a timed-out attempt
/// degrades the profile before the next one. Progress reported on stdout
/// updates the registry's byte count. The progress channel in the run options,
/// if any, is finished once, after the last attempt.
class TransferRunner {
 public:
  TransferRunner(ProcessSupervisor& supervisor, TransferRegistry& registry,
                 const TransferTuner& tuner, RetryCoordinator retry = {},
                 Clock& clock = steady_clock());

  TransferReport run(const ResticInvocation& invocation, const TransferRequest& request,
                     RunOptions options = {});

 private:
  // Waits out a backoff delay; returns false if the run was cancelled meanwhile.
  bool backoff(const CancelToken& cancel, std::chrono::milliseconds delay);

  ProcessSupervisor& supervisor_;
  TransferRegistry& registry_;
  const TransferTuner& tuner_;
  RetryCoordinator retry_;
  Clock& clock_;
};

}  // namespace shepherd
