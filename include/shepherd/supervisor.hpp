#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <vector>

#include "shepherd/cancellation.hpp"
#include "shepherd/clock.hpp"
#include "shepherd/output_router.hpp"
#include "shepherd/process_result.hpp"
#include "shepherd/process_spec.hpp"
#include "shepherd/progress_channel.hpp"

namespace shepherd {

namespace internal {
class Backend;
}  // namespace internal

/// @brief Supervisor-wide defaults.
struct SupervisorConfig {
  /// @brief Timeout applied to specs that do not set one.
  std::chrono::milliseconds default_timeout = ProcessSpec::kDefaultTimeout;
  /// @brief Time between SIGTERM and SIGKILL when a run is timed out or cancelled.
  std::chrono::milliseconds kill_grace{std::chrono::seconds(2)};
};

/// @brief Per-run observers and controls.
struct RunOptions {
  /// @brief Invoked once per output line, in registration order.
  std::vector<LineHandler> line_handlers;
  /// @brief Receives snapshots parsed from restic `--json` stdout lines.
  std::shared_ptr<ProgressChannel> progress;
  /// @brief Publish the terminal snapshot and close `progress` when the run ends.
  bool finish_progress = true;
  /// @brief Cancellation scope for the run.
  CancelToken cancel;
};

/// @brief Handle to a run started with ProcessSupervisor::launch().
class RunHandle {
 public:
  RunHandle(RunHandle&&) noexcept = default;
  RunHandle& operator=(RunHandle&&) = delete;
  /// @brief Cancels a run whose outcome was never taken, then waits for it.
  ~RunHandle();

  /// @brief Request cancellation of the run.
  void cancel() noexcept;
  /// @brief Wait for the run to end and take its outcome. Call at most once.
  Outcome get();
  /// @brief True once the outcome is available without blocking.
  [[nodiscard]] bool ready() const;

 private:
  friend class ProcessSupervisor;
  RunHandle(std::unique_ptr<CancelSource> source, std::future<Outcome> future);

  std::unique_ptr<CancelSource> source_;
  std::future<Outcome> future_;
};

/// @brief Runs one external process to completion, timeout or cancellation.
///
/// stdout and stderr are drained concurrently on a single poll(2) loop together
/// with the deadline and the cancellation descriptor. A timed-out or cancelled
/// child gets SIGTERM, then SIGKILL after the kill grace, and is reaped before
/// the outcome is returned. The supervisor never retries.
class ProcessSupervisor {
 public:
  explicit ProcessSupervisor(SupervisorConfig config = {});
  /// @brief Construct with an explicit clock and process backend (used by tests).
  ProcessSupervisor(SupervisorConfig config, Clock& clock, internal::Backend& backend);

  /// @brief Run `spec` on the calling thread.
  Outcome run(const ProcessSpec& spec, RunOptions options = {});

  /// @brief Run `spec` on a worker thread.
  ///
  /// The handle owns a fresh cancellation scope; a token already present in
  /// `options` still cancels the run too. The supervisor must outlive the handle's run.
  RunHandle launch(ProcessSpec spec, RunOptions options = {});

  [[nodiscard]] const SupervisorConfig& config() const noexcept { return config_; }

 private:
  SupervisorConfig config_;
  Clock& clock_;
  internal::Backend& backend_;
};

}  // namespace shepherd
