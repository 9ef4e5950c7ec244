#include "shepherd/transfer_runner.hpp"

#include <utility>

#include "shepherd/log.hpp"
#include "shepherd/progress_parser.hpp"

namespace shepherd {

namespace {

void finish_channel(const RunOptions& options, ProgressSnapshot::Kind kind) {
  if (!options.progress) {
    return;
  }
  ProgressSnapshot terminal = options.progress->last();
  terminal.kind = kind;
  if (kind == ProgressSnapshot::Kind::completed) {
    terminal.percent = 100.0;
  }
  options.progress->finish(std::move(terminal));
}

}  // namespace

TransferRunner::TransferRunner(ProcessSupervisor& supervisor, TransferRegistry& registry,
                               const TransferTuner& tuner, RetryCoordinator retry, Clock& clock)
    : supervisor_(supervisor),
      registry_(registry),
      tuner_(tuner),
      retry_(std::move(retry)),
      clock_(clock) {}

bool TransferRunner::backoff(const CancelToken& cancel, std::chrono::milliseconds delay) {
  if (cancel.native_handle() < 0) {
    clock_.sleep_for(delay);
    return true;
  }
  return !cancel.wait_for(delay);
}

TransferReport TransferRunner::run(const ResticInvocation& invocation,
                                   const TransferRequest& request, RunOptions options) {
  TransferReport report{.outcome = ProcessError{Cancelled{}},
                        .profile = tuner_.tune(request.provider, request.conditions),
                        .attempts = 0};
  const bool finish_progress = options.finish_progress;
  options.finish_progress = false;

  ProgressParser parser([&](const ProgressSnapshot& snapshot) {
    registry_.update(request.id, snapshot.bytes_done);
  });
  options.line_handlers.push_back(parser.handler());

  auto conclude = [&](ProgressSnapshot::Kind kind) {
    if (finish_progress) {
      finish_channel(options, kind);
    }
    return std::move(report);
  };

  if (!registry_.start(request.id, request.provider, request.total_bytes)) {
    report.outcome = ProcessError{
        SpawnFailed{.reason = "transfer " + request.id + " is already active",
                    .code = make_error_code(errc::invalid_argument)}};
    return conclude(ProgressSnapshot::Kind::aborted);
  }

  while (true) {
    ++report.attempts;
    auto spec = invocation.build(request.operation, &report.profile);
    if (!spec) {
      registry_.fail(request.id, spec.error());
      report.outcome = ProcessError{SpawnFailed{.reason = spec.error().context,
                                                .code = spec.error().code}};
      return conclude(ProgressSnapshot::Kind::aborted);
    }

    log::transfer()->info("transfer {} attempt {}: {}", request.id, report.attempts,
                          spec->describe());
    report.outcome = supervisor_.run(*spec, options);
    if (report.outcome) {
      registry_.complete(request.id);
      return conclude(ProgressSnapshot::Kind::completed);
    }

    const ProcessError& error = report.outcome.error();
    if (!is_retryable(error) || !retry_.should_retry(report.attempts, report.profile)) {
      registry_.fail(request.id, to_error(error));
      return conclude(ProgressSnapshot::Kind::aborted);
    }

    if (std::holds_alternative<TimedOut>(error)) {
      report.profile = tuner_.degrade(report.profile);
    }
    auto delay = retry_.delay(report.attempts, report.profile);
    registry_.record_retry(request.id);
    log::transfer()->warn("transfer {} attempt {} failed ({}), retrying in {} ms", request.id,
                          report.attempts, describe(error), delay.count());

    if (!backoff(options.cancel, delay)) {
      report.outcome = ProcessError{Cancelled{}};
      registry_.fail(request.id, to_error(report.outcome.error()));
      return conclude(ProgressSnapshot::Kind::aborted);
    }
  }
}

}  // namespace shepherd
