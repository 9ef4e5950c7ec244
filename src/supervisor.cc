#include "shepherd/supervisor.hpp"

#include <fmt/format.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <exception>
#include <utility>
#include <vector>

#include "shepherd/internal/backend.hpp"
#include "shepherd/internal/lowering.hpp"
#include "shepherd/internal/terminate_policy.hpp"
#include "shepherd/log.hpp"
#include "shepherd/progress_parser.hpp"

namespace shepherd {

namespace {

using std::chrono::milliseconds;

constexpr std::size_t kReadChunk = 64 * 1024;
constexpr milliseconds kPollSlice{50};
constexpr milliseconds kReapSlice{5};

enum class StopReason : std::uint8_t { exited, timed_out, cancelled };

// State of a single supervised run. Lives on the thread executing the run.
class Run {
 public:
  Run(const SupervisorConfig& config, Clock& clock, internal::Backend& backend,
      const ProcessSpec& spec, RunOptions& options, CancelToken extra_cancel)
      : config_(config),
        clock_(clock),
        backend_(backend),
        spec_(spec),
        options_(options),
        tokens_{options.cancel, std::move(extra_cancel)},
        timeout_(spec.timeout().value_or(config.default_timeout)) {
    for (auto& handler : options_.line_handlers) {
      router_.add_handler(handler);
    }
    if (options_.progress) {
      parser_.emplace([channel = options_.progress](const ProgressSnapshot& snapshot) {
        channel->publish(snapshot);
      });
      router_.add_handler(parser_->handler());
    }
  }

  Outcome execute();

 private:
  [[nodiscard]] bool cancel_requested() const;
  void wait_slice(milliseconds slice);
  Result<StopReason> pump(internal::Spawned& child);
  Result<StopReason> await_exit(internal::Spawned& child, std::optional<ExitStatus>& status);
  Result<ExitStatus> stop(internal::Spawned& child);
  void finish_progress(ProgressSnapshot::Kind kind);
  Outcome spawn_failed(const Error& error);

  const SupervisorConfig& config_;
  Clock& clock_;
  internal::Backend& backend_;
  const ProcessSpec& spec_;
  RunOptions& options_;
  std::array<CancelToken, 2> tokens_;
  milliseconds timeout_;
  std::chrono::steady_clock::time_point deadline_{};
  OutputRouter router_;
  std::optional<ProgressParser> parser_;
};

bool Run::cancel_requested() const {
  for (const auto& token : tokens_) {
    if (token.cancelled()) {
      return true;
    }
  }
  return false;
}

// Sleeps for `slice`, waking early on cancellation when a token is pollable.
void Run::wait_slice(milliseconds slice) {
  std::array<pollfd, 2> fds{};
  nfds_t count = 0;
  for (const auto& token : tokens_) {
    if (token.native_handle() >= 0) {
      fds[count++] = pollfd{.fd = token.native_handle(), .events = POLLIN, .revents = 0};
    }
  }
  if (count == 0) {
    clock_.sleep_for(slice);
    return;
  }
  int rc = ::poll(fds.data(), count, static_cast<int>(slice.count()));
  if (rc == -1 && errno != EINTR) {
    clock_.sleep_for(slice);
  }
}

Result<StopReason> Run::pump(internal::Spawned& child) {
  std::array<internal::unique_fd*, 2> pipes{&child.stdout_fd, &child.stderr_fd};
  constexpr std::array<Stream, 2> kStreams{Stream::stdout_stream, Stream::stderr_stream};
  std::vector<char> buffer(kReadChunk);

  while (child.stdout_fd || child.stderr_fd) {
    if (cancel_requested()) {
      return StopReason::cancelled;
    }
    auto now = clock_.now();
    if (now >= deadline_) {
      return StopReason::timed_out;
    }
    auto remaining = std::chrono::ceil<milliseconds>(deadline_ - now);

    std::array<pollfd, 4> fds{};
    std::array<int, 4> stream_of{-1, -1, -1, -1};
    nfds_t count = 0;
    for (std::size_t index = 0; index < pipes.size(); ++index) {
      if (*pipes[index]) {
        stream_of[count] = static_cast<int>(index);
        fds[count++] = pollfd{.fd = pipes[index]->get(), .events = POLLIN, .revents = 0};
      }
    }
    for (const auto& token : tokens_) {
      if (token.native_handle() >= 0) {
        fds[count++] = pollfd{.fd = token.native_handle(), .events = POLLIN, .revents = 0};
      }
    }

    int rc = ::poll(fds.data(), count, static_cast<int>(std::min(remaining, kPollSlice).count()));
    if (rc == -1) {
      if (errno == EINTR) {
        continue;
      }
      return Error{.code = std::error_code(errno, std::system_category()), .context = "poll"};
    }

    for (nfds_t slot = 0; slot < count; ++slot) {
      if (stream_of[slot] < 0 || (fds[slot].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        continue;
      }
      auto index = static_cast<std::size_t>(stream_of[slot]);
      ssize_t n = ::read(fds[slot].fd, buffer.data(), buffer.size());
      if (n > 0) {
        router_.feed(kStreams[index], std::string_view(buffer.data(), static_cast<std::size_t>(n)));
      } else if (n == 0) {
        pipes[index]->reset(-1);
      } else if (errno != EINTR && errno != EAGAIN) {
        return Error{.code = std::error_code(errno, std::system_category()),
                     .context = std::string("read ") + std::string(to_string(kStreams[index]))};
      }
    }
  }
  return StopReason::exited;
}

Result<StopReason> Run::await_exit(internal::Spawned& child, std::optional<ExitStatus>& status) {
  while (true) {
    auto polled = backend_.try_wait(child);
    if (!polled) {
      return polled.error();
    }
    if (polled->has_value()) {
      status = **polled;
      return StopReason::exited;
    }
    if (cancel_requested()) {
      return StopReason::cancelled;
    }
    if (clock_.now() >= deadline_) {
      return StopReason::timed_out;
    }
    wait_slice(kReapSlice);
  }
}

Result<ExitStatus> Run::stop(internal::Spawned& child) {
  child.stdout_fd.reset(-1);
  child.stderr_fd.reset(-1);
  internal::TerminateOps ops{
      .try_wait = [&]() { return backend_.try_wait(child); },
      .wait_blocking = [&]() { return backend_.wait(child); },
      .terminate = [&]() { return backend_.signal(child, SIGTERM); },
      .kill = [&]() { return backend_.signal(child, SIGKILL); },
  };
  return internal::terminate_and_reap(ops, clock_, config_.kill_grace);
}

void Run::finish_progress(ProgressSnapshot::Kind kind) {
  if (!options_.progress || !options_.finish_progress) {
    return;
  }
  ProgressSnapshot terminal = options_.progress->last();
  terminal.kind = kind;
  if (kind == ProgressSnapshot::Kind::completed) {
    terminal.percent = 100.0;
  }
  options_.progress->finish(std::move(terminal));
}

Outcome Run::spawn_failed(const Error& error) {
  std::string reason = error.context.empty()
                           ? error.code.message()
                           : fmt::format("{}: {}", error.context, error.code.message());
  log::process()->warn("failed to start {}: {}", spec_.executable(), reason);
  finish_progress(ProgressSnapshot::Kind::aborted);
  return ProcessError{SpawnFailed{.reason = std::move(reason), .code = error.code}};
}

Outcome Run::execute() {
  if (cancel_requested()) {
    finish_progress(ProgressSnapshot::Kind::aborted);
    return ProcessError{Cancelled{}};
  }

  auto lowered = internal::lower_spec(spec_);
  if (!lowered) {
    return spawn_failed(lowered.error());
  }
  auto spawned = backend_.spawn(*lowered);
  if (!spawned) {
    return spawn_failed(spawned.error());
  }
  internal::Spawned& child = *spawned;
  log::process()->debug("started pid {}: {}", child.pid, spec_.describe());

  deadline_ = clock_.now() + timeout_;
  std::optional<ExitStatus> status;
  Result<StopReason> reason = StopReason::exited;
  try {
    reason = pump(child);
    if (reason && *reason == StopReason::exited) {
      reason = await_exit(child, status);
    }
  } catch (const std::exception& ex) {
    // The child must still be stopped and reaped below.
    reason = Error{.code = make_error_code(errc::execution_failed), .context = ex.what()};
  }

  if (!reason || *reason != StopReason::exited) {
    auto reaped = stop(child);
    if (!reaped) {
      log::process()->error("failed to reap pid {}: {}", child.pid, reaped.error().context);
    }
    router_.finish();
    finish_progress(ProgressSnapshot::Kind::aborted);
    if (!reason) {
      const Error& error = reason.error();
      log::process()->error("supervising pid {} failed: {}: {}", child.pid, error.context,
                            error.code.message());
      return ProcessError{ExecutionFailed{
          .exit_code = reaped ? reaped->effective_code() : -1,
          .message = fmt::format("{}: {}", error.context, error.code.message())}};
    }
    if (*reason == StopReason::timed_out) {
      log::process()->warn("pid {} timed out after {} ms", child.pid, timeout_.count());
      return ProcessError{TimedOut{.duration = timeout_}};
    }
    log::process()->info("pid {} cancelled", child.pid);
    return ProcessError{Cancelled{}};
  }

  router_.finish();
  if (cancel_requested()) {
    finish_progress(ProgressSnapshot::Kind::aborted);
    return ProcessError{Cancelled{}};
  }

  int code = status->effective_code();
  log::process()->debug("pid {} exited with code {}", child.pid, code);
  if (code != 0) {
    finish_progress(ProgressSnapshot::Kind::aborted);
    std::string message = router_.captured(Stream::stderr_stream);
    if (message.empty()) {
      message = router_.captured(Stream::stdout_stream);
    }
    return ProcessError{ExecutionFailed{.exit_code = code, .message = std::move(message)}};
  }

  finish_progress(ProgressSnapshot::Kind::completed);
  return ProcessResult{.stdout_text = router_.captured(Stream::stdout_stream),
                       .stderr_text = router_.captured(Stream::stderr_stream),
                       .exit_code = 0};
}

}  // namespace

RunHandle::RunHandle(std::unique_ptr<CancelSource> source, std::future<Outcome> future)
    : source_(std::move(source)), future_(std::move(future)) {}

RunHandle::~RunHandle() {
  if (future_.valid()) {
    source_->cancel();
    future_.wait();
  }
}

void RunHandle::cancel() noexcept {
  if (source_) {
    source_->cancel();
  }
}

Outcome RunHandle::get() { return future_.get(); }

bool RunHandle::ready() const {
  return future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

ProcessSupervisor::ProcessSupervisor(SupervisorConfig config)
    : ProcessSupervisor(config, steady_clock(), internal::default_backend()) {}

ProcessSupervisor::ProcessSupervisor(SupervisorConfig config, Clock& clock,
                                     internal::Backend& backend)
    : config_(config), clock_(clock), backend_(backend) {}

Outcome ProcessSupervisor::run(const ProcessSpec& spec, RunOptions options) {
  return Run(config_, clock_, backend_, spec, options, CancelToken{}).execute();
}

RunHandle ProcessSupervisor::launch(ProcessSpec spec, RunOptions options) {
  auto source = std::make_unique<CancelSource>();
  auto future = std::async(std::launch::async, [this, spec = std::move(spec),
                                                options = std::move(options),
                                                token = source->token()]() mutable {
    return Run(config_, clock_, backend_, spec, options, token).execute();
  });
  return RunHandle(std::move(source), std::move(future));
}

}  // namespace shepherd
