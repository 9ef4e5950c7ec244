#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <string_view>

#include "shepherd/internal/backend.hpp"
#include "shepherd/internal/fd.hpp"

namespace shepherd::internal {

namespace {

constexpr long kFallbackMaxFd = 256;
constexpr int kExecFailureExitCode = 127;

// Setup step reported back through the error pipe together with errno.
enum ChildStage : int { kStageSetpgid = 1, kStageChdir, kStageDup2, kStageExec };

const char* stage_context(int stage) {
  switch (stage) {
    case kStageSetpgid:
      return "setpgid";
    case kStageChdir:
      return "chdir";
    case kStageDup2:
      return "dup2";
    case kStageExec:
      return "execve";
    default:
      return "spawn";
  }
}

std::optional<std::string> find_env_value(const std::vector<std::string>& envp,
                                          std::string_view key) {
  for (const auto& entry : envp) {
    if (entry.size() <= key.size() || entry.compare(0, key.size(), key) != 0 ||
        entry[key.size()] != '=') {
      continue;
    }
    return entry.substr(key.size() + 1);
  }
  return std::nullopt;
}

// Resolve argv[0] before fork so the child only needs async-signal-safe syscalls.
std::string resolve_exec_path(const std::string& argv0, const std::vector<std::string>& envp,
                              const std::optional<std::filesystem::path>& cwd) {
  if (argv0.find('/') != std::string::npos) {
    return argv0;
  }
  std::string path_value = find_env_value(envp, "PATH").value_or("/usr/bin:/bin");
  std::size_t start = 0;
  while (start <= path_value.size()) {
    std::size_t end = path_value.find(':', start);
    std::size_t len = (end == std::string::npos) ? path_value.size() - start : end - start;
    std::filesystem::path dir = len == 0 ? std::filesystem::path(".")
                                         : std::filesystem::path(path_value.substr(start, len));
    if (cwd && dir.is_relative()) {
      dir = *cwd / dir;
    }
    std::filesystem::path candidate = dir / argv0;
    if (::access(candidate.c_str(), X_OK) == 0) {
      return candidate.string();
    }
    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }
  return argv0;
}

long max_open_fd_limit() {
  long max_fd = ::sysconf(_SC_OPEN_MAX);
  return max_fd < 0 ? kFallbackMaxFd : max_fd;
}

[[noreturn]] void report_child_failure(int error_fd, int stage) {
  std::array<int, 2> report{stage, errno};
  ssize_t written = ::write(error_fd, report.data(), sizeof(report));
  (void)written;
  _exit(kExecFailureExitCode);
}

void reap_quietly(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
  }
}

ExitStatus to_exit_status(int status) {
  if (WIFSIGNALED(status)) {
    return ExitStatus::signaled(WTERMSIG(status));
  }
  return ExitStatus::exited(WIFEXITED(status) ? WEXITSTATUS(status) : kExecFailureExitCode);
}

std::vector<char*> to_c_array(std::vector<std::string>& values) {
  std::vector<char*> out;
  out.reserve(values.size() + 1);
  for (auto& value : values) {
    out.push_back(value.data());
  }
  out.push_back(nullptr);
  return out;
}

class PosixBackend final : public Backend {
 public:
  Result<Spawned> spawn(const SpawnSpec& spec) override {
    if (spec.argv.empty() || spec.argv.front().empty()) {
      return Error{.code = make_error_code(errc::empty_executable), .context = "argv"};
    }

    unique_fd null_in(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!null_in) {
      return errno_error("open(/dev/null)");
    }
    auto out_pipe = create_pipe();
    if (!out_pipe) {
      return Error{.code = out_pipe.error().code, .context = "stdout pipe"};
    }
    auto err_pipe = create_pipe();
    if (!err_pipe) {
      return Error{.code = err_pipe.error().code, .context = "stderr pipe"};
    }
    // Closed by exec on success; carries {stage, errno} on failure.
    auto report_pipe = create_pipe();
    if (!report_pipe) {
      return Error{.code = report_pipe.error().code, .context = "error pipe"};
    }

    std::vector<std::string> argv_copy = spec.argv;
    std::vector<std::string> envp_copy = spec.envp;
    std::vector<char*> argv_c = to_c_array(argv_copy);
    std::vector<char*> envp_c = to_c_array(envp_copy);
    std::string exec_path = resolve_exec_path(argv_copy.front(), envp_copy, spec.cwd);
    long max_fd = max_open_fd_limit();

    const int stdin_fd = null_in.get();
    const int stdout_fd = out_pipe->write.get();
    const int stderr_fd = err_pipe->write.get();
    const int report_fd = report_pipe->write.get();

    pid_t pid = ::fork();
    if (pid == -1) {
      return errno_error("fork");
    }

    if (pid == 0) {
      if (::setpgid(0, 0) == -1) {
        report_child_failure(report_fd, kStageSetpgid);
      }
      sigset_t empty_mask;
      sigemptyset(&empty_mask);
      ::sigprocmask(SIG_SETMASK, &empty_mask, nullptr);
      ::signal(SIGPIPE, SIG_DFL);

      if (spec.cwd && ::chdir(spec.cwd->c_str()) == -1) {
        report_child_failure(report_fd, kStageChdir);
      }
      if (::dup2(stdin_fd, STDIN_FILENO) == -1 || ::dup2(stdout_fd, STDOUT_FILENO) == -1 ||
          ::dup2(stderr_fd, STDERR_FILENO) == -1) {
        report_child_failure(report_fd, kStageDup2);
      }
      for (int fd = STDERR_FILENO + 1; fd < max_fd; ++fd) {
        if (fd != report_fd) {
          ::close(fd);
        }
      }
      ::execve(exec_path.c_str(), argv_c.data(), envp_c.data());
      report_child_failure(report_fd, kStageExec);
    }

    report_pipe->write.reset(-1);
    out_pipe->write.reset(-1);
    err_pipe->write.reset(-1);

    std::array<int, 2> report{0, 0};
    ssize_t read_result = -1;
    do {
      read_result = ::read(report_pipe->read.get(), report.data(), sizeof(report));
    } while (read_result == -1 && errno == EINTR);
    if (read_result == -1) {
      Error error = errno_error("read(error pipe)");
      ::kill(pid, SIGKILL);
      reap_quietly(pid);
      return error;
    }
    if (read_result > 0) {
      reap_quietly(pid);
      return Error{.code = std::error_code(report[1], std::system_category()),
                   .context = std::string(stage_context(report[0])) + " " + exec_path};
    }

    Spawned spawned;
    spawned.pid = pid;
    spawned.pgid = pid;
    spawned.stdout_fd = std::move(out_pipe->read);
    spawned.stderr_fd = std::move(err_pipe->read);
    return spawned;
  }

  Result<ExitStatus> wait(Spawned& spawned) override {
    int status = 0;
    while (::waitpid(spawned.pid, &status, 0) == -1) {
      if (errno != EINTR) {
        return errno_error("waitpid");
      }
    }
    return to_exit_status(status);
  }

  Result<std::optional<ExitStatus>> try_wait(Spawned& spawned) override {
    int status = 0;
    while (true) {
      pid_t rv = ::waitpid(spawned.pid, &status, WNOHANG);
      if (rv == spawned.pid) {
        return std::optional<ExitStatus>(to_exit_status(status));
      }
      if (rv == 0) {
        return std::optional<ExitStatus>();
      }
      if (errno == EINTR) {
        continue;
      }
      return errno_error("waitpid");
    }
  }

  Result<void> signal(Spawned& spawned, int signo) override {
    int target = spawned.pgid > 0 ? -spawned.pgid : spawned.pid;
    if (::kill(target, signo) == -1) {
      return errno_error("kill");
    }
    return {};
  }
};

}  // namespace

Backend& default_backend() {
  static PosixBackend backend;
  return backend;
}

}  // namespace shepherd::internal
