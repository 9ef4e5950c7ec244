#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "shepherd/internal/fd.hpp"
#include "shepherd/result.hpp"
#include "shepherd/status.hpp"

namespace shepherd::internal {

// Fully resolved spawn request: argv[0] is the executable, envp is the merged
// environment. stdin is always /dev/null; stdout and stderr are always piped.
struct SpawnSpec {
  std::vector<std::string> argv;
  std::optional<std::filesystem::path> cwd;
  std::vector<std::string> envp;
};

// A running child that leads its own process group.
struct Spawned {
  int pid = -1;
  int pgid = -1;
  unique_fd stdout_fd;
  unique_fd stderr_fd;
};

class Backend {
 public:
  virtual ~Backend() = default;
  virtual Result<Spawned> spawn(const SpawnSpec& spec) = 0;
  virtual Result<ExitStatus> wait(Spawned& spawned) = 0;
  virtual Result<std::optional<ExitStatus>> try_wait(Spawned& spawned) = 0;
  // Delivers `signo` to the whole process group.
  virtual Result<void> signal(Spawned& spawned, int signo) = 0;
};

Backend& default_backend();

}  // namespace shepherd::internal
