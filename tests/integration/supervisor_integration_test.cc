#include <gtest/gtest.h>
#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "shepherd/process_spec.hpp"
#include "shepherd/progress_channel.hpp"
#include "shepherd/supervisor.hpp"
#include "tests/helpers/helper_path.hpp"

namespace shepherd {
namespace {

using std::chrono::milliseconds;

std::string helper_path() {
  auto path = support::helper_path();
  if (path.empty()) {
    ADD_FAILURE() << "helper path not found";
  }
  return path;
}

std::filesystem::path temp_file(const std::string& stem) {
  return std::filesystem::temp_directory_path() /
         (stem + "_" + std::to_string(::getpid()) + ".txt");
}

bool process_gone(pid_t pid) {
  for (int i = 0; i < 100; ++i) {
    if (::kill(pid, 0) == -1 && errno == ESRCH) {
      return true;
    }
    std::this_thread::sleep_for(milliseconds(10));
  }
  return false;
}

pid_t read_pid(const std::filesystem::path& path) {
  for (int i = 0; i < 200; ++i) {
    std::ifstream file(path);
    pid_t pid = 0;
    if (file >> pid && pid > 0) {
      return pid;
    }
    std::this_thread::sleep_for(milliseconds(10));
  }
  return 0;
}

SupervisorConfig fast_kill() {
  return SupervisorConfig{.default_timeout = milliseconds(5000), .kill_grace = milliseconds(200)};
}

}  // namespace

TEST(SupervisorIntegrationTest, EchoCapturesStdout) {
  ProcessSupervisor supervisor;
  auto outcome = supervisor.run(Command("/bin/echo").args({"hello", "world"}).build());
  ASSERT_TRUE(outcome.has_value()) << describe(outcome.error());
  EXPECT_EQ(outcome->stdout_text, "hello world\n");
  EXPECT_EQ(outcome->exit_code, 0);
}

TEST(SupervisorIntegrationTest, NonZeroExitIsExecutionFailure) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());

  ProcessSupervisor supervisor;
  auto outcome = supervisor.run(
      Command(helper).args({"--stderr-line", "repository not found", "--exit-code", "3"}).build());
  ASSERT_FALSE(outcome.has_value());
  const auto& failed = std::get<ExecutionFailed>(outcome.error());
  EXPECT_EQ(failed.exit_code, 3);
  EXPECT_EQ(failed.message, "repository not found\n");
}

TEST(SupervisorIntegrationTest, FalseReportsExitCodeOne) {
  ProcessSupervisor supervisor;
  auto outcome = supervisor.run(Command("/bin/false").build());
  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(std::get<ExecutionFailed>(outcome.error()).exit_code, 1);
}

TEST(SupervisorIntegrationTest, MissingExecutableIsSpawnFailure) {
  ProcessSupervisor supervisor;
  auto outcome = supervisor.run(Command("/nonexistent/restic").build());
  ASSERT_FALSE(outcome.has_value());
  const auto& failed = std::get<SpawnFailed>(outcome.error());
  EXPECT_EQ(failed.code, std::error_code(ENOENT, std::system_category()));
}

TEST(SupervisorIntegrationTest, LinesDeliveredInOrder) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());

  std::vector<std::string> lines;
  RunOptions options;
  options.line_handlers.push_back([&](const OutputLine& line) {
    if (line.stream == Stream::stdout_stream) {
      lines.push_back(line.text);
    }
  });

  ProcessSupervisor supervisor;
  auto outcome =
      supervisor.run(Command(helper).args({"--lines", "50", "--print", "tail"}).build(), options);
  ASSERT_TRUE(outcome.has_value()) << describe(outcome.error());
  ASSERT_EQ(lines.size(), 51u);
  EXPECT_EQ(lines.front(), "line 1");
  EXPECT_EQ(lines[49], "line 50");
  EXPECT_EQ(lines.back(), "tail");
}

TEST(SupervisorIntegrationTest, LargeOutputIsNotTruncated) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());

  ProcessSupervisor supervisor;
  auto outcome = supervisor.run(Command(helper).args({"--stdout-bytes", "1048576"}).build());
  ASSERT_TRUE(outcome.has_value()) << describe(outcome.error());
  EXPECT_EQ(outcome->stdout_text.size(), 1048576u);
}

TEST(SupervisorIntegrationTest, InvalidUtf8IsReplaced) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());

  ProcessSupervisor supervisor;
  auto outcome = supervisor.run(Command(helper).arg("--invalid-utf8").build());
  ASSERT_TRUE(outcome.has_value()) << describe(outcome.error());
  EXPECT_EQ(outcome->stdout_text, "ok \xC3\xA9 bad \xEF\xBF\xBD\xEF\xBF\xBD end\n");
}

TEST(SupervisorIntegrationTest, EnvironmentOverridesAndSecrets) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());

  ProcessSupervisor supervisor;
  auto plain = supervisor.run(Command(helper)
                                  .env("SHEPHERD_TEST_VALUE", "visible")
                                  .args({"--print-env", "SHEPHERD_TEST_VALUE"})
                                  .build());
  ASSERT_TRUE(plain.has_value()) << describe(plain.error());
  EXPECT_EQ(plain->stdout_text, "visible\n");

  auto spec = Command(helper)
                  .secret_env("RESTIC_PASSWORD", "hunter2")
                  .args({"--print-env", "RESTIC_PASSWORD"})
                  .build();
  EXPECT_EQ(spec.describe().find("hunter2"), std::string::npos);
  auto secret = supervisor.run(spec);
  ASSERT_TRUE(secret.has_value()) << describe(secret.error());
  EXPECT_EQ(secret->stdout_text, "hunter2\n");
}

TEST(SupervisorIntegrationTest, RemovedVariableIsUnset) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());
  ASSERT_EQ(::setenv("SHEPHERD_INHERITED", "parent", 1), 0);

  ProcessSupervisor supervisor;
  auto outcome = supervisor.run(Command(helper)
                                    .env_remove("SHEPHERD_INHERITED")
                                    .args({"--print-env", "SHEPHERD_INHERITED"})
                                    .build());
  ::unsetenv("SHEPHERD_INHERITED");
  ASSERT_TRUE(outcome.has_value()) << describe(outcome.error());
  EXPECT_EQ(outcome->stdout_text, "<unset>\n");
}

TEST(SupervisorIntegrationTest, WorkingDirectoryOverride) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());
  auto cwd = std::filesystem::temp_directory_path();

  ProcessSupervisor supervisor;
  auto outcome = supervisor.run(Command(helper).arg("--print-cwd").current_dir(cwd).build());
  ASSERT_TRUE(outcome.has_value()) << describe(outcome.error());
  std::string reported = outcome->stdout_text;
  ASSERT_FALSE(reported.empty());
  reported.pop_back();
  std::error_code ec;
  EXPECT_TRUE(std::filesystem::equivalent(reported, cwd, ec)) << ec.message();
}

TEST(SupervisorIntegrationTest, TimeoutKillsProcessGroup) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());
  auto pid_file = temp_file("shepherd_timeout");
  std::filesystem::remove(pid_file);

  ProcessSupervisor supervisor(fast_kill());
  auto started = std::chrono::steady_clock::now();
  auto outcome = supervisor.run(Command(helper)
                                    .args({"--pid-file", pid_file.string(), "--sleep-ms", "30000"})
                                    .timeout(milliseconds(300))
                                    .build());
  auto elapsed = std::chrono::steady_clock::now() - started;

  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(std::get<TimedOut>(outcome.error()).duration, milliseconds(300));
  EXPECT_LT(elapsed, std::chrono::seconds(10));

  pid_t pid = read_pid(pid_file);
  ASSERT_GT(pid, 0);
  EXPECT_TRUE(process_gone(pid));
  std::filesystem::remove(pid_file);
}

TEST(SupervisorIntegrationTest, CancelTerminatesRun) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());
  auto pid_file = temp_file("shepherd_cancel");
  std::filesystem::remove(pid_file);

  auto channel = std::make_shared<ProgressChannel>();
  RunOptions options;
  options.progress = channel;

  ProcessSupervisor supervisor(fast_kill());
  auto handle = supervisor.launch(
      Command(helper)
          .args({"--pid-file", pid_file.string(), "--progress", "1", "--sleep-ms", "30000"})
          .build(),
      options);
  pid_t pid = read_pid(pid_file);
  handle.cancel();
  auto outcome = handle.get();

  ASSERT_FALSE(outcome.has_value());
  EXPECT_TRUE(std::holds_alternative<Cancelled>(outcome.error()));
  ASSERT_GT(pid, 0);
  EXPECT_TRUE(process_gone(pid));
  EXPECT_TRUE(channel->finished());
  EXPECT_EQ(channel->last().kind, ProgressSnapshot::Kind::aborted);
  std::filesystem::remove(pid_file);
}

TEST(SupervisorIntegrationTest, HandlerThrowingNonStandardValueStillReapsChild) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());
  auto pid_file = temp_file("shepherd_throwing_handler");
  std::filesystem::remove(pid_file);

  RunOptions options;
  options.line_handlers.push_back([](const OutputLine&) { throw 42; });

  ProcessSupervisor supervisor(fast_kill());
  Outcome outcome = ProcessResult{};
  EXPECT_NO_THROW(outcome = supervisor.run(Command(helper)
                                               .args({"--pid-file", pid_file.string(), "--lines",
                                                      "1", "--sleep-ms", "30000"})
                                               .timeout(milliseconds(300))
                                               .build(),
                                           options));

  ASSERT_FALSE(outcome.has_value());
  EXPECT_TRUE(std::holds_alternative<TimedOut>(outcome.error()));
  pid_t pid = read_pid(pid_file);
  ASSERT_GT(pid, 0);
  EXPECT_TRUE(process_gone(pid));
  std::filesystem::remove(pid_file);
}

TEST(SupervisorIntegrationTest, CapturedStdoutIsConcatenationOfLinesAcrossReads) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());

  std::string joined;
  std::size_t delivered = 0;
  RunOptions options;
  options.line_handlers.push_back([&](const OutputLine& line) {
    if (line.stream != Stream::stdout_stream) {
      return;
    }
    if (delivered++ > 0) {
      joined += '\n';
    }
    joined += line.text;
  });

  ProcessSupervisor supervisor;
  auto outcome = supervisor.run(
      Command(helper).args({"--lines", "40000", "--print", "partial tail"}).build(), options);
  ASSERT_TRUE(outcome.has_value()) << describe(outcome.error());
  EXPECT_GT(outcome->stdout_text.size(), 4u * 64u * 1024u);
  EXPECT_EQ(delivered, 40001u);
  EXPECT_EQ(joined, outcome->stdout_text);
}

TEST(SupervisorIntegrationTest, CancelTokenFromCaller) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());

  CancelSource source;
  RunOptions options;
  options.cancel = source.token();
  options.line_handlers.push_back([&](const OutputLine&) { source.cancel(); });

  ProcessSupervisor supervisor(fast_kill());
  auto outcome = supervisor.run(
      Command(helper).args({"--lines", "1", "--sleep-ms", "30000"}).build(), options);
  ASSERT_FALSE(outcome.has_value());
  EXPECT_TRUE(std::holds_alternative<Cancelled>(outcome.error()));
}

TEST(SupervisorIntegrationTest, ProgressJsonIsPublished) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());

  auto channel = std::make_shared<ProgressChannel>(64);
  auto subscription = channel->subscribe();
  RunOptions options;
  options.progress = channel;

  ProcessSupervisor supervisor;
  auto outcome = supervisor.run(
      Command(helper).args({"--progress", "3", "--line-delay-ms", "5"}).build(), options);
  ASSERT_TRUE(outcome.has_value()) << describe(outcome.error());

  std::vector<ProgressSnapshot> snapshots;
  while (auto snapshot = subscription.next_for(milliseconds(1000))) {
    snapshots.push_back(*snapshot);
  }
  ASSERT_GE(snapshots.size(), 2u);
  EXPECT_EQ(snapshots.front().bytes_done, 1000u);
  EXPECT_EQ(snapshots.front().current_file, std::optional<std::string>("/data/file1"));
  for (std::size_t i = 1; i < snapshots.size(); ++i) {
    EXPECT_GE(snapshots[i].percent, snapshots[i - 1].percent);
  }
  EXPECT_EQ(snapshots.back().kind, ProgressSnapshot::Kind::completed);
  EXPECT_DOUBLE_EQ(snapshots.back().percent, 100.0);
}

TEST(SupervisorIntegrationTest, ConcurrentRunsAreIndependent) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());

  ProcessSupervisor supervisor;
  std::vector<RunHandle> handles;
  for (int i = 0; i < 4; ++i) {
    handles.push_back(supervisor.launch(
        Command(helper).args({"--lines", "20", "--exit-code", std::to_string(i)}).build()));
  }
  for (int i = 0; i < 4; ++i) {
    auto outcome = handles[static_cast<std::size_t>(i)].get();
    if (i == 0) {
      ASSERT_TRUE(outcome.has_value()) << describe(outcome.error());
      EXPECT_EQ(outcome->stdout_text.size(), 20u * 7u + 11u);
    } else {
      ASSERT_FALSE(outcome.has_value());
      EXPECT_EQ(std::get<ExecutionFailed>(outcome.error()).exit_code, i);
    }
  }
}

}  // namespace shepherd
