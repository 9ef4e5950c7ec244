#include <unistd.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

namespace {

constexpr int kParseBase = 10;
constexpr std::size_t kIoBufferSize = 4096;

struct Options {
  std::size_t lines = 0;
  std::size_t stdout_bytes = 0;
  std::optional<std::string> stderr_line;
  std::optional<std::string> print;
  std::optional<int> exit_code;
  std::optional<int> sleep_ms;
  std::optional<int> line_delay_ms;
  std::size_t progress_steps = 0;
  std::optional<std::string> pid_file;
  std::optional<std::string> print_env;
  bool print_cwd = false;
  bool invalid_utf8 = false;
};

bool parse_size(const std::string& value, std::size_t* out) {
  char* end = nullptr;
  errno = 0;
  unsigned long long parsed = std::strtoull(value.c_str(), &end, kParseBase);
  if (errno != 0 || end == value.c_str() || *end != '\0') {
    return false;
  }
  *out = static_cast<std::size_t>(parsed);
  return true;
}

bool parse_int(const std::string& value, std::optional<int>* out) {
  char* end = nullptr;
  errno = 0;
  long parsed = std::strtol(value.c_str(), &end, kParseBase);
  if (errno != 0 || end == value.c_str() || *end != '\0') {
    return false;
  }
  *out = static_cast<int>(parsed);
  return true;
}

bool parse_args(int argc, char* argv[], Options* options) {  // NOLINT(modernize-avoid-c-arrays)
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    bool has_value = i + 1 < argc;
    if (arg == "--lines" && has_value) {
      if (!parse_size(argv[++i], &options->lines)) return false;
    } else if (arg == "--stdout-bytes" && has_value) {
      if (!parse_size(argv[++i], &options->stdout_bytes)) return false;
    } else if (arg == "--progress" && has_value) {
      if (!parse_size(argv[++i], &options->progress_steps)) return false;
    } else if (arg == "--exit-code" && has_value) {
      if (!parse_int(argv[++i], &options->exit_code)) return false;
    } else if (arg == "--sleep-ms" && has_value) {
      if (!parse_int(argv[++i], &options->sleep_ms)) return false;
    } else if (arg == "--line-delay-ms" && has_value) {
      if (!parse_int(argv[++i], &options->line_delay_ms)) return false;
    } else if (arg == "--stderr-line" && has_value) {
      options->stderr_line = argv[++i];
    } else if (arg == "--print" && has_value) {
      options->print = argv[++i];
    } else if (arg == "--pid-file" && has_value) {
      options->pid_file = argv[++i];
    } else if (arg == "--print-env" && has_value) {
      options->print_env = argv[++i];
    } else if (arg == "--print-cwd") {
      options->print_cwd = true;
    } else if (arg == "--invalid-utf8") {
      options->invalid_utf8 = true;
    } else {
      return false;
    }
  }
  return true;
}

void write_pid_file(const std::string& path) {
  std::ofstream file(path);
  if (file) {
    file << ::getpid();
    file.flush();
  }
}

void pause_between_lines(const Options& options) {
  if (options.line_delay_ms) {
    std::cout.flush();
    std::this_thread::sleep_for(std::chrono::milliseconds(*options.line_delay_ms));
  }
}

void write_progress(const Options& options) {
  const std::uint64_t total_bytes = 1000 * options.progress_steps;
  for (std::size_t step = 1; step <= options.progress_steps; ++step) {
    double fraction = static_cast<double>(step) / static_cast<double>(options.progress_steps + 1);
    std::cout << R"({"message_type":"status","percent_done":)" << fraction
              << R"(,"total_files":)" << options.progress_steps << R"(,"files_done":)" << step
              << R"(,"total_bytes":)" << total_bytes << R"(,"bytes_done":)" << 1000 * step
              << R"(,"current_files":["/data/file)" << step << R"("]})" << '\n';
    pause_between_lines(options);
  }
  std::cout << R"({"message_type":"summary","total_files_processed":)" << options.progress_steps
            << R"(,"total_bytes_processed":)" << total_bytes << R"(,"snapshot_id":"abc123"})"
            << '\n';
}

}  // namespace

int main(int argc, char* argv[]) {
  Options options;
  if (!parse_args(argc, argv, &options)) {
    std::cerr << "invalid args" << '\n';
    return 2;
  }

  if (options.pid_file) {
    write_pid_file(*options.pid_file);
  }

  for (std::size_t i = 1; i <= options.lines; ++i) {
    std::cout << "line " << i << '\n';
    pause_between_lines(options);
  }

  if (options.stdout_bytes > 0) {
    std::string buffer(kIoBufferSize, 'a');
    std::size_t remaining = options.stdout_bytes;
    while (remaining > 0) {
      std::size_t amount = remaining < buffer.size() ? remaining : buffer.size();
      std::cout.write(buffer.data(), static_cast<std::streamsize>(amount));
      remaining -= amount;
    }
  }

  if (options.progress_steps > 0) {
    write_progress(options);
  }

  if (options.invalid_utf8) {
    std::cout << "ok \xC3\xA9 bad \xFF\xFE end" << '\n';
  }

  if (options.stderr_line) {
    std::cerr << *options.stderr_line << '\n';
  }

  if (options.print) {
    std::cout << *options.print;
  }

  if (options.print_env) {
    const char* value = std::getenv(options.print_env->c_str());
    std::cout << (value ? value : "<unset>") << '\n';
  }

  if (options.print_cwd) {
    std::array<char, kIoBufferSize> buffer{};
    if (::getcwd(buffer.data(), buffer.size())) {
      std::cout << buffer.data() << '\n';
    }
  }

  std::cout.flush();
  std::cerr.flush();

  if (options.sleep_ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(*options.sleep_ms));
  }

  return options.exit_code.value_or(0);
}
