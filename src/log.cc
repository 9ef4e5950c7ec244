#include "shepherd/log.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <mutex>
#include <vector>

namespace shepherd::log {

namespace {

constexpr std::array<std::string_view, 4> kLibraryLoggers = {kProcess, kOutput, kTransfer,
                                                             kConfig};

std::mutex& registry_mutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            const std::vector<spdlog::sink_ptr>& sinks,
                                            spdlog::level::level_enum level) {
  auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);
  return logger;
}

}  // namespace

void init(const LogSettings& settings) {
  std::vector<spdlog::sink_ptr> sinks;

  auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console->set_color_mode(spdlog::color_mode::automatic);
  console->set_pattern(settings.pattern);
  sinks.push_back(console);

  if (settings.file) {
    auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        settings.file->string(), settings.max_file_size, settings.max_files);
    rotating->set_pattern(settings.pattern);
    sinks.push_back(rotating);
  }

  std::lock_guard<std::mutex> lock(registry_mutex());
  for (auto name : kLibraryLoggers) {
    auto level = settings.level;
    if (auto it = settings.subsystems.find(name); it != settings.subsystems.end()) {
      level = it->second;
    }
    std::string key(name);
    spdlog::drop(key);
    spdlog::register_logger(make_logger(key, sinks, level));
  }
}

std::shared_ptr<spdlog::logger> get(std::string_view name) {
  std::string key(name);
  if (auto logger = spdlog::get(key)) {
    return logger;
  }
  std::lock_guard<std::mutex> lock(registry_mutex());
  if (auto logger = spdlog::get(key)) {
    return logger;
  }
  auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console->set_pattern(std::string(kDefaultPattern));
  auto logger = make_logger(key, {console}, spdlog::level::info);
  spdlog::register_logger(logger);
  return logger;
}

}  // namespace shepherd::log
