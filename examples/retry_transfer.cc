#include <iostream>
#include <memory>
#include <utility>

#include "shepherd/config.hpp"
#include "shepherd/transfer_runner.hpp"

int main(int argc, char* argv[]) {
  shepherd::Settings settings;
  if (argc > 1) {
    auto loaded = shepherd::load_settings(argv[1]);
    if (!loaded) {
      std::cerr << "config: " << loaded.error().context << "\n";
      return 1;
    }
    settings = std::move(*loaded);
  }
  shepherd::log::init(settings.logging);

  shepherd::ProcessSupervisor supervisor(settings.supervisor);
  shepherd::TransferRegistry registry;
  shepherd::TransferTuner tuner(settings.providers, settings.tuner);
  shepherd::TransferRunner runner(supervisor, registry, tuner);

  shepherd::ResticInvocation restic(
      shepherd::Repository{.location = "sftp:backup@nas:/srv/restic", .password = "example"},
      settings.restic_binary);
  shepherd::DisplayBuffer display(settings.display_retention);
  shepherd::RunOptions options;
  options.line_handlers.push_back(display.handler());
  options.progress = std::make_shared<shepherd::ProgressChannel>(settings.progress_capacity);
  auto subscription = options.progress->subscribe();

  auto report = runner.run(restic,
                           shepherd::TransferRequest{.id = "example",
                                                     .provider = shepherd::Provider::sftp,
                                                     .operation = shepherd::restic::Init{},
                                                     .total_bytes = 0,
                                                     .conditions = {}},
                           std::move(options));

  while (auto snapshot = subscription.try_next()) {
    if (snapshot->terminal()) {
      std::cout << "final progress: " << snapshot->percent << "%\n";
    }
  }
  for (const auto& line : display.lines()) {
    std::cout << "  " << line.text << "\n";
  }

  auto state = registry.find("example");
  std::cout << "attempts: " << report.attempts
            << ", retries: " << (state ? state->retry_count : 0) << "\n";
  if (!report.outcome) {
    std::cerr << shepherd::describe(report.outcome.error()) << "\n";
    return 1;
  }
  return 0;
}
