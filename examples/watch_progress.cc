#include <iostream>
#include <memory>
#include <thread>
#include <utility>

#include "shepherd/progress_channel.hpp"
#include "shepherd/supervisor.hpp"

namespace {

constexpr const char* kScript = R"(
for done in 250 500 750; do
  printf '{"message_type":"status","percent_done":0.%s,"bytes_done":%s,"total_bytes":1000}\n' \
    "$done" "$done"
  sleep 0.05
done
printf '{"message_type":"summary","total_bytes_processed":1000,"snapshot_id":"abc"}\n'
)";

}  // namespace

int main() {
  auto channel = std::make_shared<shepherd::ProgressChannel>();
  auto subscription = channel->subscribe();

  std::thread watcher([&subscription]() {
    while (auto snapshot = subscription.next()) {
      std::cout << snapshot->percent << "% (" << snapshot->bytes_done << "/"
                << snapshot->total_bytes << " bytes)" << (snapshot->terminal() ? " done" : "")
                << "\n";
    }
  });

  shepherd::RunOptions options;
  options.progress = channel;
  shepherd::ProcessSupervisor supervisor;
  auto handle = supervisor.launch(shepherd::Command{"/bin/sh"}.args({"-c", kScript}).build(),
                                  std::move(options));
  auto outcome = handle.get();
  watcher.join();

  if (!outcome) {
    std::cerr << "run failed: " << shepherd::describe(outcome.error()) << "\n";
    return 1;
  }
  return channel->last().kind == shepherd::ProgressSnapshot::Kind::completed ? 0 : 1;
}
