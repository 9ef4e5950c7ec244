#include <chrono>
#include <iostream>

#include "shepherd/restic_command.hpp"
#include "shepherd/transfer_tuner.hpp"

int main() {
  shepherd::TransferTuner tuner;
  shepherd::NetworkConditions slow_link{.bandwidth = 50 * 1024,
                                        .latency = std::chrono::milliseconds(400),
                                        .packet_loss = 0.02,
                                        .shared_connection = true};

  auto profile = tuner.tune(shepherd::Provider::s3, slow_link);
  std::cout << "chunk " << profile.chunk_size << " bytes, " << profile.max_concurrency
            << " connections, compression " << shepherd::to_string(profile.compression) << "\n";

  auto degraded = tuner.degrade(profile);
  std::cout << "after timeout: " << degraded.max_concurrency << " connections\n";

  shepherd::ResticInvocation restic(
      shepherd::Repository{.location = "s3:s3.amazonaws.com/backups", .password = "secret"});
  auto spec = restic.build(shepherd::restic::Backup{.paths = {"/home"}}, &profile);
  if (!spec) {
    std::cerr << "build failed: " << spec.error().context << "\n";
    return 1;
  }
  std::cout << spec->describe() << "\n";
  return 0;
}
