#include <chrono>
#include <iostream>

#include "shepherd/output_router.hpp"
#include "shepherd/process_spec.hpp"
#include "shepherd/supervisor.hpp"

int main() {
  // clang-format off
  const auto spec = shepherd::Command{"/bin/sh"}
                        .args({"-c", "echo first; echo second >&2; echo third"})
                        .timeout(std::chrono::seconds(5))
                        .build();
  // clang-format on

  shepherd::DisplayBuffer display(2);
  shepherd::RunOptions options;
  options.line_handlers.push_back(display.handler());

  shepherd::ProcessSupervisor supervisor;
  auto outcome = supervisor.run(spec, options);
  if (!outcome) {
    std::cerr << "run failed: " << shepherd::describe(outcome.error()) << "\n";
    return 1;
  }
  if (outcome->stdout_text != "first\nthird\n" || outcome->stderr_text != "second\n") {
    std::cerr << "unexpected output: " << outcome->stdout_text << "\n";
    return 1;
  }

  // Only the two most recent lines are retained.
  for (const auto& line : display.lines()) {
    std::cout << "[" << shepherd::to_string(line.stream) << "] " << line.text << "\n";
  }
  return display.dropped() == 1 ? 0 : 1;
}
