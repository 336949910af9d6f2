#include <chrono>
#include <iostream>
#include <sstream>

#include "launchpad/command.hpp"

// A script that never finishes is stopped by a bounded wait; whatever it
// printed before hanging still reaches the caller's stream.
int main() {
  std::ostringstream progress;
  // clang-format off
  auto child = launchpad::Command{"python3"}
                   .arg("-c")
                   .arg("import sys, time; print('working', flush=True); time.sleep(3600)")
                   .stdout(launchpad::Stdio::stream(progress))
                   .spawn();
  // clang-format on
  if (!child) {
    std::cerr << "spawn failed: " << child.error().context << " " << child.error().code.message()
              << "\n";
    return 1;
  }

  launchpad::WaitOptions options;
  options.timeout = std::chrono::milliseconds(500);
  options.kill_grace = std::chrono::milliseconds(100);
  auto status = child->wait(options);
  if (status) {
    std::cerr << "script finished unexpectedly: " << status->describe() << "\n";
    return 1;
  }
  if (status.error().code != launchpad::make_error_code(launchpad::errc::timeout)) {
    std::cerr << "wait failed: " << status.error().context << "\n";
    return 1;
  }

  // The handle keeps the status of the stopped child.
  auto stopped = child->try_wait();
  if (!stopped || !stopped->has_value()) {
    std::cerr << "child was not reaped\n";
    return 1;
  }
  std::cout << "script said: " << progress.str();
  std::cout << "stopped after timeout: " << (*stopped)->describe() << "\n";
  return 0;
}
