#include <iostream>

#include "launchpad/config.hpp"
#include "launchpad/launcher.hpp"

// Starts the same request with both strategies and reports which one ran.
int main() {
  launchpad::set_log_level(launchpad::LogLevel::debug);

  launchpad::LaunchRequest request;
  request.program = "/bin/true";
  request.args = {"true"};

  for (auto strategy : {launchpad::Strategy::posix_spawn, launchpad::Strategy::fork_exec}) {
    request.options.strategy = strategy;
    auto child = launchpad::spawn(request);
    if (!child) {
      std::cerr << "spawn failed: " << child.error().context << " "
                << child.error().code.message() << "\n";
      return 1;
    }
    auto status = child->wait();
    if (!status) {
      std::cerr << "wait failed: " << status.error().code.message() << "\n";
      return 1;
    }
    std::cout << launchpad::to_string(child->strategy()) << ": " << status->describe() << "\n";
  }
  return 0;
}
