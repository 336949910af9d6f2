#include <iostream>

#include "launchpad/command.hpp"

// Forwards a child's output into std::cout as it arrives.
int main() {
  // clang-format off
  auto result = launchpad::Command{"/bin/sh"}
                    .arg("-c")
                    .arg("for i in 1 2 3; do echo line $i; done")
                    .stdout(launchpad::Stdio::stream(std::cout))
                    .launch();
  // clang-format on
  if (!result) {
    std::cerr << "launch failed: " << result.error().context << " "
              << result.error().code.message() << "\n";
    return 1;
  }
  return result->status.success() ? 0 : 1;
}
