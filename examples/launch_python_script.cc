#include <iostream>

#include "launchpad/command.hpp"

// Runs a small Python program in a separate process and prints what it said.
int main() {
  // clang-format off
  const auto cmd = launchpad::Command{"python3"}
                       .arg("-c")
                       .arg("import sys; print('hello from', sys.argv[1]); sys.exit(3)")
                       .arg("launchpad");
  // clang-format on

  auto out = cmd.output();
  if (!out) {
    std::cerr << "launch failed: " << out.error().context << " " << out.error().code.message()
              << "\n";
    return 1;
  }

  std::cout << out->stdout_data;
  std::cout << "python3 " << out->status.describe() << "\n";
  return out->status.code() == 3 ? 0 : 1;
}
