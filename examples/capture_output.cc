#include <iostream>
#include <string>

#include "launchpad/command.hpp"

int main() {
  // clang-format off
  const auto cmd = launchpad::Command{"/bin/sh"}
                       .arg("-c")
                       .arg("printf 'out'; printf 'err' 1>&2");
  // clang-format on

  auto out = cmd.output();
  if (!out) {
    std::cerr << "output failed: " << out.error().context << " " << out.error().code.message()
              << "\n";
    return 1;
  }

  const auto& result = out.value();
  if (result.stdout_data != "out" || result.stderr_data != "err") {
    std::cerr << "unexpected output: stdout='" << result.stdout_data << "' stderr='"
              << result.stderr_data << "'\n";
    return 1;
  }

  return 0;
}
