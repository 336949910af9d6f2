#include <iostream>
#include <string>
#include <vector>

#include "launchpad/command.hpp"

int main() {
  constexpr int kChildren = 4;
  std::vector<launchpad::Child> children;
  for (int i = 0; i < kChildren; ++i) {
    // clang-format off
    auto child = launchpad::Command{"/bin/sh"}
                     .arg("-c")
                     .arg("sleep 0." + std::to_string(kChildren - i) + "; exit " + std::to_string(i))
                     .spawn();
    // clang-format on
    if (!child) {
      std::cerr << "spawn failed: " << child.error().context << " "
                << child.error().code.message() << "\n";
      return 1;
    }
    children.push_back(std::move(child.value()));
  }

  for (int i = 0; i < kChildren; ++i) {
    auto status = children[i].wait();
    if (!status || status->code() != i) {
      std::cerr << "child " << i << " reported the wrong status\n";
      return 1;
    }
  }
  return 0;
}
