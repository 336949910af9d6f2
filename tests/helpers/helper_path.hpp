#pragma once

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

namespace launchpad::support {

namespace fs = std::filesystem;

/// Path of the launchpad_child test helper. The LAUNCHPAD_HELPER_PATH
/// environment variable wins over the path baked in by the build.
inline std::string helper_path() {
  const char* override_path = std::getenv("LAUNCHPAD_HELPER_PATH");
  if (override_path != nullptr && fs::exists(override_path)) {
    return override_path;
  }
#ifdef LAUNCHPAD_HELPER_PATH
  if (fs::exists(LAUNCHPAD_HELPER_PATH)) {
    return LAUNCHPAD_HELPER_PATH;
  }
#endif
  std::cerr << "launchpad_child helper not found\n";
  return "";
}

/// Byte i of the deterministic stream the helper writes for --stdout-bytes/--stderr-bytes.
inline char pattern_byte(std::size_t index, char base) {
  return static_cast<char>(base + static_cast<char>(index % 26));
}

inline std::string pattern(std::size_t count, char base) {
  std::string bytes(count, '\0');
  for (std::size_t i = 0; i < count; ++i) {
    bytes[i] = pattern_byte(i, base);
  }
  return bytes;
}

}  // namespace launchpad::support
