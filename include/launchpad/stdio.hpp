#pragma once

#include <sys/stat.h>

#include <filesystem>
#include <optional>
#include <ostream>
#include <variant>

#include "launchpad/platform.hpp"

namespace launchpad {

/// @brief File open modes for stdio redirection.
enum class OpenMode {
  /// @brief Read-only.
  read,
  /// @brief Write-only; create and truncate.
  write_truncate,
  /// @brief Write-only; create and append.
  write_append,
  /// @brief Read/write; create if missing.
  read_write,
};

/// @brief POSIX file permission bits (mode_t).
using FilePerms = ::mode_t;

/// @brief File specification for stdio redirection.
struct FileSpec {
  /// @brief Path to the file, relative to the caller's working directory.
  std::filesystem::path path;
  /// @brief Optional open mode; defaults based on stdio target.
  std::optional<OpenMode> mode;
  /// @brief Optional permissions for new files.
  std::optional<FilePerms> perms;
};

/// @brief Stdio configuration for a child process.
struct Stdio {
  /// @brief Inherit from the caller.
  struct Inherit {};
  /// @brief Attach to /dev/null.
  struct Null {};
  /// @brief Create a pipe and expose the caller's end.
  struct Piped {};
  /// @brief Duplicate an existing file descriptor.
  struct Fd {
    /// @brief Native file descriptor to duplicate.
    int fd;
  };
  /// @brief Open a file path for redirection.
  using File = FileSpec;
  /// @brief Copy the child's output into a caller-owned stream.
  struct Stream {
    /// @brief Destination; must outlive the wait on the child.
    std::ostream* sink;
  };

  /// @brief Variant holding the stdio selection.
  std::variant<Inherit, Null, Piped, Fd, File, Stream> value;

  /// @brief Inherit the caller's stream.
  static Stdio inherit() { return Stdio{Inherit{}}; }
  /// @brief Redirect to null.
  static Stdio null() { return Stdio{Null{}}; }
  /// @brief Create a pipe.
  static Stdio piped() { return Stdio{Piped{}}; }
  /// @brief Duplicate a file descriptor.
  static Stdio fd(int fd) { return Stdio{Fd{fd}}; }
  /// @brief Redirect to a file path.
  static Stdio file(std::filesystem::path path) { return Stdio{FileSpec{std::move(path), {}, {}}}; }
  /// @brief Redirect to a file path with an explicit open mode.
  static Stdio file(std::filesystem::path path, OpenMode mode) {
    return Stdio{FileSpec{std::move(path), mode, {}}};
  }
  /// @brief Redirect to a file path with explicit mode and permissions.
  static Stdio file(std::filesystem::path path, OpenMode mode, FilePerms perms) {
    return Stdio{FileSpec{std::move(path), mode, perms}};
  }
  /// @brief Redirect to a file path with full specification.
  static Stdio file(FileSpec spec) { return Stdio{std::move(spec)}; }
  /// @brief Route output into a caller-owned stream (stdout/stderr only).
  static Stdio stream(std::ostream& sink) { return Stdio{Stream{&sink}}; }
};

}  // namespace launchpad
