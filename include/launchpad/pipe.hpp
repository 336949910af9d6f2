#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "launchpad/platform.hpp"
#include "launchpad/result.hpp"

#if LAUNCHPAD_HAS_STD_SPAN
#include <span>
#endif

namespace launchpad {

/// @brief Caller-side read end of a child's output pipe.
class PipeReader {
 public:
  PipeReader() = default;
  /// @brief Adopt a native file descriptor.
  explicit PipeReader(int fd) : fd_(fd) {}
  PipeReader(PipeReader&& other) noexcept;
  PipeReader& operator=(PipeReader&& other) noexcept;
  PipeReader(const PipeReader&) = delete;
  PipeReader& operator=(const PipeReader&) = delete;
  ~PipeReader();

  [[nodiscard]] int native_handle() const noexcept { return fd_; }
  [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
  void close() noexcept;

  /// @brief Read until EOF.
  [[nodiscard]] Result<std::string> read_all() const;
#if LAUNCHPAD_HAS_STD_SPAN
  [[nodiscard]] Result<std::size_t> read_some(std::span<std::byte> buffer) const;
#endif
  /// @brief Read up to n bytes; 0 means EOF.
  [[nodiscard]] Result<std::size_t> read_some(void* data, std::size_t n) const;

 private:
  int fd_{-1};
};

/// @brief Caller-side write end of a child's input pipe.
class PipeWriter {
 public:
  PipeWriter() = default;
  /// @brief Adopt a native file descriptor.
  explicit PipeWriter(int fd) : fd_(fd) {}
  PipeWriter(PipeWriter&& other) noexcept;
  PipeWriter& operator=(PipeWriter&& other) noexcept;
  PipeWriter(const PipeWriter&) = delete;
  PipeWriter& operator=(const PipeWriter&) = delete;
  ~PipeWriter();

  [[nodiscard]] int native_handle() const noexcept { return fd_; }
  [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
  /// @brief Close the pipe; the child sees EOF once every copy is closed.
  void close() noexcept;

  /// @brief Write every byte, retrying short writes.
  [[nodiscard]] Result<void> write_all(std::string_view data) const;
#if LAUNCHPAD_HAS_STD_SPAN
  [[nodiscard]] Result<std::size_t> write_some(std::span<const std::byte> buffer) const;
#endif
  [[nodiscard]] Result<std::size_t> write_some(const void* data, std::size_t n) const;

 private:
  int fd_{-1};
};

}  // namespace launchpad
