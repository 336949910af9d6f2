#include "launchpad/pipe.hpp"

#include <unistd.h>

#include <array>
#include <cerrno>
#include <utility>

namespace launchpad {

namespace {

constexpr std::size_t kPipeBufferSize = 8192;

Error closed_pipe_error(errc value, const char* context) {
  return Error{.code = make_error_code(value),
               .context = context,
               .cause = std::make_error_code(std::errc::bad_file_descriptor)};
}

void close_fd(int& fd) noexcept {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

}  // namespace

PipeReader::PipeReader(PipeReader&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

PipeReader& PipeReader::operator=(PipeReader&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

PipeReader::~PipeReader() { close(); }

void PipeReader::close() noexcept { close_fd(fd_); }

#if LAUNCHPAD_HAS_STD_SPAN
Result<std::size_t> PipeReader::read_some(std::span<std::byte> buffer) const {
  return read_some(buffer.data(), buffer.size());
}
#endif

Result<std::size_t> PipeReader::read_some(void* data, std::size_t n) const {
  if (fd_ < 0) {
    return closed_pipe_error(errc::read_failed, "read on closed pipe");
  }
  while (true) {
    ssize_t rv = ::read(fd_, data, n);
    if (rv >= 0) {
      return static_cast<std::size_t>(rv);
    }
    if (errno != EINTR) {
      return make_os_error(errc::read_failed, errno, "read");
    }
  }
}

Result<std::string> PipeReader::read_all() const {
  std::string out;
  std::array<char, kPipeBufferSize> buffer{};
  while (true) {
    auto count = read_some(buffer.data(), buffer.size());
    if (!count) {
      return count.error();
    }
    if (count.value() == 0) {
      return out;
    }
    out.append(buffer.data(), count.value());
  }
}

PipeWriter::PipeWriter(PipeWriter&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

PipeWriter& PipeWriter::operator=(PipeWriter&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

PipeWriter::~PipeWriter() { close(); }

void PipeWriter::close() noexcept { close_fd(fd_); }

#if LAUNCHPAD_HAS_STD_SPAN
Result<std::size_t> PipeWriter::write_some(std::span<const std::byte> buffer) const {
  return write_some(buffer.data(), buffer.size());
}
#endif

Result<std::size_t> PipeWriter::write_some(const void* data, std::size_t n) const {
  if (fd_ < 0) {
    return closed_pipe_error(errc::write_failed, "write on closed pipe");
  }
  while (true) {
    ssize_t rv = ::write(fd_, data, n);
    if (rv >= 0) {
      return static_cast<std::size_t>(rv);
    }
    if (errno != EINTR) {
      return make_os_error(errc::write_failed, errno, "write");
    }
  }
}

Result<void> PipeWriter::write_all(std::string_view data) const {
  std::size_t offset = 0;
  while (offset < data.size()) {
    auto written = write_some(data.data() + offset, data.size() - offset);
    if (!written) {
      return written.error();
    }
    if (written.value() == 0) {
      return Error{.code = make_error_code(errc::write_failed), .context = "write made no progress"};
    }
    offset += written.value();
  }
  return {};
}

}  // namespace launchpad
