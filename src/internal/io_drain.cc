#include "launchpad/internal/io_drain.hpp"

#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdint>

#include "launchpad/internal/fd.hpp"

namespace launchpad::internal {

namespace {

constexpr std::size_t kChunkSize = 16384;

struct Source {
  PipeReader* pipe = nullptr;
  const ByteSink* sink = nullptr;
  bool open = false;
};

enum class ReadOutcome : std::uint8_t { drained, eof };

// Read until the pipe would block or reports EOF.
Result<ReadOutcome> read_available(Source& source) {
  std::array<char, kChunkSize> chunk{};
  int fd = source.pipe->native_handle();
  while (true) {
    ssize_t count = ::read(fd, chunk.data(), chunk.size());
    if (count > 0) {
      if (*source.sink) {
        (*source.sink)(std::string_view(chunk.data(), static_cast<std::size_t>(count)));
      }
      continue;
    }
    if (count == 0) {
      return ReadOutcome::eof;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return ReadOutcome::drained;
    }
    return make_os_error(errc::read_failed, errno, "read child output");
  }
}

// Switches every usable pipe to non-blocking mode; returns how many are open.
Result<int> open_sources(std::array<Source, 2>& sources) {
  int remaining = 0;
  for (auto& source : sources) {
    if (source.pipe == nullptr || !source.pipe->is_open()) {
      continue;
    }
    auto nonblocking = set_nonblocking(source.pipe->native_handle());
    if (!nonblocking) {
      return nonblocking.error();
    }
    source.open = true;
    ++remaining;
  }
  return remaining;
}

// One poll() over the open sources; timeout_ms < 0 blocks. EOF closes the pipe.
Result<void> poll_round(std::array<Source, 2>& sources, int& remaining, int timeout_ms) {
  std::array<pollfd, 2> fds{};
  std::array<Source*, 2> polled{};
  nfds_t count = 0;
  for (auto& source : sources) {
    if (source.open) {
      fds[count] = pollfd{.fd = source.pipe->native_handle(), .events = POLLIN, .revents = 0};
      polled[count] = &source;
      ++count;
    }
  }

  int ready = ::poll(fds.data(), count, timeout_ms);
  if (ready == -1) {
    if (errno == EINTR) {
      return {};
    }
    return make_os_error(errc::read_failed, errno, "poll child output");
  }

  for (nfds_t i = 0; i < count && ready > 0; ++i) {
    if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
      continue;
    }
    Source& source = *polled[i];
    auto outcome = read_available(source);
    if (!outcome) {
      return outcome.error();
    }
    if (*outcome == ReadOutcome::eof) {
      source.pipe->close();
      source.open = false;
      --remaining;
    }
  }
  return {};
}

}  // namespace

Result<void> drain_pipes(PipeReader* stdout_pipe, const ByteSink& stdout_sink,
                         PipeReader* stderr_pipe, const ByteSink& stderr_sink) {
  std::array<Source, 2> sources = {Source{.pipe = stdout_pipe, .sink = &stdout_sink},
                                   Source{.pipe = stderr_pipe, .sink = &stderr_sink}};
  auto opened = open_sources(sources);
  if (!opened) {
    return opened.error();
  }
  int remaining = *opened;
  while (remaining > 0) {
    auto round = poll_round(sources, remaining, -1);
    if (!round) {
      return round;
    }
  }
  return {};
}

Result<bool> drain_pipes_for(PipeReader* stdout_pipe, const ByteSink& stdout_sink,
                             PipeReader* stderr_pipe, const ByteSink& stderr_sink,
                             std::chrono::milliseconds budget) {
  std::array<Source, 2> sources = {Source{.pipe = stdout_pipe, .sink = &stdout_sink},
                                   Source{.pipe = stderr_pipe, .sink = &stderr_sink}};
  auto opened = open_sources(sources);
  if (!opened) {
    return opened.error();
  }
  int remaining = *opened;
  if (remaining == 0) {
    return false;
  }
  auto timeout_ms = static_cast<int>(std::max(budget.count(), std::chrono::milliseconds::rep{0}));
  auto round = poll_round(sources, remaining, timeout_ms);
  if (!round) {
    return round.error();
  }
  return true;
}

}  // namespace launchpad::internal
