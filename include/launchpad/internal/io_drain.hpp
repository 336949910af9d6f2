#pragma once

#include <chrono>
#include <functional>
#include <string_view>

#include "launchpad/pipe.hpp"
#include "launchpad/result.hpp"

namespace launchpad::internal {

/// @brief Receives bytes read from a pipe, in order.
using ByteSink = std::function<void(std::string_view bytes)>;

/// @brief Read stdout and stderr pipes to EOF concurrently, feeding each sink.
///
/// Either pipe may be null. Each pipe is closed once it reaches EOF.
Result<void> drain_pipes(PipeReader* stdout_pipe, const ByteSink& stdout_sink,
                         PipeReader* stderr_pipe, const ByteSink& stderr_sink);

/// @brief Copy whatever output arrives within budget, then return.
///
/// Pipes reaching EOF are closed. Returns false without waiting when neither
/// pipe is open.
Result<bool> drain_pipes_for(PipeReader* stdout_pipe, const ByteSink& stdout_sink,
                             PipeReader* stderr_pipe, const ByteSink& stderr_sink,
                             std::chrono::milliseconds budget);

}  // namespace launchpad::internal
