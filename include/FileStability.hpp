#pragma once
#include <chrono>
#include <functional>
#include <string>

namespace TrapWatch {

enum class HandleState {
    CLOSED,
    OPEN,
    // The query tool itself could not run
    UNAVAILABLE
};

using OpenHandleQuery = std::function<HandleState(const std::string& path)>;

// Asks lsof whether any process holds path open
HandleState queryOpenHandles(const std::string& path);

// Polls query every interval until path is reported closed. Returns false
// when timeout elapses first. An unavailable query counts as "try again".
// Throws std::invalid_argument if timeout is not positive.
bool waitForFileStability(const std::string& path,
                          std::chrono::milliseconds timeout,
                          std::chrono::milliseconds interval,
                          const OpenHandleQuery& query = queryOpenHandles);

} // namespace TrapWatch
