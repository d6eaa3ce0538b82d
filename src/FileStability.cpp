#include "FileStability.hpp"
#include "CommandRunner.hpp"
#include "Logger.hpp"
#include <stdexcept>
#include <thread>

namespace TrapWatch {

HandleState queryOpenHandles(const std::string& path) {
    CommandResult result = runCommand("lsof -t -- " + shellQuote(path) + " 2>/dev/null");

    // lsof exits 1 both for "no process" and for some errors; output decides
    switch (result.exitCode) {
        case 0:
            return result.output.empty() ? HandleState::CLOSED : HandleState::OPEN;
        case 1:
            return HandleState::CLOSED;
        default:
            return HandleState::UNAVAILABLE;
    }
}

bool waitForFileStability(const std::string& path,
                          std::chrono::milliseconds timeout,
                          std::chrono::milliseconds interval,
                          const OpenHandleQuery& query) {
    if (timeout.count() <= 0) {
        throw std::invalid_argument("Stability timeout must be positive, got " +
                                    std::to_string(timeout.count()) + "ms");
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int attempts = 0;

    while (true) {
        ++attempts;
        HandleState state = query(path);
        if (state == HandleState::CLOSED) {
            LOG_DEBUG("File " + path + " is stable after " + std::to_string(attempts) + " check(s)");
            return true;
        }
        if (state == HandleState::UNAVAILABLE) {
            LOG_DEBUG("Open handle query unavailable for " + path + ", retrying");
        }

        auto now = std::chrono::steady_clock::now();
        if (now + interval > deadline) {
            break;
        }
        std::this_thread::sleep_for(interval);
    }

    LOG_WARNING("File " + path + " did not become stable within " +
                std::to_string(timeout.count()) + "ms");
    return false;
}

} // namespace TrapWatch
