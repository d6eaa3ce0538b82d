#pragma once
#include "FileStability.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace TrapWatch {

enum class WatchMethod {
    INOTIFY,
    POLLING
};

// Accepts "inotify", "polling" and "os" (an alias for polling)
bool parseWatchMethod(const std::string& name, WatchMethod& method);
std::string watchMethodToString(WatchMethod method);

struct ObserverConfig {
    int pollIntervalMs{1000};
    int settleDelayMs{2000};
    int stabilityTimeoutMs{10000};
    int stabilityIntervalMs{500};
    int extraWaitMs{0};
    int restartDelayMs{1000};
};

// Receives every stable new file on its own dispatch thread
using FileHandler = std::function<void(const std::string& path, const std::string& folder)>;

// Counts dispatch threads that have not finished yet. Shared by the
// observers of one manager and kept alive by the threads themselves.
class DispatchTracker {
public:
    void begin();
    void end();

    size_t inFlight() const;
    // Returns false if dispatches are still running when timeout expires
    bool waitIdle(std::chrono::milliseconds timeout);

private:
    mutable std::mutex mutex_;
    std::condition_variable idleCv_;
    size_t inFlight_{0};
};

class FolderObserver {
public:
    FolderObserver(const std::string& folder,
                   WatchMethod method,
                   const ObserverConfig& config,
                   FileHandler handler,
                   OpenHandleQuery query = queryOpenHandles,
                   std::shared_ptr<DispatchTracker> tracker = nullptr);
    ~FolderObserver();

    FolderObserver(const FolderObserver&) = delete;
    FolderObserver& operator=(const FolderObserver&) = delete;

    void start();
    // Raises the stop flag and returns without waiting for the thread
    void stop();
    bool isRunning() const { return running_.load(); }

    const std::string& folder() const { return folder_; }
    WatchMethod method() const { return method_; }

    size_t pendingDispatches() const { return tracker_->inFlight(); }
    bool waitForDispatches(std::chrono::milliseconds timeout) { return tracker_->waitIdle(timeout); }

private:
    void superviseLoop();
    void watchInotify();
    void watchPolling();
    std::set<std::string> listFiles() const;
    void handleNewFile(const std::string& path);
    void dispatch(const std::string& path);

    // Sleeps for duration unless stopped first. Returns false when stopped.
    bool waitFor(std::chrono::milliseconds duration);

    std::string folder_;
    WatchMethod method_;
    ObserverConfig config_;
    FileHandler handler_;
    OpenHandleQuery query_;
    std::shared_ptr<DispatchTracker> tracker_;

    std::thread thread_;
    std::atomic<bool> running_;
    std::mutex waitMutex_;
    std::condition_variable waitCv_;
};

} // namespace TrapWatch
