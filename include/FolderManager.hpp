#pragma once
#include "FolderObserver.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace TrapWatch {

class FolderManager {
public:
    FolderManager(const ObserverConfig& config,
                  FileHandler handler,
                  OpenHandleQuery query = queryOpenHandles);
    ~FolderManager();

    FolderManager(const FolderManager&) = delete;
    FolderManager& operator=(const FolderManager&) = delete;

    // Does not check for duplicates
    FolderObserver& registerFolder(const std::string& path, WatchMethod method, bool start = false);

    // Best effort: one failing observer does not keep the others down
    void startAll();
    void stopAll();

    // Dispatches of every observer share one tracker
    size_t pendingDispatches() const { return tracker_->inFlight(); }
    bool waitForDispatches(std::chrono::milliseconds timeout);

    size_t observerCount() const { return observers_.size(); }
    const std::vector<std::unique_ptr<FolderObserver>>& observers() const { return observers_; }

private:
    ObserverConfig config_;
    FileHandler handler_;
    OpenHandleQuery query_;
    std::shared_ptr<DispatchTracker> tracker_;
    std::vector<std::unique_ptr<FolderObserver>> observers_;
};

} // namespace TrapWatch
