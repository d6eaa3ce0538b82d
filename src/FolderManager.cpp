#include "FolderManager.hpp"
#include "Logger.hpp"

namespace TrapWatch {

FolderManager::FolderManager(const ObserverConfig& config, FileHandler handler, OpenHandleQuery query)
    : config_(config), handler_(std::move(handler)), query_(std::move(query)),
      tracker_(std::make_shared<DispatchTracker>()) {}

FolderManager::~FolderManager() {
    stopAll();
}

FolderObserver& FolderManager::registerFolder(const std::string& path, WatchMethod method, bool start) {
    observers_.push_back(std::make_unique<FolderObserver>(path, method, config_, handler_, query_, tracker_));
    LOG_INFO("Registered folder " + path + " (" + watchMethodToString(method) + ")");

    FolderObserver& observer = *observers_.back();
    if (start) {
        observer.start();
    }
    return observer;
}

void FolderManager::startAll() {
    LOG_INFO("Starting " + std::to_string(observers_.size()) + " folder observer(s)");
    for (auto& observer : observers_) {
        try {
            observer->start();
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to start observer for " + observer->folder() + ": " + std::string(e.what()));
        }
    }
}

void FolderManager::stopAll() {
    for (auto& observer : observers_) {
        try {
            observer->stop();
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to stop observer for " + observer->folder() + ": " + std::string(e.what()));
        }
    }
}

bool FolderManager::waitForDispatches(std::chrono::milliseconds timeout) {
    if (tracker_->waitIdle(timeout)) {
        return true;
    }
    LOG_WARNING(std::to_string(tracker_->inFlight()) + " file dispatch(es) still running after " +
                std::to_string(timeout.count()) + " ms");
    return false;
}

} // namespace TrapWatch
