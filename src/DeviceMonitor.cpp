#include "DeviceMonitor.hpp"
#include "Logger.hpp"
#include <cctype>
#include <iomanip>
#include <optional>
#include <sstream>
#include <system_error>
#include <vector>

namespace TrapWatch {

namespace {

std::string formatHours(double hours) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << hours;
    return ss.str();
}

double hoursBetween(std::chrono::system_clock::time_point from,
                    std::chrono::system_clock::time_point to) {
    return std::chrono::duration<double, std::ratio<3600>>(to - from).count();
}

} // namespace

DeviceMonitor::DeviceMonitor(const std::string& kind,
                             DeviceRegistry& registry,
                             std::shared_ptr<DeviceStore> store,
                             std::unique_ptr<DeviceProber> prober,
                             const MonitorConfig& config,
                             StatusChangeCallback callback)
    : kind_(kind), registry_(registry), store_(std::move(store)),
      prober_(std::move(prober)), config_(config), callback_(std::move(callback)),
      running_(false), stopRequested_(false), loopExited_(true) {}

DeviceMonitor::~DeviceMonitor() {
    stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void DeviceMonitor::start() {
    if (!config_.enabled) {
        LOG_INFO(displayName() + " heartbeat monitoring is disabled");
        return;
    }

    if (running_.load()) {
        LOG_WARNING(displayName() + " heartbeat monitor is already running");
        return;
    }

    // A previous loop that outlived its stop() timeout is reaped here
    if (thread_.joinable()) {
        LOG_WARNING("Waiting for previous " + kind_ + " heartbeat thread to exit");
        thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        stopRequested_ = false;
        loopExited_ = false;
    }

    running_.store(true);
    try {
        thread_ = std::thread(&DeviceMonitor::monitorLoop, this);
    } catch (const std::system_error& e) {
        running_.store(false);
        {
            std::lock_guard<std::mutex> lock(waitMutex_);
            loopExited_ = true;
        }
        LOG_ERROR("Failed to start " + kind_ + " heartbeat thread: " + std::string(e.what()));
        return;
    }

    LOG_INFO(displayName() + " heartbeat monitoring started");
}

void DeviceMonitor::stop() {
    if (!running_.load()) {
        return;
    }

    running_.store(false);
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        stopRequested_ = true;
    }
    waitCv_.notify_all();

    bool exited;
    {
        std::unique_lock<std::mutex> lock(waitMutex_);
        exited = waitCv_.wait_for(lock, std::chrono::milliseconds(config_.stopTimeoutMs),
                                  [this] { return loopExited_; });
    }

    if (!exited) {
        LOG_WARNING(displayName() + " heartbeat monitor thread did not stop cleanly");
        return;
    }

    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_INFO(displayName() + " heartbeat monitoring stopped");
}

bool DeviceMonitor::isRunning() const {
    return running_.load();
}

bool DeviceMonitor::stopRequested() {
    std::lock_guard<std::mutex> lock(waitMutex_);
    return stopRequested_;
}

void DeviceMonitor::monitorLoop() {
    Logger::setThreadName(kind_ + "-monitor");

    std::string autoRemoveMsg;
    if (config_.autoRemoveEnabled) {
        autoRemoveMsg = ", auto-remove after " + std::to_string(config_.autoRemoveHours) + "h";
    }
    LOG_INFO(displayName() + " heartbeat monitor started (" + logContext() + autoRemoveMsg + ")");

    while (!stopRequested()) {
        try {
            runCycle();
        } catch (const std::exception& e) {
            LOG_ERROR("Error in " + kind_ + " heartbeat monitor loop: " + std::string(e.what()));
        }

        std::unique_lock<std::mutex> lock(waitMutex_);
        waitCv_.wait_for(lock, std::chrono::seconds(config_.intervalSeconds),
                         [this] { return stopRequested_; });
    }

    LOG_INFO(displayName() + " heartbeat monitor stopped");

    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        loopExited_ = true;
    }
    waitCv_.notify_all();
}

void DeviceMonitor::runCycle() {
    auto devices = registry_.getAllDevices();

    for (const auto& device : devices) {
        if (stopRequested()) {
            break;
        }
        if (device.ipAddress.empty()) {
            continue;
        }

        LOG_DEBUG("Checking " + kind_ + " '" + device.hostname + "' at " + device.ipAddress);

        try {
            bool isReachable = prober_->probe(device.ipAddress);
            updateDeviceStatus(device.macAddress, isReachable);
        } catch (const std::exception& e) {
            LOG_ERROR("Error checking " + kind_ + " " + device.macAddress + ": " + std::string(e.what()));
        }
    }

    removeStaleDevices();
}

std::map<std::string, bool> DeviceMonitor::checkNow() {
    std::map<std::string, bool> results;

    for (const auto& device : registry_.getAllDevices()) {
        if (device.ipAddress.empty()) {
            results[device.macAddress] = false;
            continue;
        }

        bool isReachable = false;
        try {
            isReachable = prober_->probe(device.ipAddress);
            updateDeviceStatus(device.macAddress, isReachable);
        } catch (const std::exception& e) {
            LOG_ERROR("Error checking " + kind_ + " " + device.macAddress + ": " + std::string(e.what()));
        }
        results[device.macAddress] = isReachable;
    }

    return results;
}

void DeviceMonitor::updateDeviceStatus(const std::string& macAddress, bool isReachable) {
    bool statusChanged = false;
    DeviceRecord updated;

    {
        std::lock_guard<std::mutex> guard(updateMutex_);

        bool found = registry_.updateDevice(macAddress, [&](DeviceRecord& device) {
            if (isReachable) {
                statusChanged = device.status != DeviceStatus::CONNECTED;
                device.status = DeviceStatus::CONNECTED;
                device.lastSeen = currentUtcTimestamp();
            } else {
                // last_seen keeps the time of the last successful probe
                statusChanged = device.status == DeviceStatus::CONNECTED;
                device.status = DeviceStatus::DISCONNECTED;
            }
            updated = device;
        });

        if (!found) {
            return;
        }

        if (statusChanged) {
            if (isReachable) {
                LOG_INFO(displayName() + " '" + updated.hostname + "' is now reachable at " + updated.ipAddress);
            } else {
                LOG_WARNING(displayName() + " '" + updated.hostname + "' is no longer reachable at " +
                            updated.ipAddress);
            }
        }

        persist();
    }

    // Callbacks run unlocked so a listener may call back into the monitor
    if (statusChanged) {
        notify(kind_ + (isReachable ? "_status_changed_online" : "_status_changed_offline"),
               updated.toJson(kind_));
    }
}

void DeviceMonitor::removeStaleDevices() {
    const auto now = std::chrono::system_clock::now();
    const auto threshold = std::chrono::hours(config_.autoRemoveHours);

    std::vector<DeviceRecord> candidates;

    for (const auto& device : registry_.getAllDevices()) {
        if (device.lastSeen.empty()) {
            LOG_DEBUG(displayName() + " '" + device.hostname + "' (" + device.macAddress +
                      ") has never been seen, skipping stale check");
            continue;
        }

        auto lastSeen = parseUtcTimestamp(device.lastSeen);
        if (!lastSeen) {
            LOG_WARNING("Could not parse last_seen timestamp for " + kind_ + " " +
                        device.macAddress + ": '" + device.lastSeen + "'");
            continue;
        }

        const auto sinceSeen = now - *lastSeen;
        const double hoursOffline = hoursBetween(*lastSeen, now);

        if (sinceSeen > threshold) {
            candidates.push_back(device);
            const std::string msg = displayName() + " '" + device.hostname + "' (" + device.macAddress +
                                    ") not seen for " + formatHours(hoursOffline) + " hours";
            if (config_.autoRemoveEnabled) {
                LOG_INFO(msg + ", scheduling for auto-removal");
            } else {
                LOG_DEBUG(msg + " (auto-removal disabled)");
            }
        } else if (device.status == DeviceStatus::DISCONNECTED) {
            if (config_.autoRemoveEnabled) {
                const double hoursLeft = config_.autoRemoveHours - hoursOffline;
                LOG_DEBUG(displayName() + " '" + device.hostname + "' (" + device.macAddress + ") at " +
                          device.ipAddress + " has been offline for " + formatHours(hoursOffline) +
                          " hours, will be auto-removed in " + formatHours(hoursLeft) + " hours");
            } else {
                LOG_DEBUG(displayName() + " '" + device.hostname + "' (" + device.macAddress + ") at " +
                          device.ipAddress + " has been offline for " + formatHours(hoursOffline) +
                          " hours (auto-removal disabled)");
            }
        }
    }

    if (candidates.empty()) {
        return;
    }

    if (!config_.autoRemoveEnabled) {
        LOG_DEBUG(std::to_string(candidates.size()) + " " + kind_ +
                  "(s) would be auto-removed but feature is disabled");
        return;
    }

    for (const auto& candidate : candidates) {
        try {
            std::optional<DeviceRecord> removed;
            {
                std::lock_guard<std::mutex> guard(updateMutex_);

                // A probe may have refreshed the device since the snapshot
                auto current = registry_.getDevice(candidate.macAddress);
                if (!current) {
                    continue;
                }
                auto lastSeen = parseUtcTimestamp(current->lastSeen);
                if (!lastSeen || std::chrono::system_clock::now() - *lastSeen <= threshold) {
                    continue;
                }
                if (!registry_.removeDevice(candidate.macAddress)) {
                    continue;
                }

                persist();
                removed = current;
            }

            LOG_INFO("Auto-removed " + kind_ + " '" + removed->hostname + "' (" + removed->macAddress +
                     ") at " + removed->ipAddress);

            notify(kind_ + "_removed", removed->toJson(kind_));
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to auto-remove " + kind_ + " " + candidate.macAddress + ": " + std::string(e.what()));
        }
    }
}

std::string DeviceMonitor::logContext() const {
    return "interval=" + std::to_string(config_.intervalSeconds) + "s, " + prober_->describe();
}

void DeviceMonitor::persist() {
    if (!store_) {
        return;
    }
    try {
        store_->save(kind_, registry_.getAllDevices());
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to save " + kind_ + " list: " + std::string(e.what()));
    }
}

void DeviceMonitor::notify(const std::string& eventType, const json& device) {
    if (!callback_) {
        return;
    }
    try {
        callback_(eventType, device);
    } catch (const std::exception& e) {
        LOG_ERROR("Error calling status change callback for " + eventType + ": " + std::string(e.what()));
    }
}

std::string DeviceMonitor::displayName() const {
    std::string name = kind_;
    if (!name.empty()) {
        name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
    }
    return name;
}

} // namespace TrapWatch
