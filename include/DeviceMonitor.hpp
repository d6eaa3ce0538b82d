#pragma once
#include "DeviceInfo.hpp"
#include "DeviceProber.hpp"
#include "DeviceRegistry.hpp"
#include "DeviceStore.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace TrapWatch {

using StatusChangeCallback = std::function<void(const std::string& eventType, const json& device)>;

struct MonitorConfig {
    int intervalSeconds{60};
    bool enabled{true};
    bool autoRemoveEnabled{false};
    int autoRemoveHours{24};
    // Upper bound on how long stop() waits for the loop thread
    int stopTimeoutMs{5000};
};

// Periodic heartbeat engine shared by every device kind. The kind supplies
// the prober; the registry and the store belong to the caller.
class DeviceMonitor {
public:
    DeviceMonitor(const std::string& kind,
                  DeviceRegistry& registry,
                  std::shared_ptr<DeviceStore> store,
                  std::unique_ptr<DeviceProber> prober,
                  const MonitorConfig& config,
                  StatusChangeCallback callback = nullptr);
    virtual ~DeviceMonitor();

    DeviceMonitor(const DeviceMonitor&) = delete;
    DeviceMonitor& operator=(const DeviceMonitor&) = delete;

    void start();
    void stop();
    bool isRunning() const;

    // Probes every device once on the calling thread. Devices without an
    // IP address report false.
    std::map<std::string, bool> checkNow();

    // One pass of the periodic loop: probe, update, evict.
    void runCycle();

    void updateDeviceStatus(const std::string& macAddress, bool isReachable);
    void removeStaleDevices();

    const std::string& kind() const { return kind_; }
    const MonitorConfig& config() const { return config_; }
    std::string logContext() const;

private:
    void monitorLoop();
    void persist();
    void notify(const std::string& eventType, const json& device);
    bool stopRequested();
    std::string displayName() const;

    std::string kind_;
    DeviceRegistry& registry_;
    std::shared_ptr<DeviceStore> store_;
    std::unique_ptr<DeviceProber> prober_;
    MonitorConfig config_;
    StatusChangeCallback callback_;

    // Serializes update+persist so a checkNow() caller and the loop never
    // interleave on the same device
    std::mutex updateMutex_;

    std::thread thread_;
    std::atomic<bool> running_;
    std::mutex waitMutex_;
    std::condition_variable waitCv_;
    bool stopRequested_;
    bool loopExited_;
};

} // namespace TrapWatch
