#pragma once
#include "CameraMonitor.hpp"
#include "ClassificationPipeline.hpp"
#include "ConfigLoader.hpp"
#include "DeviceRegistry.hpp"
#include "DeviceStore.hpp"
#include "EventDispatcher.hpp"
#include "FolderManager.hpp"
#include "PlugMonitor.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace TrapWatch {

struct CommandLineOverrides {
    std::string watchMethod;
    std::vector<std::string> watchFolders;
};

class TrapWatchService {
public:
    TrapWatchService();
    ~TrapWatchService();

    bool initialize(const std::string& configPath, const CommandLineOverrides& overrides = CommandLineOverrides());
    // Blocks until requestStop()
    void run();
    // Async-signal-safe
    void requestStop();
    // Stops observers and monitors, then waits up to shutdownTimeoutSeconds
    // for images still being processed
    void shutdown();

    // Logs every out-of-range interval or timeout
    static bool validateConfig(const TrapWatchConfig& config);

    DeviceRegistry& cameras() { return cameras_; }
    DeviceRegistry& plugs() { return plugs_; }
    EventDispatcher& events() { return *events_; }
    FolderManager& folders() { return *folders_; }
    const TrapWatchConfig& config() const { return config_; }

private:
    void loadDevices(const std::string& kind, DeviceRegistry& registry);
    FileHandler makeFileHandler();

    TrapWatchConfig config_;
    DeviceRegistry cameras_;
    DeviceRegistry plugs_;
    std::shared_ptr<JsonDeviceStore> store_;
    // Shared with dispatch threads
    std::shared_ptr<EventDispatcher> events_;
    std::shared_ptr<ClassificationPipeline> pipeline_;
    std::unique_ptr<CameraMonitor> cameraMonitor_;
    std::unique_ptr<PlugMonitor> plugMonitor_;
    std::unique_ptr<FolderManager> folders_;

    std::atomic<bool> running_;
    bool initialized_;
};

} // namespace TrapWatch
