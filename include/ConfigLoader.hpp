#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace TrapWatch {

using json = nlohmann::json;

struct FileStabilityConfig {
    int timeoutSeconds;
    int intervalMs;
    int settleDelayMs;
    int extraWaitMs;
    int pollIntervalMs;
};

struct ClassificationConfig {
    std::string command;
    double threshold;
    std::string classifiedPumaDir;
    std::string classifiedOtherDir;
    std::string deterrentCommand;
    // Switch connected plugs in automatic mode around the deterrent
    bool automaticPlugs;
};

struct CameraHeartbeatConfig {
    bool enabled;
    int intervalSeconds;
    std::string checkMethod;
    int tcpPort;
    int tcpTimeoutSeconds;
    int icmpTimeoutSeconds;
    bool autoRemoveEnabled;
    int autoRemoveHours;
};

struct PlugHeartbeatConfig {
    bool enabled;
    int intervalSeconds;
    int timeoutSeconds;
    bool autoRemoveEnabled;
    int autoRemoveHours;
};

struct EventNotifierConfig {
    bool enabled;
    std::string endpoint;
    int timeoutMs;
};

struct TrapWatchConfig {
    std::string logFile;
    std::string logLevel;
    std::string settingsFile;
    std::string watchMethod;
    std::vector<std::string> watchFolders;
    // Bound on waiting for in-flight classifications at shutdown
    int shutdownTimeoutSeconds;
    FileStabilityConfig fileStability;
    ClassificationConfig classification;
    CameraHeartbeatConfig cameraHeartbeat;
    PlugHeartbeatConfig plugHeartbeat;
    EventNotifierConfig eventNotifier;
};

class ConfigLoader {
public:
    ConfigLoader();

    // Missing or malformed files leave the defaults in place and return false
    bool loadFromFile(const std::string& filename);
    bool loadFromJson(const json& j);

    TrapWatchConfig getConfig() const;

    void setWatchMethod(const std::string& method);
    void setWatchFolders(const std::vector<std::string>& folders);

private:
    TrapWatchConfig config_;
    void setDefaults();
};

} // namespace TrapWatch
