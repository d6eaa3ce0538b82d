#include "ConfigLoader.hpp"
#include "Logger.hpp"
#include <fstream>

namespace TrapWatch {

ConfigLoader::ConfigLoader() {
    setDefaults();
}

bool ConfigLoader::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_WARNING("Config file not found: " + filename + ", using defaults");
        return false;
    }

    try {
        json j;
        file >> j;
        if (!j.is_object()) {
            LOG_ERROR("Config file is not a JSON object: " + filename);
            return false;
        }
        return loadFromJson(j);
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing config file: " + std::string(e.what()));
        return false;
    }
}

bool ConfigLoader::loadFromJson(const json& j) {
    if (j.contains("logFile")) {
        config_.logFile = j["logFile"].get<std::string>();
    }
    if (j.contains("logLevel")) {
        config_.logLevel = j["logLevel"].get<std::string>();
    }
    if (j.contains("settingsFile")) {
        config_.settingsFile = j["settingsFile"].get<std::string>();
    }
    if (j.contains("watchMethod")) {
        config_.watchMethod = j["watchMethod"].get<std::string>();
    }
    if (j.contains("watchFolders")) {
        config_.watchFolders = j["watchFolders"].get<std::vector<std::string>>();
    }
    if (j.contains("shutdownTimeoutSeconds")) {
        config_.shutdownTimeoutSeconds = j["shutdownTimeoutSeconds"].get<int>();
    }

    if (j.contains("fileStability")) {
        auto stability = j["fileStability"];
        if (stability.contains("timeoutSeconds")) {
            config_.fileStability.timeoutSeconds = stability["timeoutSeconds"].get<int>();
        }
        if (stability.contains("intervalMs")) {
            config_.fileStability.intervalMs = stability["intervalMs"].get<int>();
        }
        if (stability.contains("settleDelayMs")) {
            config_.fileStability.settleDelayMs = stability["settleDelayMs"].get<int>();
        }
        if (stability.contains("extraWaitMs")) {
            config_.fileStability.extraWaitMs = stability["extraWaitMs"].get<int>();
        }
        if (stability.contains("pollIntervalMs")) {
            config_.fileStability.pollIntervalMs = stability["pollIntervalMs"].get<int>();
        }
    }

    if (j.contains("classification")) {
        auto classification = j["classification"];
        if (classification.contains("command")) {
            config_.classification.command = classification["command"].get<std::string>();
        }
        if (classification.contains("threshold")) {
            config_.classification.threshold = classification["threshold"].get<double>();
        }
        if (classification.contains("classifiedPumaDir")) {
            config_.classification.classifiedPumaDir = classification["classifiedPumaDir"].get<std::string>();
        }
        if (classification.contains("classifiedOtherDir")) {
            config_.classification.classifiedOtherDir = classification["classifiedOtherDir"].get<std::string>();
        }
        if (classification.contains("deterrentCommand")) {
            config_.classification.deterrentCommand = classification["deterrentCommand"].get<std::string>();
        }
        if (classification.contains("automaticPlugs")) {
            config_.classification.automaticPlugs = classification["automaticPlugs"].get<bool>();
        }
    }

    if (j.contains("cameraHeartbeat")) {
        auto camera = j["cameraHeartbeat"];
        if (camera.contains("enabled")) {
            config_.cameraHeartbeat.enabled = camera["enabled"].get<bool>();
        }
        if (camera.contains("intervalSeconds")) {
            config_.cameraHeartbeat.intervalSeconds = camera["intervalSeconds"].get<int>();
        }
        if (camera.contains("checkMethod")) {
            config_.cameraHeartbeat.checkMethod = camera["checkMethod"].get<std::string>();
        }
        if (camera.contains("tcpPort")) {
            config_.cameraHeartbeat.tcpPort = camera["tcpPort"].get<int>();
        }
        if (camera.contains("tcpTimeoutSeconds")) {
            config_.cameraHeartbeat.tcpTimeoutSeconds = camera["tcpTimeoutSeconds"].get<int>();
        }
        if (camera.contains("icmpTimeoutSeconds")) {
            config_.cameraHeartbeat.icmpTimeoutSeconds = camera["icmpTimeoutSeconds"].get<int>();
        }
        if (camera.contains("autoRemoveEnabled")) {
            config_.cameraHeartbeat.autoRemoveEnabled = camera["autoRemoveEnabled"].get<bool>();
        }
        if (camera.contains("autoRemoveHours")) {
            config_.cameraHeartbeat.autoRemoveHours = camera["autoRemoveHours"].get<int>();
        }
    }

    if (j.contains("plugHeartbeat")) {
        auto plug = j["plugHeartbeat"];
        if (plug.contains("enabled")) {
            config_.plugHeartbeat.enabled = plug["enabled"].get<bool>();
        }
        if (plug.contains("intervalSeconds")) {
            config_.plugHeartbeat.intervalSeconds = plug["intervalSeconds"].get<int>();
        }
        if (plug.contains("timeoutSeconds")) {
            config_.plugHeartbeat.timeoutSeconds = plug["timeoutSeconds"].get<int>();
        }
        if (plug.contains("autoRemoveEnabled")) {
            config_.plugHeartbeat.autoRemoveEnabled = plug["autoRemoveEnabled"].get<bool>();
        }
        if (plug.contains("autoRemoveHours")) {
            config_.plugHeartbeat.autoRemoveHours = plug["autoRemoveHours"].get<int>();
        }
    }

    if (j.contains("eventNotifier")) {
        auto notifier = j["eventNotifier"];
        if (notifier.contains("enabled")) {
            config_.eventNotifier.enabled = notifier["enabled"].get<bool>();
        }
        if (notifier.contains("endpoint")) {
            config_.eventNotifier.endpoint = notifier["endpoint"].get<std::string>();
        }
        if (notifier.contains("timeoutMs")) {
            config_.eventNotifier.timeoutMs = notifier["timeoutMs"].get<int>();
        }
    }

    LOG_INFO("Configuration loaded successfully");
    return true;
}

TrapWatchConfig ConfigLoader::getConfig() const {
    return config_;
}

void ConfigLoader::setWatchMethod(const std::string& method) {
    config_.watchMethod = method;
}

void ConfigLoader::setWatchFolders(const std::vector<std::string>& folders) {
    config_.watchFolders = folders;
}

void ConfigLoader::setDefaults() {
    config_.logFile = "";
    config_.logLevel = "INFO";
    config_.settingsFile = "trapwatch-devices.json";
    config_.watchMethod = "polling";
    config_.watchFolders.clear();
    config_.shutdownTimeoutSeconds = 30;

    config_.fileStability.timeoutSeconds = 10;
    config_.fileStability.intervalMs = 500;
    config_.fileStability.settleDelayMs = 2000;
    config_.fileStability.extraWaitMs = 0;
    config_.fileStability.pollIntervalMs = 1000;

    config_.classification.command = "";
    config_.classification.threshold = 0.5;
    config_.classification.classifiedPumaDir = "";
    config_.classification.classifiedOtherDir = "";
    config_.classification.deterrentCommand = "";
    config_.classification.automaticPlugs = true;

    config_.cameraHeartbeat.enabled = true;
    config_.cameraHeartbeat.intervalSeconds = 60;
    config_.cameraHeartbeat.checkMethod = "tcp";
    config_.cameraHeartbeat.tcpPort = 80;
    config_.cameraHeartbeat.tcpTimeoutSeconds = 3;
    config_.cameraHeartbeat.icmpTimeoutSeconds = 2;
    config_.cameraHeartbeat.autoRemoveEnabled = false;
    config_.cameraHeartbeat.autoRemoveHours = 24;

    config_.plugHeartbeat.enabled = true;
    config_.plugHeartbeat.intervalSeconds = 60;
    config_.plugHeartbeat.timeoutSeconds = 5;
    config_.plugHeartbeat.autoRemoveEnabled = false;
    config_.plugHeartbeat.autoRemoveHours = 24;

    config_.eventNotifier.enabled = false;
    config_.eventNotifier.endpoint = "http://127.0.0.1:5000/api/events";
    config_.eventNotifier.timeoutMs = 2000;
}

} // namespace TrapWatch
