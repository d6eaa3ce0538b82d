#include "TrapWatchService.hpp"
#include "Logger.hpp"
#include "PlugAutomation.hpp"
#include <chrono>
#include <filesystem>
#include <thread>

namespace TrapWatch {

TrapWatchService::TrapWatchService() : running_(false), initialized_(false) {}

TrapWatchService::~TrapWatchService() {
    shutdown();
}

bool TrapWatchService::initialize(const std::string& configPath, const CommandLineOverrides& overrides) {
    try {
        ConfigLoader loader;
        if (!configPath.empty() && !loader.loadFromFile(configPath)) {
            LOG_ERROR("Failed to load configuration from " + configPath);
            return false;
        }
        if (!overrides.watchMethod.empty()) {
            loader.setWatchMethod(overrides.watchMethod);
        }
        if (!overrides.watchFolders.empty()) {
            loader.setWatchFolders(overrides.watchFolders);
        }
        config_ = loader.getConfig();

        Logger::getInstance().setLogLevel(Logger::parseLevel(config_.logLevel));
        if (!config_.logFile.empty()) {
            Logger::getInstance().setLogFile(config_.logFile);
        }

        if (!validateConfig(config_)) {
            return false;
        }

        store_ = std::make_shared<JsonDeviceStore>(config_.settingsFile);
        loadDevices(CAMERA_KIND, cameras_);
        loadDevices(PLUG_KIND, plugs_);

        NotifierConfig notifierConfig;
        notifierConfig.enabled = config_.eventNotifier.enabled;
        notifierConfig.endpoint = config_.eventNotifier.endpoint;
        notifierConfig.timeoutMs = config_.eventNotifier.timeoutMs;
        events_ = std::make_shared<EventDispatcher>(notifierConfig);

        // Device heartbeat monitors
        MonitorConfig cameraConfig;
        cameraConfig.enabled = config_.cameraHeartbeat.enabled;
        cameraConfig.intervalSeconds = config_.cameraHeartbeat.intervalSeconds;
        cameraConfig.autoRemoveEnabled = config_.cameraHeartbeat.autoRemoveEnabled;
        cameraConfig.autoRemoveHours = config_.cameraHeartbeat.autoRemoveHours;

        CameraProbeConfig probeConfig;
        probeConfig.checkMethod = config_.cameraHeartbeat.checkMethod;
        probeConfig.tcpPort = config_.cameraHeartbeat.tcpPort;
        probeConfig.tcpTimeoutSeconds = config_.cameraHeartbeat.tcpTimeoutSeconds;
        probeConfig.icmpTimeoutSeconds = config_.cameraHeartbeat.icmpTimeoutSeconds;

        cameraMonitor_ = std::make_unique<CameraMonitor>(cameras_, store_, cameraConfig, probeConfig,
                                                         events_->asCallback());
        cameraMonitor_->start();

        MonitorConfig plugConfig;
        plugConfig.enabled = config_.plugHeartbeat.enabled;
        plugConfig.intervalSeconds = config_.plugHeartbeat.intervalSeconds;
        plugConfig.autoRemoveEnabled = config_.plugHeartbeat.autoRemoveEnabled;
        plugConfig.autoRemoveHours = config_.plugHeartbeat.autoRemoveHours;

        plugMonitor_ = std::make_unique<PlugMonitor>(plugs_, store_, plugConfig,
                                                     config_.plugHeartbeat.timeoutSeconds,
                                                     events_->asCallback());
        plugMonitor_->start();

        // Classification and folder observers
        if (!config_.classification.command.empty()) {
            PipelineConfig pipelineConfig;
            pipelineConfig.threshold = config_.classification.threshold;
            pipelineConfig.classifiedPumaDir = config_.classification.classifiedPumaDir;
            pipelineConfig.classifiedOtherDir = config_.classification.classifiedOtherDir;

            std::shared_ptr<DetectionActuator> actuator;
            if (!config_.classification.deterrentCommand.empty()) {
                actuator = std::make_shared<CommandActuator>(config_.classification.deterrentCommand);
            }
            if (config_.classification.automaticPlugs) {
                actuator = std::make_shared<PlugAutomationActuator>(plugs_, actuator,
                                                                    config_.plugHeartbeat.timeoutSeconds);
            }

            auto events = events_;
            pipeline_ = std::make_shared<ClassificationPipeline>(
                std::make_shared<CommandClassifier>(config_.classification.command),
                actuator, pipelineConfig,
                [events](const std::string& eventType, const json& data) {
                    events->notify(eventType, data);
                });
        } else {
            LOG_WARNING("No classification command configured, new images will not be classified");
        }

        WatchMethod method;
        if (!parseWatchMethod(config_.watchMethod, method)) {
            LOG_WARNING("Unknown watch method '" + config_.watchMethod + "', using polling");
            method = WatchMethod::POLLING;
        }

        ObserverConfig observerConfig;
        observerConfig.pollIntervalMs = config_.fileStability.pollIntervalMs;
        observerConfig.settleDelayMs = config_.fileStability.settleDelayMs;
        observerConfig.stabilityTimeoutMs = config_.fileStability.timeoutSeconds * 1000;
        observerConfig.stabilityIntervalMs = config_.fileStability.intervalMs;
        observerConfig.extraWaitMs = config_.fileStability.extraWaitMs;

        folders_ = std::make_unique<FolderManager>(observerConfig, makeFileHandler());

        for (const auto& folder : config_.watchFolders) {
            std::error_code ec;
            std::filesystem::create_directories(folder, ec);
            if (ec) {
                LOG_ERROR("Cannot create watch folder " + folder + ": " + ec.message());
                continue;
            }
            folders_->registerFolder(folder, method);
        }
        if (folders_->observerCount() == 0) {
            LOG_WARNING("No folders to watch");
        }
        folders_->startAll();

        initialized_ = true;
        running_ = true;
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to initialize trapwatch service: " + std::string(e.what()));
        return false;
    }
}

void TrapWatchService::loadDevices(const std::string& kind, DeviceRegistry& registry) {
    for (const auto& device : store_->load(kind)) {
        registry.addDevice(device);
    }
    LOG_INFO("Loaded " + std::to_string(registry.size()) + " " + kind + "(s) from " + store_->filePath());
}

bool TrapWatchService::validateConfig(const TrapWatchConfig& config) {
    struct Bound {
        const char* name;
        int value;
        int minimum;
    };
    const Bound bounds[] = {
        {"fileStability.timeoutSeconds", config.fileStability.timeoutSeconds, 1},
        {"fileStability.intervalMs", config.fileStability.intervalMs, 1},
        {"fileStability.pollIntervalMs", config.fileStability.pollIntervalMs, 1},
        {"fileStability.settleDelayMs", config.fileStability.settleDelayMs, 0},
        {"fileStability.extraWaitMs", config.fileStability.extraWaitMs, 0},
        {"cameraHeartbeat.intervalSeconds", config.cameraHeartbeat.intervalSeconds, 1},
        {"cameraHeartbeat.tcpTimeoutSeconds", config.cameraHeartbeat.tcpTimeoutSeconds, 1},
        {"cameraHeartbeat.icmpTimeoutSeconds", config.cameraHeartbeat.icmpTimeoutSeconds, 1},
        {"cameraHeartbeat.autoRemoveHours", config.cameraHeartbeat.autoRemoveHours, 1},
        {"plugHeartbeat.intervalSeconds", config.plugHeartbeat.intervalSeconds, 1},
        {"plugHeartbeat.timeoutSeconds", config.plugHeartbeat.timeoutSeconds, 1},
        {"plugHeartbeat.autoRemoveHours", config.plugHeartbeat.autoRemoveHours, 1},
        {"eventNotifier.timeoutMs", config.eventNotifier.timeoutMs, 1},
        {"shutdownTimeoutSeconds", config.shutdownTimeoutSeconds, 0},
    };

    bool valid = true;
    for (const auto& bound : bounds) {
        if (bound.value < bound.minimum) {
            LOG_ERROR(std::string(bound.name) + " must be " + (bound.minimum > 0 ? "positive" : "non-negative") +
                      ", got " + std::to_string(bound.value));
            valid = false;
        }
    }
    return valid;
}

FileHandler TrapWatchService::makeFileHandler() {
    if (!pipeline_) {
        return [](const std::string& path, const std::string&) {
            LOG_INFO("New image " + path + " left unclassified");
        };
    }

    auto pipeline = pipeline_;
    return [pipeline](const std::string& path, const std::string& folder) {
        pipeline->process(path, folder);
    };
}

void TrapWatchService::run() {
    LOG_INFO("Trapwatch running... Press Ctrl+C to exit");

    while (running_) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
}

void TrapWatchService::requestStop() {
    running_ = false;
}

void TrapWatchService::shutdown() {
    if (!initialized_) return;
    initialized_ = false;
    running_ = false;

    LOG_INFO("Shutting down trapwatch service...");

    if (folders_) {
        folders_->stopAll();
    }
    if (cameraMonitor_) {
        cameraMonitor_->stop();
    }
    if (plugMonitor_) {
        plugMonitor_->stop();
    }

    // Classifications already dispatched still use the registries and the logger
    if (folders_ && folders_->pendingDispatches() > 0) {
        LOG_INFO("Waiting for " + std::to_string(folders_->pendingDispatches()) + " image(s) in progress");
        if (!folders_->waitForDispatches(std::chrono::seconds(config_.shutdownTimeoutSeconds))) {
            LOG_WARNING("Shutting down with unfinished image processing");
        }
    }

    LOG_INFO("Trapwatch service stopped");
}

} // namespace TrapWatch
