#include "PlugAutomation.hpp"
#include "Logger.hpp"

namespace TrapWatch {

std::string plugSwitchUrl(const std::string& ipAddress, bool on) {
    return "http://" + ipAddress + PLUG_SWITCH_PATH + "&on=" + (on ? "true" : "false");
}

PlugAutomationActuator::PlugAutomationActuator(DeviceRegistry& plugs,
                                               std::shared_ptr<DetectionActuator> deterrent,
                                               int timeoutSeconds,
                                               HttpGetter getter)
    : plugs_(plugs), deterrent_(std::move(deterrent)),
      timeoutSeconds_(timeoutSeconds), getter_(std::move(getter)) {}

std::vector<DeviceRecord> PlugAutomationActuator::automaticPlugs() const {
    std::vector<DeviceRecord> selected;
    for (const auto& plug : plugs_.getAllDevices()) {
        if (plug.mode == PLUG_MODE_AUTOMATIC && plug.status == DeviceStatus::CONNECTED) {
            selected.push_back(plug);
        }
    }
    return selected;
}

bool PlugAutomationActuator::setSwitch(const DeviceRecord& plug, bool on) {
    const std::string state = on ? "ON" : "OFF";

    if (plug.ipAddress.empty()) {
        LOG_WARNING("Cannot control plug '" + plug.hostname + "': no IP address");
        return false;
    }

    LOG_INFO("Setting plug '" + plug.hostname + "' switch to " + state + " at " + plug.ipAddress);

    HttpResponse response;
    try {
        response = getter_(plugSwitchUrl(plug.ipAddress, on), timeoutSeconds_ * 1000);
    } catch (const std::exception& e) {
        LOG_ERROR("Error setting plug '" + plug.hostname + "' switch at " + plug.ipAddress + ": " +
                  std::string(e.what()));
        return false;
    }

    if (!response.ok) {
        LOG_WARNING("Error setting plug '" + plug.hostname + "' switch at " + plug.ipAddress + ": " +
                    response.error);
        return false;
    }
    if (response.statusCode < 200 || response.statusCode >= 300) {
        LOG_ERROR("Plug '" + plug.hostname + "' returned HTTP " + std::to_string(response.statusCode));
        return false;
    }

    json body = json::parse(response.body, nullptr, false);
    if (body.is_discarded()) {
        LOG_ERROR("Invalid JSON response from plug '" + plug.hostname + "' at " + plug.ipAddress);
        return false;
    }

    LOG_INFO("Successfully set plug '" + plug.hostname + "' switch to " + state);
    return true;
}

void PlugAutomationActuator::onDetection(const std::string& imagePath, double score) {
    // The same plugs are switched off even if one drops out meanwhile
    std::vector<DeviceRecord> selected = automaticPlugs();

    if (selected.empty()) {
        LOG_DEBUG("No automatic plugs to turn on");
    } else {
        LOG_INFO("Turning on " + std::to_string(selected.size()) + " automatic plug(s)");
        for (const auto& plug : selected) {
            setSwitch(plug, true);
        }
    }

    if (deterrent_) {
        try {
            deterrent_->onDetection(imagePath, score);
        } catch (const std::exception& e) {
            LOG_ERROR("Deterrent failed for " + imagePath + ": " + std::string(e.what()));
        }
    }

    if (selected.empty()) {
        LOG_DEBUG("No automatic plugs to turn off");
        return;
    }
    LOG_INFO("Turning off " + std::to_string(selected.size()) + " automatic plug(s)");
    for (const auto& plug : selected) {
        setSwitch(plug, false);
    }
}

} // namespace TrapWatch
