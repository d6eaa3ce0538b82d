#pragma once
#include "ClassificationPipeline.hpp"
#include "DeviceRegistry.hpp"
#include "PlugMonitor.hpp"
#include <memory>
#include <string>
#include <vector>

namespace TrapWatch {

// Shelly Gen2 switch control endpoint, completed with "&on=true|false"
constexpr const char* PLUG_SWITCH_PATH = "/rpc/Switch.Set?id=0";
constexpr const char* PLUG_MODE_AUTOMATIC = "automatic";

// Builds the switch URL for one plug
std::string plugSwitchUrl(const std::string& ipAddress, bool on);

// Switches every connected plug in automatic mode on, runs the wrapped
// deterrent and switches the same plugs off again. The deterrent may be null.
class PlugAutomationActuator : public DetectionActuator {
public:
    PlugAutomationActuator(DeviceRegistry& plugs,
                           std::shared_ptr<DetectionActuator> deterrent,
                           int timeoutSeconds,
                           HttpGetter getter = HTTPClient::get);

    void onDetection(const std::string& imagePath, double score) override;

    std::vector<DeviceRecord> automaticPlugs() const;
    // Returns true when the plug acknowledged the request
    bool setSwitch(const DeviceRecord& plug, bool on);

private:
    DeviceRegistry& plugs_;
    std::shared_ptr<DetectionActuator> deterrent_;
    int timeoutSeconds_;
    HttpGetter getter_;
};

} // namespace TrapWatch
