#include "PlugMonitor.hpp"
#include "Logger.hpp"

namespace TrapWatch {

PlugProber::PlugProber(int timeoutSeconds, HttpGetter getter)
    : timeoutSeconds_(timeoutSeconds), getter_(std::move(getter)) {}

bool PlugProber::probe(const std::string& ipAddress) {
    std::string url = "http://" + ipAddress + PLUG_STATUS_PATH;

    HttpResponse response;
    try {
        response = getter_(url, timeoutSeconds_ * 1000);
    } catch (const std::exception& e) {
        LOG_DEBUG("Plug status request to " + ipAddress + " failed: " + std::string(e.what()));
        return false;
    }

    if (!response.ok) {
        LOG_DEBUG("Plug status request to " + ipAddress + " failed: " + response.error);
        return false;
    }
    if (response.statusCode < 200 || response.statusCode >= 300) {
        LOG_DEBUG("Plug at " + ipAddress + " returned HTTP " + std::to_string(response.statusCode));
        return false;
    }

    json body = json::parse(response.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        LOG_DEBUG("Plug at " + ipAddress + " returned an undecodable status body");
        return false;
    }

    return body.contains("output");
}

std::string PlugProber::describe() const {
    return "timeout=" + std::to_string(timeoutSeconds_) + "s";
}

PlugMonitor::PlugMonitor(DeviceRegistry& registry,
                         std::shared_ptr<DeviceStore> store,
                         const MonitorConfig& config,
                         int timeoutSeconds,
                         StatusChangeCallback callback)
    : DeviceMonitor(PLUG_KIND, registry, std::move(store),
                    std::make_unique<PlugProber>(timeoutSeconds),
                    config, std::move(callback)) {}

} // namespace TrapWatch
