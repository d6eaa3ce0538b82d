#pragma once
#include "DeviceMonitor.hpp"
#include "DeviceProber.hpp"
#include "HTTPClient.hpp"
#include <functional>

namespace TrapWatch {

using HttpGetter = std::function<HttpResponse(const std::string& url, int timeoutMs)>;

// Shelly Gen2 switch status endpoint
constexpr const char* PLUG_STATUS_PATH = "/rpc/Switch.GetStatus?id=0";

class PlugProber : public DeviceProber {
public:
    explicit PlugProber(int timeoutSeconds, HttpGetter getter = HTTPClient::get);

    // Reachable when the status call returns 2xx with a JSON object that
    // carries an "output" field
    bool probe(const std::string& ipAddress) override;
    std::string describe() const override;

private:
    int timeoutSeconds_;
    HttpGetter getter_;
};

class PlugMonitor : public DeviceMonitor {
public:
    PlugMonitor(DeviceRegistry& registry,
                std::shared_ptr<DeviceStore> store,
                const MonitorConfig& config,
                int timeoutSeconds,
                StatusChangeCallback callback = nullptr);
};

} // namespace TrapWatch
