#pragma once
#include "CommandRunner.hpp"
#include "DeviceMonitor.hpp"
#include "DeviceProber.hpp"

namespace TrapWatch {

enum class CameraCheckMethod {
    ICMP,
    TCP,
    BOTH
};

struct CameraProbeConfig {
    std::string checkMethod{"tcp"};
    int tcpPort{80};
    int tcpTimeoutSeconds{3};
    int icmpTimeoutSeconds{2};
};

class CameraProber : public DeviceProber {
public:
    // Invalid check methods fall back to TCP with a warning
    explicit CameraProber(const CameraProbeConfig& config,
                          CommandExecutor executor = runCommand);

    bool probe(const std::string& ipAddress) override;
    std::string describe() const override;

    bool pingDevice(const std::string& ipAddress);
    bool tcpConnect(const std::string& ipAddress);

    CameraCheckMethod checkMethod() const { return method_; }

    static bool parseCheckMethod(const std::string& name, CameraCheckMethod& method);
    static std::string checkMethodToString(CameraCheckMethod method);

private:
    CameraProbeConfig config_;
    CameraCheckMethod method_;
    CommandExecutor executor_;
};

class CameraMonitor : public DeviceMonitor {
public:
    CameraMonitor(DeviceRegistry& registry,
                  std::shared_ptr<DeviceStore> store,
                  const MonitorConfig& config,
                  const CameraProbeConfig& probeConfig,
                  StatusChangeCallback callback = nullptr);
};

} // namespace TrapWatch
