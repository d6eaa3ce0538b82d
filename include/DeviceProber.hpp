#pragma once
#include <string>

namespace TrapWatch {

// Reachability test for one device kind. Implementations never throw;
// every failure resolves to false.
class DeviceProber {
public:
    virtual ~DeviceProber() = default;

    virtual bool probe(const std::string& ipAddress) = 0;

    // Probe settings for log lines, e.g. "method=tcp, port=80"
    virtual std::string describe() const = 0;
};

} // namespace TrapWatch
