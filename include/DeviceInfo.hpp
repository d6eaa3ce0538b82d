#pragma once
#include <string>
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>

namespace TrapWatch {

using json = nlohmann::json;

enum class DeviceStatus {
    CONNECTED,
    DISCONNECTED
};

// Device kind names double as the event prefix ("camera_removed") and the
// settings file key ("cameras").
extern const char* const CAMERA_KIND;
extern const char* const PLUG_KIND;

struct DeviceRecord {
    std::string macAddress;
    std::string hostname;
    std::string ipAddress;
    DeviceStatus status{DeviceStatus::DISCONNECTED};
    std::string lastSeen;
    // Plug switching mode, owned by the control logic. Cameras leave it empty.
    std::string mode;

    json toJson(const std::string& kind) const;
    static DeviceRecord fromJson(const json& j);
};

std::string statusToString(DeviceStatus status);
DeviceStatus statusFromString(const std::string& status);

std::string formatUtcTimestamp(std::chrono::system_clock::time_point when);
std::string currentUtcTimestamp();
std::optional<std::chrono::system_clock::time_point> parseUtcTimestamp(const std::string& timestamp);

} // namespace TrapWatch
