#include "DeviceInfo.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace TrapWatch {

const char* const CAMERA_KIND = "camera";
const char* const PLUG_KIND = "plug";

json DeviceRecord::toJson(const std::string& kind) const {
    json j;
    j["hostname"] = hostname;
    j["ip_address"] = ipAddress;
    j["mac_address"] = macAddress;
    j["last_seen"] = lastSeen;
    j["status"] = statusToString(status);
    if (kind == PLUG_KIND) {
        j["mode"] = mode.empty() ? std::string("off") : mode;
    }
    return j;
}

namespace {

// Missing keys and non-string values (e.g. null last_seen) read as empty
std::string stringField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

} // namespace

DeviceRecord DeviceRecord::fromJson(const json& j) {
    DeviceRecord record;
    record.macAddress = stringField(j, "mac_address");
    record.hostname = stringField(j, "hostname");
    record.ipAddress = stringField(j, "ip_address");
    record.lastSeen = stringField(j, "last_seen");
    record.status = statusFromString(stringField(j, "status"));
    record.mode = stringField(j, "mode");
    return record;
}

std::string statusToString(DeviceStatus status) {
    switch (status) {
        case DeviceStatus::CONNECTED: return "connected";
        case DeviceStatus::DISCONNECTED: return "disconnected";
        default: return "disconnected";
    }
}

DeviceStatus statusFromString(const std::string& status) {
    return status == "connected" ? DeviceStatus::CONNECTED : DeviceStatus::DISCONNECTED;
}

std::string formatUtcTimestamp(std::chrono::system_clock::time_point when) {
    auto time_t = std::chrono::system_clock::to_time_t(when);
    std::tm utc{};
    gmtime_r(&time_t, &utc);

    std::stringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::string currentUtcTimestamp() {
    return formatUtcTimestamp(std::chrono::system_clock::now());
}

std::optional<std::chrono::system_clock::time_point> parseUtcTimestamp(const std::string& timestamp) {
    if (timestamp.empty()) {
        return std::nullopt;
    }

    std::tm tm{};
    std::istringstream ss(timestamp);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    std::string rest;
    std::getline(ss, rest);
    size_t pos = 0;

    // Fractional seconds are accepted and dropped
    if (pos < rest.size() && rest[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) {
            ++pos;
            ++digits;
        }
        if (digits == 0) {
            return std::nullopt;
        }
    }

    long offsetSeconds = 0;
    if (pos < rest.size()) {
        char zone = rest[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            // ±HH:MM
            if (rest.size() - pos != 6 || rest[pos + 3] != ':') {
                return std::nullopt;
            }
            for (size_t i : {pos + 1, pos + 2, pos + 4, pos + 5}) {
                if (!std::isdigit(static_cast<unsigned char>(rest[i]))) {
                    return std::nullopt;
                }
            }
            int hours = std::stoi(rest.substr(pos + 1, 2));
            int minutes = std::stoi(rest.substr(pos + 4, 2));
            if (hours > 23 || minutes > 59) {
                return std::nullopt;
            }
            offsetSeconds = hours * 3600L + minutes * 60L;
            if (zone == '-') {
                offsetSeconds = -offsetSeconds;
            }
            pos += 6;
        } else {
            return std::nullopt;
        }
    }

    if (pos != rest.size()) {
        return std::nullopt;
    }

    std::time_t epoch = timegm(&tm);
    if (epoch == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }

    return std::chrono::system_clock::from_time_t(epoch - offsetSeconds);
}

} // namespace TrapWatch
