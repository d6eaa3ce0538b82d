#include "DeviceStore.hpp"
#include "Logger.hpp"
#include <cstdio>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace TrapWatch {

JsonDeviceStore::JsonDeviceStore(const std::string& filePath)
    : filePath_(filePath) {}

std::string JsonDeviceStore::listKey(const std::string& kind) {
    return kind + "s";
}

json JsonDeviceStore::readDocument() {
    std::ifstream file(filePath_);
    if (!file.is_open()) {
        return json::object();
    }

    try {
        json document;
        file >> document;
        if (document.is_object()) {
            return document;
        }
        LOG_WARNING("Settings file " + filePath_ + " does not hold a JSON object, starting fresh");
    } catch (const std::exception& e) {
        LOG_WARNING("Error parsing settings file " + filePath_ + ": " + std::string(e.what()));
    }
    return json::object();
}

void JsonDeviceStore::save(const std::string& kind, const std::vector<DeviceRecord>& devices) {
    std::lock_guard<std::mutex> lock(mutex_);

    json document = readDocument();
    json list = json::array();
    for (const auto& device : devices) {
        list.push_back(device.toJson(kind));
    }
    document[listKey(kind)] = list;

    const std::string tmpPath = filePath_ + ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("Cannot open " + tmpPath + " for writing: " + std::strerror(errno));
        }
        out << document.dump(2) << std::endl;
        if (!out.good()) {
            throw std::runtime_error("Failed writing " + tmpPath);
        }
    }

    if (std::rename(tmpPath.c_str(), filePath_.c_str()) != 0) {
        std::string reason = std::strerror(errno);
        std::remove(tmpPath.c_str());
        throw std::runtime_error("Cannot replace " + filePath_ + ": " + reason);
    }

    LOG_DEBUG("Saved " + std::to_string(devices.size()) + " " + kind + "(s) to " + filePath_);
}

std::vector<DeviceRecord> JsonDeviceStore::load(const std::string& kind) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<DeviceRecord> devices;
    json document = readDocument();
    const std::string key = listKey(kind);
    if (!document.contains(key) || !document[key].is_array()) {
        return devices;
    }

    for (const auto& entry : document[key]) {
        if (!entry.is_object()) {
            continue;
        }
        DeviceRecord record = DeviceRecord::fromJson(entry);
        if (record.macAddress.empty()) {
            LOG_WARNING("Skipping " + kind + " entry without mac_address in " + filePath_);
            continue;
        }
        devices.push_back(record);
    }
    return devices;
}

} // namespace TrapWatch
