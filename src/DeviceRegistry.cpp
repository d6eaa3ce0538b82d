#include "DeviceRegistry.hpp"
#include "Logger.hpp"

namespace TrapWatch {

void DeviceRegistry::addDevice(const DeviceRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_[record.macAddress] = record;
    LOG_DEBUG("Device registered: " + record.hostname + " (" + record.macAddress + ")");
}

bool DeviceRegistry::removeDevice(const std::string& macAddress) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = devices_.find(macAddress);
    if (it == devices_.end()) {
        return false;
    }
    devices_.erase(it);
    LOG_DEBUG("Device removed from registry: " + macAddress);
    return true;
}

std::optional<DeviceRecord> DeviceRegistry::getDevice(const std::string& macAddress) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = devices_.find(macAddress);
    if (it != devices_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<DeviceRecord> DeviceRegistry::getAllDevices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::vector<DeviceRecord> result;
    result.reserve(devices_.size());
    for (const auto& pair : devices_) {
        result.push_back(pair.second);
    }
    return result;
}

bool DeviceRegistry::contains(const std::string& macAddress) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.count(macAddress) > 0;
}

size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

bool DeviceRegistry::updateDevice(const std::string& macAddress,
                                  const std::function<void(DeviceRecord&)>& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = devices_.find(macAddress);
    if (it == devices_.end()) {
        return false;
    }
    fn(it->second);
    return true;
}

} // namespace TrapWatch
