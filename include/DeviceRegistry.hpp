#pragma once
#include "DeviceInfo.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace TrapWatch {

// Live device collection for one device kind, keyed by MAC address.
// Entries are mutated or erased individually; the collection itself is
// never swapped out from under readers.
class DeviceRegistry {
public:
    DeviceRegistry() = default;
    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    // Inserts or replaces the entry for record.macAddress
    void addDevice(const DeviceRecord& record);
    bool removeDevice(const std::string& macAddress);
    std::optional<DeviceRecord> getDevice(const std::string& macAddress) const;
    std::vector<DeviceRecord> getAllDevices() const;
    bool contains(const std::string& macAddress) const;
    size_t size() const;

    // Runs fn on the stored record while the registry lock is held.
    // Returns false when no such device exists.
    bool updateDevice(const std::string& macAddress, const std::function<void(DeviceRecord&)>& fn);

private:
    mutable std::mutex mutex_;
    std::map<std::string, DeviceRecord> devices_;
};

} // namespace TrapWatch
