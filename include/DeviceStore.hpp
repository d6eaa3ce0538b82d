#pragma once
#include "DeviceInfo.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace TrapWatch {

class DeviceStore {
public:
    virtual ~DeviceStore() = default;

    // Replaces the persisted list for kind. Throws std::runtime_error on failure.
    virtual void save(const std::string& kind, const std::vector<DeviceRecord>& devices) = 0;
    virtual std::vector<DeviceRecord> load(const std::string& kind) = 0;
};

// Settings file holding a "cameras" and a "plugs" array. Unrelated top-level
// keys are carried over on every write.
class JsonDeviceStore : public DeviceStore {
public:
    explicit JsonDeviceStore(const std::string& filePath);

    void save(const std::string& kind, const std::vector<DeviceRecord>& devices) override;
    std::vector<DeviceRecord> load(const std::string& kind) override;

    const std::string& filePath() const { return filePath_; }

    static std::string listKey(const std::string& kind);

private:
    json readDocument();

    std::string filePath_;
    std::mutex mutex_;
};

} // namespace TrapWatch
