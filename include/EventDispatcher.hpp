#pragma once
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace TrapWatch {

using EventListener = std::function<void(const std::string& eventType, const nlohmann::json& data)>;

struct NotifierConfig {
    bool enabled{false};
    std::string endpoint{"http://127.0.0.1:5000/api/events"};
    int timeoutMs{2000};
};

// Event sink for device and image events. Safe to call from any thread.
class EventDispatcher {
public:
    explicit EventDispatcher(const NotifierConfig& config = NotifierConfig());

    void registerListener(EventListener listener);
    void notify(const std::string& eventType, const nlohmann::json& data);

    // Callback bound to this dispatcher, for monitors and the pipeline
    EventListener asCallback();

    size_t listenerCount() const;

private:
    void forward(const std::string& eventType, const nlohmann::json& data);

    NotifierConfig config_;
    mutable std::mutex mutex_;
    std::vector<EventListener> listeners_;
};

} // namespace TrapWatch
