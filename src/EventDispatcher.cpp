#include "EventDispatcher.hpp"
#include "DeviceInfo.hpp"
#include "HTTPClient.hpp"
#include "Logger.hpp"

namespace TrapWatch {

EventDispatcher::EventDispatcher(const NotifierConfig& config)
    : config_(config) {}

void EventDispatcher::registerListener(EventListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
    LOG_DEBUG("Event listener registered, total listeners: " + std::to_string(listeners_.size()));
}

size_t EventDispatcher::listenerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

void EventDispatcher::notify(const std::string& eventType, const nlohmann::json& data) {
    LOG_DEBUG("Event " + eventType + ": " + data.dump());

    // Listeners run outside the lock so they may register further listeners
    std::vector<EventListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners = listeners_;
    }

    for (const auto& listener : listeners) {
        try {
            listener(eventType, data);
        } catch (const std::exception& e) {
            LOG_ERROR("Event listener exception for " + eventType + ": " + std::string(e.what()));
        }
    }

    if (config_.enabled) {
        forward(eventType, data);
    }
}

EventListener EventDispatcher::asCallback() {
    return [this](const std::string& eventType, const nlohmann::json& data) {
        notify(eventType, data);
    };
}

void EventDispatcher::forward(const std::string& eventType, const nlohmann::json& data) {
    nlohmann::json payload;
    payload["event"] = eventType;
    payload["data"] = data;
    payload["timestamp"] = currentUtcTimestamp();

    HttpResponse response = HTTPClient::postJson(config_.endpoint, payload, config_.timeoutMs);
    if (!response.ok) {
        LOG_ERROR("Failed to forward event " + eventType + ": " + response.error);
    } else if (response.statusCode < 200 || response.statusCode >= 300) {
        LOG_ERROR("Event endpoint rejected " + eventType + " with HTTP " + std::to_string(response.statusCode));
    }
}

} // namespace TrapWatch
