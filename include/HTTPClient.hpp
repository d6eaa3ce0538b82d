#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace TrapWatch {

struct HttpResponse {
    // Transfer completed; says nothing about the status code
    bool ok{false};
    long statusCode{0};
    std::string body;
    std::string error;
};

class HTTPClient {
public:
    static HttpResponse get(const std::string& url, int timeoutMs);
    static HttpResponse postJson(const std::string& url, const nlohmann::json& payload, int timeoutMs);
};

} // namespace TrapWatch
