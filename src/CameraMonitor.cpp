#include "CameraMonitor.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace TrapWatch {

CameraProber::CameraProber(const CameraProbeConfig& config, CommandExecutor executor)
    : config_(config), method_(CameraCheckMethod::TCP), executor_(std::move(executor)) {
    if (!parseCheckMethod(config_.checkMethod, method_)) {
        LOG_WARNING("Invalid camera check method '" + config_.checkMethod + "', defaulting to tcp");
        method_ = CameraCheckMethod::TCP;
    }
}

bool CameraProber::parseCheckMethod(const std::string& name, CameraCheckMethod& method) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "icmp") {
        method = CameraCheckMethod::ICMP;
    } else if (lower == "tcp") {
        method = CameraCheckMethod::TCP;
    } else if (lower == "both") {
        method = CameraCheckMethod::BOTH;
    } else {
        return false;
    }
    return true;
}

std::string CameraProber::checkMethodToString(CameraCheckMethod method) {
    switch (method) {
        case CameraCheckMethod::ICMP: return "icmp";
        case CameraCheckMethod::BOTH: return "both";
        default: return "tcp";
    }
}

bool CameraProber::probe(const std::string& ipAddress) {
    switch (method_) {
        case CameraCheckMethod::ICMP:
            return pingDevice(ipAddress);
        case CameraCheckMethod::BOTH:
            // ICMP is cheaper, TCP catches cameras that drop echo requests
            return pingDevice(ipAddress) || tcpConnect(ipAddress);
        default:
            return tcpConnect(ipAddress);
    }
}

std::string CameraProber::describe() const {
    std::string desc = "method=" + checkMethodToString(method_);
    if (method_ != CameraCheckMethod::ICMP) {
        desc += ", port=" + std::to_string(config_.tcpPort);
    }
    return desc;
}

bool CameraProber::pingDevice(const std::string& ipAddress) {
    // Only literal addresses reach the shell
    unsigned char buf[sizeof(struct in6_addr)];
    if (inet_pton(AF_INET, ipAddress.c_str(), buf) != 1 &&
        inet_pton(AF_INET6, ipAddress.c_str(), buf) != 1) {
        LOG_DEBUG("Ping skipped, not an IP address: " + ipAddress);
        return false;
    }

    std::string timeout = std::to_string(config_.icmpTimeoutSeconds);
    std::string command = "timeout " + std::to_string(config_.icmpTimeoutSeconds + 1) +
                          " ping -c 1 -W " + timeout + " " + ipAddress + " 2>&1";

    CommandResult result;
    try {
        result = executor_(command);
    } catch (const std::exception& e) {
        LOG_DEBUG("Ping to " + ipAddress + " failed: " + std::string(e.what()));
        return false;
    }

    if (result.exitCode != 0) {
        LOG_DEBUG("Ping to " + ipAddress + " failed (exit " + std::to_string(result.exitCode) + ")");
        return false;
    }
    return true;
}

bool CameraProber::tcpConnect(const std::string& ipAddress) {
    struct sockaddr_storage addr;
    std::memset(&addr, 0, sizeof(addr));
    socklen_t addrLen = 0;
    int family = AF_INET;

    auto* addr4 = reinterpret_cast<struct sockaddr_in*>(&addr);
    auto* addr6 = reinterpret_cast<struct sockaddr_in6*>(&addr);
    if (inet_pton(AF_INET, ipAddress.c_str(), &addr4->sin_addr) == 1) {
        addr4->sin_family = AF_INET;
        addr4->sin_port = htons(static_cast<uint16_t>(config_.tcpPort));
        addrLen = sizeof(struct sockaddr_in);
    } else if (inet_pton(AF_INET6, ipAddress.c_str(), &addr6->sin6_addr) == 1) {
        family = AF_INET6;
        addr6->sin6_family = AF_INET6;
        addr6->sin6_port = htons(static_cast<uint16_t>(config_.tcpPort));
        addrLen = sizeof(struct sockaddr_in6);
    } else {
        LOG_DEBUG("TCP check skipped, not an IP address: " + ipAddress);
        return false;
    }

    int fd = socket(family, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        LOG_DEBUG("TCP check socket() failed: " + std::string(strerror(errno)));
        return false;
    }

    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    bool connected = false;
    int rc = connect(fd, reinterpret_cast<struct sockaddr*>(&addr), addrLen);
    if (rc == 0) {
        connected = true;
    } else if (errno == EINPROGRESS) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;

        int ready;
        do {
            ready = poll(&pfd, 1, config_.tcpTimeoutSeconds * 1000);
        } while (ready < 0 && errno == EINTR);

        if (ready > 0) {
            int soError = 0;
            socklen_t len = sizeof(soError);
            if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) == 0 && soError == 0) {
                connected = true;
            } else {
                LOG_DEBUG("TCP connect to " + ipAddress + ":" + std::to_string(config_.tcpPort) +
                          " failed: " + std::string(strerror(soError)));
            }
        } else {
            LOG_DEBUG("TCP connect to " + ipAddress + ":" + std::to_string(config_.tcpPort) + " timed out");
        }
    } else {
        LOG_DEBUG("TCP connect to " + ipAddress + ":" + std::to_string(config_.tcpPort) +
                  " failed: " + std::string(strerror(errno)));
    }

    close(fd);
    return connected;
}

CameraMonitor::CameraMonitor(DeviceRegistry& registry,
                             std::shared_ptr<DeviceStore> store,
                             const MonitorConfig& config,
                             const CameraProbeConfig& probeConfig,
                             StatusChangeCallback callback)
    : DeviceMonitor(CAMERA_KIND, registry, std::move(store),
                    std::make_unique<CameraProber>(probeConfig),
                    config, std::move(callback)) {}

} // namespace TrapWatch
