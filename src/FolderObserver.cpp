#include "FolderObserver.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <sys/inotify.h>
#include <sys/select.h>
#include <system_error>
#include <unistd.h>
#include <iterator>
#include <vector>

namespace fs = std::filesystem;

namespace TrapWatch {

namespace {

class InotifyHandle {
public:
    InotifyHandle() : fd_(inotify_init1(IN_CLOEXEC)) {}
    ~InotifyHandle() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }
    InotifyHandle(const InotifyHandle&) = delete;
    InotifyHandle& operator=(const InotifyHandle&) = delete;

    int fd() const { return fd_; }

private:
    int fd_;
};

// Marks one dispatch finished however the handler exits
class DispatchScope {
public:
    explicit DispatchScope(std::shared_ptr<DispatchTracker> tracker) : tracker_(std::move(tracker)) {}
    ~DispatchScope() { tracker_->end(); }

    DispatchScope(const DispatchScope&) = delete;
    DispatchScope& operator=(const DispatchScope&) = delete;

private:
    std::shared_ptr<DispatchTracker> tracker_;
};

} // namespace

void DispatchTracker::begin() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++inFlight_;
}

void DispatchTracker::end() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inFlight_ > 0) {
            --inFlight_;
        }
    }
    idleCv_.notify_all();
}

size_t DispatchTracker::inFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inFlight_;
}

bool DispatchTracker::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idleCv_.wait_for(lock, timeout, [this] { return inFlight_ == 0; });
}

bool parseWatchMethod(const std::string& name, WatchMethod& method) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "inotify") {
        method = WatchMethod::INOTIFY;
    } else if (lower == "polling" || lower == "os") {
        method = WatchMethod::POLLING;
    } else {
        return false;
    }
    return true;
}

std::string watchMethodToString(WatchMethod method) {
    return method == WatchMethod::INOTIFY ? "inotify" : "polling";
}

FolderObserver::FolderObserver(const std::string& folder,
                               WatchMethod method,
                               const ObserverConfig& config,
                               FileHandler handler,
                               OpenHandleQuery query,
                               std::shared_ptr<DispatchTracker> tracker)
    : folder_(folder), method_(method), config_(config),
      handler_(std::move(handler)), query_(std::move(query)),
      tracker_(tracker ? std::move(tracker) : std::make_shared<DispatchTracker>()), running_(false) {}

FolderObserver::~FolderObserver() {
    stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void FolderObserver::start() {
    if (running_.load()) {
        LOG_WARNING("Observer for " + folder_ + " is already running");
        return;
    }

    // Reap a watcher left over from an earlier stop()
    if (thread_.joinable()) {
        thread_.join();
    }

    running_.store(true);
    try {
        thread_ = std::thread(&FolderObserver::superviseLoop, this);
    } catch (const std::system_error&) {
        running_.store(false);
        throw;
    }

    LOG_INFO("Started watching " + folder_ + " (" + watchMethodToString(method_) + ")");
}

void FolderObserver::stop() {
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        if (!running_.load()) {
            return;
        }
        running_.store(false);
    }
    waitCv_.notify_all();
    LOG_INFO("Stopping observer for " + folder_);
}

bool FolderObserver::waitFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(waitMutex_);
    waitCv_.wait_for(lock, duration, [this] { return !running_.load(); });
    return running_.load();
}

void FolderObserver::superviseLoop() {
    Logger::setThreadName("watch:" + folder_);

    while (running_.load()) {
        try {
            if (method_ == WatchMethod::INOTIFY) {
                watchInotify();
            } else {
                watchPolling();
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Watcher for " + folder_ + " failed: " + std::string(e.what()));
        }

        if (!running_.load()) {
            break;
        }

        LOG_WARNING("Watcher for " + folder_ + " exited unexpectedly, restarting");
        if (!waitFor(std::chrono::milliseconds(config_.restartDelayMs))) {
            break;
        }
    }

    LOG_INFO("Stopped watching " + folder_);
}

void FolderObserver::watchInotify() {
    InotifyHandle inotify;
    if (inotify.fd() < 0) {
        throw std::runtime_error("Failed to initialize inotify: " + std::string(strerror(errno)));
    }

    int wd = inotify_add_watch(inotify.fd(), folder_.c_str(), IN_CREATE | IN_MOVED_TO);
    if (wd < 0) {
        throw std::runtime_error("Failed to watch " + folder_ + ": " + std::string(strerror(errno)));
    }

    alignas(struct inotify_event) char buffer[4096];

    while (running_.load()) {
        // select() with a timeout so the stop flag is seen within a second
        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(inotify.fd(), &readfds);

        struct timeval timeout;
        timeout.tv_sec = 1;
        timeout.tv_usec = 0;

        int ret = select(inotify.fd() + 1, &readfds, nullptr, nullptr, &timeout);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::runtime_error("Error in select: " + std::string(strerror(errno)));
        }
        if (ret == 0 || !FD_ISSET(inotify.fd(), &readfds)) {
            continue;
        }

        ssize_t length = read(inotify.fd(), buffer, sizeof(buffer));
        if (length < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            throw std::runtime_error("Error reading inotify events: " + std::string(strerror(errno)));
        }

        std::vector<std::string> created;
        bool watchGone = false;
        for (ssize_t i = 0; i < length;) {
            auto* event = reinterpret_cast<struct inotify_event*>(&buffer[i]);

            if (event->mask & IN_Q_OVERFLOW) {
                LOG_WARNING("inotify queue overflow on " + folder_ + ", events were lost");
            }
            if (event->mask & IN_IGNORED) {
                watchGone = true;
            }
            if (event->len > 0 && !(event->mask & IN_ISDIR) &&
                (event->mask & (IN_CREATE | IN_MOVED_TO))) {
                created.push_back((fs::path(folder_) / event->name).string());
            }

            i += sizeof(struct inotify_event) + event->len;
        }

        for (const auto& path : created) {
            if (!running_.load()) {
                return;
            }
            try {
                handleNewFile(path);
            } catch (const std::exception& e) {
                LOG_ERROR("Error handling new file " + path + ": " + std::string(e.what()));
            }
        }

        if (watchGone) {
            throw std::runtime_error("Watch on " + folder_ + " was removed");
        }
    }
}

std::set<std::string> FolderObserver::listFiles() const {
    std::set<std::string> files;
    for (const auto& entry : fs::directory_iterator(folder_)) {
        if (!entry.is_directory()) {
            files.insert(entry.path().string());
        }
    }
    return files;
}

void FolderObserver::watchPolling() {
    std::set<std::string> known = listFiles();
    LOG_DEBUG("Polling " + folder_ + " every " + std::to_string(config_.pollIntervalMs) +
              "ms, " + std::to_string(known.size()) + " existing file(s)");

    while (waitFor(std::chrono::milliseconds(config_.pollIntervalMs))) {
        std::set<std::string> current;
        try {
            current = listFiles();
        } catch (const std::exception& e) {
            LOG_ERROR("Error listing " + folder_ + ": " + std::string(e.what()));
            continue;
        }

        std::vector<std::string> added;
        std::set_difference(current.begin(), current.end(), known.begin(), known.end(),
                            std::back_inserter(added));
        known = std::move(current);

        for (const auto& path : added) {
            if (!running_.load()) {
                return;
            }
            try {
                handleNewFile(path);
            } catch (const std::exception& e) {
                LOG_ERROR("Error handling new file " + path + ": " + std::string(e.what()));
            }
        }
    }
}

void FolderObserver::handleNewFile(const std::string& path) {
    LOG_INFO("New file detected: " + path);

    // Give fast writers a head start before asking who has the file open
    if (!waitFor(std::chrono::milliseconds(config_.settleDelayMs))) {
        return;
    }

    if (!fs::exists(path)) {
        LOG_WARNING("File " + path + " disappeared before it could be checked");
        return;
    }

    if (!waitForFileStability(path,
                              std::chrono::milliseconds(config_.stabilityTimeoutMs),
                              std::chrono::milliseconds(config_.stabilityIntervalMs),
                              query_)) {
        LOG_WARNING("Skipping " + path + ", file is still being written");
        return;
    }

    if (config_.extraWaitMs > 0) {
        LOG_DEBUG("Waiting an extra " + std::to_string(config_.extraWaitMs) + "ms for " + path);
        if (!waitFor(std::chrono::milliseconds(config_.extraWaitMs))) {
            return;
        }
    }

    dispatch(path);
}

void FolderObserver::dispatch(const std::string& path) {
    if (!handler_) {
        return;
    }

    FileHandler handler = handler_;
    std::string folder = folder_;
    auto tracker = tracker_;
    tracker->begin();
    try {
        std::thread([handler, path, folder, tracker]() {
            DispatchScope scope(tracker);
            Logger::setThreadName("image:" + fs::path(path).filename().string());
            try {
                handler(path, folder);
            } catch (const std::exception& e) {
                LOG_ERROR("Processing " + path + " failed: " + std::string(e.what()));
            }
        }).detach();
    } catch (const std::system_error& e) {
        tracker->end();
        LOG_ERROR("Failed to start dispatch thread for " + path + ": " + std::string(e.what()));
    }
}

} // namespace TrapWatch
