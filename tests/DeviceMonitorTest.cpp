#include <gtest/gtest.h>
#include "DeviceMonitor.hpp"
#include "TestDoubles.hpp"
#include <chrono>
#include <future>
#include <memory>
#include <thread>
#include <vector>

using namespace TrapWatch;
using namespace TrapWatch::test;

class DeviceMonitorTest : public ::testing::Test {
protected:
    DeviceRegistry registry;
    std::shared_ptr<MemoryDeviceStore> store = std::make_shared<MemoryDeviceStore>();
    RecordingSink sink;
    ScriptedProber* prober = nullptr;

    std::unique_ptr<DeviceMonitor> makeMonitor(const std::string& kind, MonitorConfig config = MonitorConfig()) {
        auto scripted = std::make_unique<ScriptedProber>();
        prober = scripted.get();
        return std::make_unique<DeviceMonitor>(kind, registry, store, std::move(scripted), config, sink.callback());
    }
};

TEST_F(DeviceMonitorTest, FailedProbeKeepsLastSeen) {
    const std::string seen = "2024-05-01T10:00:00Z";
    registry.addDevice(makeDevice("aa:bb:cc:dd:ee:01", "192.168.1.10", DeviceStatus::CONNECTED, seen));
    auto monitor = makeMonitor(CAMERA_KIND);

    monitor->updateDeviceStatus("aa:bb:cc:dd:ee:01", false);

    auto device = registry.getDevice("aa:bb:cc:dd:ee:01");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->status, DeviceStatus::DISCONNECTED);
    EXPECT_EQ(device->lastSeen, seen);
    EXPECT_EQ(sink.count("camera_status_changed_offline"), 1);
}

TEST_F(DeviceMonitorTest, RepeatedFailureFiresNoEvent) {
    registry.addDevice(makeDevice("aa:bb:cc:dd:ee:01", "192.168.1.10", DeviceStatus::DISCONNECTED, hoursAgo(1)));
    auto monitor = makeMonitor(CAMERA_KIND);

    monitor->updateDeviceStatus("aa:bb:cc:dd:ee:01", false);

    EXPECT_TRUE(sink.events().empty());
    // Every update persists, transition or not
    EXPECT_EQ(store->saveCount(), 1);
}

TEST_F(DeviceMonitorTest, OnlineEventFiresOnce) {
    registry.addDevice(makeDevice("aa:bb:cc:dd:ee:01", "192.168.1.10", DeviceStatus::DISCONNECTED, ""));
    auto monitor = makeMonitor(CAMERA_KIND);
    prober->setReachable("192.168.1.10", true);

    monitor->runCycle();
    monitor->runCycle();
    monitor->runCycle();

    EXPECT_EQ(sink.count("camera_status_changed_online"), 1);
    auto device = registry.getDevice("aa:bb:cc:dd:ee:01");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->status, DeviceStatus::CONNECTED);
    auto lastSeen = parseUtcTimestamp(device->lastSeen);
    ASSERT_TRUE(lastSeen.has_value());
    EXPECT_LT(std::chrono::system_clock::now() - *lastSeen, std::chrono::minutes(1));

    auto events = sink.events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].second["mac_address"], "aa:bb:cc:dd:ee:01");
    EXPECT_EQ(events[0].second["status"], "connected");
}

TEST_F(DeviceMonitorTest, ReachableRefreshesLastSeenWithoutEvent) {
    const std::string seen = "2024-05-01T10:00:00Z";
    registry.addDevice(makeDevice("aa:bb:cc:dd:ee:01", "192.168.1.10", DeviceStatus::CONNECTED, seen));
    auto monitor = makeMonitor(CAMERA_KIND);

    monitor->updateDeviceStatus("aa:bb:cc:dd:ee:01", true);

    EXPECT_NE(registry.getDevice("aa:bb:cc:dd:ee:01")->lastSeen, seen);
    EXPECT_TRUE(sink.events().empty());
}

TEST_F(DeviceMonitorTest, UnknownDeviceUpdateIsIgnored) {
    auto monitor = makeMonitor(CAMERA_KIND);

    monitor->updateDeviceStatus("00:00:00:00:00:00", true);

    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(store->saveCount(), 0);
    EXPECT_TRUE(sink.events().empty());
}

TEST_F(DeviceMonitorTest, EmptyIpIsNeverProbed) {
    registry.addDevice(makeDevice("aa:bb:cc:dd:ee:01", "", DeviceStatus::DISCONNECTED, ""));
    registry.addDevice(makeDevice("aa:bb:cc:dd:ee:02", "192.168.1.11", DeviceStatus::DISCONNECTED, ""));
    auto monitor = makeMonitor(CAMERA_KIND);
    prober->setReachable("192.168.1.11", true);

    monitor->runCycle();
    auto results = monitor->checkNow();

    EXPECT_EQ(prober->calls(""), 0);
    EXPECT_EQ(prober->calls("192.168.1.11"), 2);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_FALSE(results["aa:bb:cc:dd:ee:01"]);
    EXPECT_TRUE(results["aa:bb:cc:dd:ee:02"]);
    EXPECT_EQ(registry.getDevice("aa:bb:cc:dd:ee:01")->status, DeviceStatus::DISCONNECTED);
}

TEST_F(DeviceMonitorTest, StaleCameraIsRemovedWhenEnabled) {
    registry.addDevice(makeDevice("aa:bb:cc:dd:ee:01", "192.168.1.10", DeviceStatus::DISCONNECTED, hoursAgo(25)));
    MonitorConfig config;
    config.autoRemoveEnabled = true;
    config.autoRemoveHours = 24;
    auto monitor = makeMonitor(CAMERA_KIND, config);

    monitor->runCycle();

    EXPECT_FALSE(registry.contains("aa:bb:cc:dd:ee:01"));
    EXPECT_EQ(sink.count("camera_removed"), 1);
    EXPECT_TRUE(store->saved(CAMERA_KIND).empty());
}

TEST_F(DeviceMonitorTest, StaleDeviceStaysWhenRemovalDisabled) {
    registry.addDevice(makeDevice("aa:bb:cc:dd:ee:01", "192.168.1.10", DeviceStatus::DISCONNECTED, hoursAgo(48)));
    auto monitor = makeMonitor(PLUG_KIND);

    for (int i = 0; i < 5; ++i) {
        monitor->runCycle();
    }

    EXPECT_TRUE(registry.contains("aa:bb:cc:dd:ee:01"));
    EXPECT_EQ(sink.count("plug_removed"), 0);
}

TEST_F(DeviceMonitorTest, ConnectedDeviceWithStaleLastSeenIsCandidate) {
    registry.addDevice(makeDevice("aa:bb:cc:dd:ee:01", "", DeviceStatus::CONNECTED, hoursAgo(30)));
    MonitorConfig config;
    config.autoRemoveEnabled = true;
    auto monitor = makeMonitor(CAMERA_KIND, config);

    monitor->removeStaleDevices();

    EXPECT_FALSE(registry.contains("aa:bb:cc:dd:ee:01"));
    EXPECT_EQ(sink.count("camera_removed"), 1);
}

TEST_F(DeviceMonitorTest, UnparseableLastSeenIsNeverRemoved) {
    registry.addDevice(makeDevice("aa:bb:cc:dd:ee:01", "", DeviceStatus::DISCONNECTED, "yesterday"));
    registry.addDevice(makeDevice("aa:bb:cc:dd:ee:02", "", DeviceStatus::DISCONNECTED, ""));
    MonitorConfig config;
    config.autoRemoveEnabled = true;
    auto monitor = makeMonitor(CAMERA_KIND, config);

    monitor->removeStaleDevices();

    EXPECT_EQ(registry.size(), 2u);
    EXPECT_TRUE(sink.events().empty());
}

TEST_F(DeviceMonitorTest, SaveFailureDoesNotStopUpdates) {
    registry.addDevice(makeDevice("aa:bb:cc:dd:ee:01", "192.168.1.10", DeviceStatus::DISCONNECTED, ""));
    store->setFailSaves(true);
    auto monitor = makeMonitor(CAMERA_KIND);
    prober->setReachable("192.168.1.10", true);

    EXPECT_NO_THROW(monitor->runCycle());

    EXPECT_EQ(registry.getDevice("aa:bb:cc:dd:ee:01")->status, DeviceStatus::CONNECTED);
    EXPECT_EQ(sink.count("camera_status_changed_online"), 1);
}

TEST_F(DeviceMonitorTest, ThrowingCallbackIsContained) {
    registry.addDevice(makeDevice("aa:bb:cc:dd:ee:01", "192.168.1.10", DeviceStatus::CONNECTED, hoursAgo(1)));
    auto scripted = std::make_unique<ScriptedProber>();
    DeviceMonitor monitor(CAMERA_KIND, registry, store, std::move(scripted), MonitorConfig(),
                          [](const std::string&, const json&) { throw std::runtime_error("sink down"); });

    EXPECT_NO_THROW(monitor.updateDeviceStatus("aa:bb:cc:dd:ee:01", false));
    EXPECT_EQ(registry.getDevice("aa:bb:cc:dd:ee:01")->status, DeviceStatus::DISCONNECTED);
}

TEST_F(DeviceMonitorTest, DisabledMonitorNeverStarts) {
    MonitorConfig config;
    config.enabled = false;
    auto monitor = makeMonitor(CAMERA_KIND, config);

    monitor->start();

    EXPECT_FALSE(monitor->isRunning());
}

TEST_F(DeviceMonitorTest, StartIsIdempotent) {
    registry.addDevice(makeDevice("aa:bb:cc:dd:ee:01", "192.168.1.10", DeviceStatus::DISCONNECTED, ""));
    MonitorConfig config;
    config.intervalSeconds = 60;
    auto monitor = makeMonitor(CAMERA_KIND, config);
    prober->setReachable("192.168.1.10", true);

    monitor->start();
    EXPECT_NO_THROW(monitor->start());
    EXPECT_TRUE(monitor->isRunning());

    ASSERT_TRUE(sink.waitForCount(1, std::chrono::seconds(2)));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    // A second loop thread would have probed again
    EXPECT_EQ(prober->calls("192.168.1.10"), 1);

    monitor->stop();
    EXPECT_FALSE(monitor->isRunning());
    EXPECT_NO_THROW(monitor->stop());
}

TEST_F(DeviceMonitorTest, StopInterruptsIntervalSleep) {
    MonitorConfig config;
    config.intervalSeconds = 3600;
    auto monitor = makeMonitor(CAMERA_KIND, config);

    monitor->start();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto begin = std::chrono::steady_clock::now();
    monitor->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(1));
}

TEST_F(DeviceMonitorTest, StopReturnsWithinBoundWhenProbeHangs) {
    registry.addDevice(makeDevice("aa:bb:cc:dd:ee:01", "192.168.1.10", DeviceStatus::DISCONNECTED, ""));
    MonitorConfig config;
    config.stopTimeoutMs = 200;
    auto monitor = makeMonitor(CAMERA_KIND, config);
    prober->setDelay(std::chrono::milliseconds(1000));

    monitor->start();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto begin = std::chrono::steady_clock::now();
    monitor->stop();
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_LT(elapsed, std::chrono::milliseconds(700));
    EXPECT_FALSE(monitor->isRunning());
    // Destructor joins the late thread
}

TEST_F(DeviceMonitorTest, CheckNowDoesNotNeedRunningLoop) {
    registry.addDevice(makeDevice("aa:bb:cc:dd:ee:01", "192.168.1.10", DeviceStatus::CONNECTED, hoursAgo(2)));
    auto monitor = makeMonitor(PLUG_KIND);
    prober->script("192.168.1.10", {false});

    auto results = monitor->checkNow();

    EXPECT_FALSE(results["aa:bb:cc:dd:ee:01"]);
    EXPECT_EQ(sink.count("plug_status_changed_offline"), 1);
    EXPECT_FALSE(monitor->isRunning());
}

TEST_F(DeviceMonitorTest, ListenerMayCallBackIntoMonitor) {
    registry.addDevice(makeDevice("aa:bb:cc:dd:ee:01", "192.168.1.10", DeviceStatus::DISCONNECTED, ""));
    auto scripted = std::make_unique<ScriptedProber>();
    scripted->setReachable("192.168.1.10", true);

    DeviceMonitor* self = nullptr;
    int reentrantChecks = 0;
    auto callback = [&](const std::string& eventType, const json& data) {
        sink.record(eventType, data);
        if (eventType == "camera_status_changed_online" && self) {
            ++reentrantChecks;
            self->checkNow();
        }
    };
    DeviceMonitor monitor(CAMERA_KIND, registry, store, std::move(scripted), MonitorConfig(), callback);
    self = &monitor;

    auto pending = std::async(std::launch::async, [&] { monitor.updateDeviceStatus("aa:bb:cc:dd:ee:01", true); });

    ASSERT_EQ(pending.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    pending.get();
    EXPECT_EQ(reentrantChecks, 1);
    // The nested check sees the device already connected
    EXPECT_EQ(sink.count("camera_status_changed_online"), 1);
    EXPECT_EQ(registry.getDevice("aa:bb:cc:dd:ee:01")->status, DeviceStatus::CONNECTED);
}

TEST_F(DeviceMonitorTest, ListenerMayCallBackIntoMonitorOnRemoval) {
    registry.addDevice(makeDevice("aa:bb:cc:dd:ee:01", "192.168.1.10", DeviceStatus::DISCONNECTED, hoursAgo(30)));
    registry.addDevice(makeDevice("aa:bb:cc:dd:ee:02", "192.168.1.11", DeviceStatus::CONNECTED, hoursAgo(1)));
    MonitorConfig config;
    config.autoRemoveEnabled = true;
    config.autoRemoveHours = 24;

    DeviceMonitor* self = nullptr;
    auto callback = [&](const std::string& eventType, const json& data) {
        sink.record(eventType, data);
        if (eventType == "camera_removed" && self) {
            self->updateDeviceStatus("aa:bb:cc:dd:ee:02", false);
        }
    };
    DeviceMonitor monitor(CAMERA_KIND, registry, store, std::make_unique<ScriptedProber>(), config, callback);
    self = &monitor;

    auto pending = std::async(std::launch::async, [&] { monitor.removeStaleDevices(); });

    ASSERT_EQ(pending.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    pending.get();
    EXPECT_EQ(sink.count("camera_removed"), 1);
    EXPECT_EQ(sink.count("camera_status_changed_offline"), 1);
    EXPECT_FALSE(registry.contains("aa:bb:cc:dd:ee:01"));
}

TEST_F(DeviceMonitorTest, ConcurrentChecksFireOneEventPerTransition) {
    const std::string mac = "aa:bb:cc:dd:ee:01";
    registry.addDevice(makeDevice(mac, "192.168.1.10", DeviceStatus::DISCONNECTED, ""));
    MonitorConfig config;
    config.intervalSeconds = 1;
    auto monitor = makeMonitor(CAMERA_KIND, config);

    monitor->start();

    const bool phases[] = {true, false, true, false, true};
    for (bool reachable : phases) {
        prober->setReachable("192.168.1.10", reachable);
        std::vector<std::thread> checkers;
        for (int i = 0; i < 4; ++i) {
            checkers.emplace_back([&] {
                for (int round = 0; round < 5; ++round) {
                    monitor->checkNow();
                }
            });
        }
        for (auto& checker : checkers) {
            checker.join();
        }
    }

    monitor->stop();
    // Settle on a known state without the loop running
    monitor->checkNow();

    for (const auto& event : sink.events()) {
        EXPECT_EQ(event.second["status"],
                  event.first == "camera_status_changed_online" ? "connected" : "disconnected");
    }
    // Starting disconnected and ending connected, every offline transition is
    // followed by exactly one online transition; a duplicate report breaks the balance
    const int online = sink.count("camera_status_changed_online");
    const int offline = sink.count("camera_status_changed_offline");
    EXPECT_GE(online, 3);
    EXPECT_EQ(online, offline + 1);

    auto device = registry.getDevice(mac);
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->status, DeviceStatus::CONNECTED);
    EXPECT_EQ(registry.size(), 1u);

    auto saved = store->saved(CAMERA_KIND);
    ASSERT_EQ(saved.size(), 1u);
    EXPECT_EQ(saved[0]["mac_address"], mac);
    EXPECT_EQ(saved[0]["status"], "connected");
    EXPECT_EQ(saved[0]["last_seen"], device->lastSeen);
}
