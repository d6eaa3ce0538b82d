#include <gtest/gtest.h>
#include "TrapWatchService.hpp"
#include "TestDoubles.hpp"
#include <filesystem>
#include <chrono>
#include <fstream>
#include <thread>

namespace fs = std::filesystem;
using namespace TrapWatch;
using namespace TrapWatch::test;

class TrapWatchServiceTest : public ::testing::Test {
protected:
    fs::path testDir = fs::temp_directory_path() / "trapwatch_service_test";
    fs::path configFile = testDir / "trapwatch.json";
    fs::path settingsFile = testDir / "devices.json";

    void SetUp() override {
        fs::remove_all(testDir);
        fs::create_directories(testDir);
        std::ofstream(settingsFile) << R"({
            "cameras": [{"mac_address": "aa:bb:cc:dd:ee:01", "hostname": "gate", "ip_address": "", "status": "connected"}],
            "plugs": [{"mac_address": "aa:bb:cc:dd:ee:30", "ip_address": "", "mode": "automatic"}]
        })";
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    void writeConfig(const json& extra) {
        json j = {
            {"settingsFile", settingsFile.string()},
            {"logLevel", "ERROR"},
            {"watchFolders", {(testDir / "cam1").string()}},
            {"cameraHeartbeat", {{"enabled", false}}},
            {"plugHeartbeat", {{"enabled", false}}}
        };
        j.update(extra);
        std::ofstream(configFile) << j.dump(2);
    }
};

TEST_F(TrapWatchServiceTest, InitializeLoadsDevicesAndWatchesFolders) {
    writeConfig(json::object());
    TrapWatchService service;

    ASSERT_TRUE(service.initialize(configFile.string()));

    EXPECT_EQ(service.cameras().size(), 1u);
    EXPECT_EQ(service.plugs().getDevice("aa:bb:cc:dd:ee:30")->mode, "automatic");
    EXPECT_TRUE(fs::is_directory(testDir / "cam1"));
    ASSERT_EQ(service.folders().observerCount(), 1u);
    EXPECT_TRUE(service.folders().observers()[0]->isRunning());
    EXPECT_EQ(service.folders().observers()[0]->method(), WatchMethod::POLLING);

    service.shutdown();
    EXPECT_FALSE(service.folders().observers()[0]->isRunning());
}

TEST_F(TrapWatchServiceTest, CommandLineOverridesConfigFile) {
    writeConfig({{"watchMethod", "polling"}});
    CommandLineOverrides overrides;
    overrides.watchMethod = "inotify";
    overrides.watchFolders = {(testDir / "a").string(), (testDir / "b").string()};

    TrapWatchService service;
    ASSERT_TRUE(service.initialize(configFile.string(), overrides));

    ASSERT_EQ(service.folders().observerCount(), 2u);
    EXPECT_EQ(service.folders().observers()[1]->method(), WatchMethod::INOTIFY);
    EXPECT_TRUE(fs::is_directory(testDir / "b"));
    service.shutdown();
}

TEST_F(TrapWatchServiceTest, UnknownWatchMethodFallsBackToPolling) {
    writeConfig({{"watchMethod", "fanotify"}});
    TrapWatchService service;
    ASSERT_TRUE(service.initialize(configFile.string()));
    EXPECT_EQ(service.folders().observers()[0]->method(), WatchMethod::POLLING);
    service.shutdown();
}

TEST_F(TrapWatchServiceTest, InvalidConfigFailsInitialization) {
    TrapWatchService missing;
    EXPECT_FALSE(missing.initialize((testDir / "absent.json").string()));

    writeConfig({{"fileStability", {{"timeoutSeconds", 0}}}});
    TrapWatchService zeroTimeout;
    EXPECT_FALSE(zeroTimeout.initialize(configFile.string()));
}

TEST_F(TrapWatchServiceTest, NonPositiveIntervalsFailInitialization) {
    const json invalid[] = {
        {{"cameraHeartbeat", {{"enabled", false}, {"intervalSeconds", 0}}}},
        {{"plugHeartbeat", {{"enabled", false}, {"intervalSeconds", -5}}}},
        {{"cameraHeartbeat", {{"enabled", false}, {"autoRemoveHours", 0}}}},
        {{"plugHeartbeat", {{"enabled", false}, {"autoRemoveHours", -1}}}},
        {{"fileStability", {{"pollIntervalMs", 0}}}},
        {{"fileStability", {{"intervalMs", 0}}}},
        {{"shutdownTimeoutSeconds", -1}}
    };

    for (const auto& extra : invalid) {
        writeConfig(extra);
        TrapWatchService service;
        EXPECT_FALSE(service.initialize(configFile.string())) << extra.dump();
    }
}

TEST(TrapWatchConfigValidationTest, DefaultsAreValid) {
    ConfigLoader loader;
    TrapWatchConfig config = loader.getConfig();
    EXPECT_TRUE(TrapWatchService::validateConfig(config));

    config.fileStability.settleDelayMs = 0;
    config.shutdownTimeoutSeconds = 0;
    EXPECT_TRUE(TrapWatchService::validateConfig(config));

    config.cameraHeartbeat.tcpTimeoutSeconds = 0;
    EXPECT_FALSE(TrapWatchService::validateConfig(config));
}

TEST_F(TrapWatchServiceTest, ShutdownWithoutPendingImagesReturnsPromptly) {
    writeConfig({{"shutdownTimeoutSeconds", 30}});
    TrapWatchService service;
    ASSERT_TRUE(service.initialize(configFile.string()));
    EXPECT_EQ(service.folders().pendingDispatches(), 0u);

    auto begin = std::chrono::steady_clock::now();
    service.shutdown();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(5));
}

TEST_F(TrapWatchServiceTest, RunReturnsAfterRequestStop) {
    writeConfig(json::object());
    TrapWatchService service;
    ASSERT_TRUE(service.initialize(configFile.string()));

    std::thread stopper([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        service.requestStop();
    });
    service.run();
    stopper.join();
    service.shutdown();
}
