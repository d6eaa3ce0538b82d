#include <gtest/gtest.h>
#include "EventDispatcher.hpp"
#include "TestDoubles.hpp"

using namespace TrapWatch;
using namespace TrapWatch::test;

TEST(EventDispatcherTest, FansOutToEveryListener) {
    EventDispatcher dispatcher;
    RecordingSink first;
    RecordingSink second;
    dispatcher.registerListener(first.callback());
    dispatcher.registerListener(second.callback());

    dispatcher.notify("camera_removed", {{"mac_address", "aa:bb:cc:dd:ee:01"}});

    EXPECT_EQ(dispatcher.listenerCount(), 2u);
    EXPECT_EQ(first.count("camera_removed"), 1);
    EXPECT_EQ(second.count("camera_removed"), 1);
}

TEST(EventDispatcherTest, ThrowingListenerDoesNotBlockOthers) {
    EventDispatcher dispatcher;
    RecordingSink sink;
    dispatcher.registerListener([](const std::string&, const nlohmann::json&) {
        throw std::runtime_error("client went away");
    });
    dispatcher.registerListener(sink.callback());

    auto callback = dispatcher.asCallback();
    EXPECT_NO_THROW(callback("plug_status_changed_online", {{"mode", "automatic"}}));
    auto events = sink.events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].second["mode"], "automatic");
}

TEST(EventDispatcherTest, UnreachableEndpointIsTolerated) {
    NotifierConfig config;
    config.enabled = true;
    // Port 9 on loopback refuses connections
    config.endpoint = "http://127.0.0.1:9/api/events";
    config.timeoutMs = 500;
    EventDispatcher dispatcher(config);
    RecordingSink sink;
    dispatcher.registerListener(sink.callback());

    EXPECT_NO_THROW(dispatcher.notify("image_added", {{"path", "/a.jpg"}, {"folder", "/"}}));
    EXPECT_EQ(sink.count("image_added"), 1);
}
