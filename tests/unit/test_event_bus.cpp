#include <gtest/gtest.h>

#include <clawsuite/gateway/event_bus.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace clawsuite;

TEST(EventBus, DeliversOnlyMatchingTopic) {
    EventBus bus;
    std::vector<std::string> got;
    bus.subscribe("exec:a", [&got](const std::string& topic, const Json& p) {
        got.push_back(topic + "=" + p.dump());
    });

    EXPECT_EQ(1u, bus.publish("exec:a", Json(1)));
    EXPECT_EQ(0u, bus.publish("exec:b", Json(2)));
    ASSERT_EQ(1u, got.size());
    EXPECT_EQ("exec:a=1", got[0]);
}

TEST(EventBus, EachSubscriberReceivesEachMessageOnce) {
    EventBus bus;
    int counts[3] = {0, 0, 0};
    for (int i = 0; i < 3; ++i) {
        int* slot = &counts[i];
        bus.subscribe("exec:s", [slot](const std::string&, const Json&) { ++*slot; });
    }

    EXPECT_EQ(3u, bus.publish("exec:s", Json::object()));
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(1, counts[i]);
    }
}

TEST(EventBus, WildcardSeesEverything) {
    EventBus bus;
    std::vector<std::string> topics;
    bus.subscribe(EventBus::WILDCARD, [&topics](const std::string& t, const Json&) {
        topics.push_back(t);
    });
    bus.publish("agent", Json());
    bus.publish("gateway.status", Json());
    ASSERT_EQ(2u, topics.size());
    EXPECT_EQ("agent", topics[0]);
    EXPECT_EQ("gateway.status", topics[1]);
}

TEST(EventBus, UnsubscribeStopsDelivery) {
    EventBus bus;
    int n = 0;
    EventBus::SubscriptionId id = bus.subscribe("t", [&n](const std::string&, const Json&) { ++n; });
    EXPECT_EQ(1u, bus.subscriber_count("t"));

    EXPECT_TRUE(bus.unsubscribe(id));
    EXPECT_FALSE(bus.unsubscribe(id));
    bus.publish("t", Json());
    EXPECT_EQ(0, n);
    EXPECT_EQ(0u, bus.total_subscriptions());
}

TEST(EventBus, SubscriberMayUnsubscribeItselfDuringDelivery) {
    EventBus bus;
    int n = 0;
    EventBus::SubscriptionId id = 0;
    id = bus.subscribe("t", [&bus, &id, &n](const std::string&, const Json&) {
        ++n;
        bus.unsubscribe(id);
    });
    bus.publish("t", Json());
    bus.publish("t", Json());
    EXPECT_EQ(1, n);
}

TEST(EventBus, ThrowingSubscriberDoesNotStopOthers) {
    EventBus bus;
    int n = 0;
    bus.subscribe("t", [](const std::string&, const Json&) {
        throw std::runtime_error("boom");
    });
    bus.subscribe("t", [&n](const std::string&, const Json&) { ++n; });

    EXPECT_EQ(1u, bus.publish("t", Json()));
    EXPECT_EQ(1, n);
}
