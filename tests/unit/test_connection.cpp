#include <gtest/gtest.h>

#include <clawsuite/gateway/connection.hpp>

#include "util/fake_gateway.hpp"

#include <future>
#include <mutex>
#include <vector>

using namespace clawsuite;
using clawsuite::testing::FakeGateway;
using clawsuite::testing::test_settings;
using clawsuite::testing::wait_until;

namespace {

// Records every status snapshot published on the bus
struct StatusLog {
    std::mutex mutex;
    std::vector<Json> entries;

    void attach(EventBus& bus) {
        bus.subscribe(GatewayConnection::STATUS_TOPIC, [this](const std::string&, const Json& p) {
            std::lock_guard<std::mutex> lock(mutex);
            entries.push_back(p);
        });
    }

    size_t count_state(const std::string& state) {
        std::lock_guard<std::mutex> lock(mutex);
        size_t n = 0;
        for (size_t i = 0; i < entries.size(); ++i) {
            if (entries[i].value("state", "") == state) ++n;
        }
        return n;
    }

    Json last() {
        std::lock_guard<std::mutex> lock(mutex);
        return entries.empty() ? Json() : entries.back();
    }
};

} // namespace

TEST(GatewayConnection, RefusesToStartWithoutCredentials) {
    FakeGateway gw;
    EventBus bus;
    StatusLog log;
    log.attach(bus);

    GatewaySettings s = test_settings();
    s.token.clear();
    GatewayConnection conn(s, gw.factory(), bus);

    EXPECT_FALSE(conn.start());
    ConnectionStatus st = conn.status();
    EXPECT_EQ(ConnectionState::CLOSED, st.state);
    EXPECT_TRUE(st.fatal);
    EXPECT_EQ("missing_credentials", st.last_error);
    EXPECT_EQ(0, gw.opens());
    EXPECT_TRUE(log.last()["fatal"].get<bool>());

    RpcResult r = conn.call("health");
    EXPECT_EQ(GatewayErrorCode::CONNECTION_LOST, r.code);
    EXPECT_EQ(0u, gw.sent_count());
}

TEST(GatewayConnection, HandshakeCarriesCredentials) {
    FakeGateway gw;
    EventBus bus;
    GatewaySettings s = test_settings();
    s.password = "secret";
    GatewayConnection conn(s, gw.factory(), bus);

    ASSERT_TRUE(conn.start());
    ASSERT_TRUE(conn.wait_for_state(ConnectionState::OPEN, 2000));

    Frame connect;
    ASSERT_TRUE(gw.last("connect", connect));
    EXPECT_EQ("test-token", connect.params["auth"]["token"]);
    EXPECT_EQ("secret", connect.params["auth"]["password"]);
    EXPECT_EQ(3, connect.params["minProtocol"]);
    EXPECT_EQ("hello-ok", conn.hello()["type"]);
    EXPECT_EQ(1u, conn.status().generation);

    // connect is the first frame of the generation
    EXPECT_EQ("connect", gw.sent()[0].method);
}

TEST(GatewayConnection, CallRoundTrip) {
    FakeGateway gw;
    Json result = Json::object();
    result["sessions"] = 2;
    gw.respond_with("status", result);

    EventBus bus;
    GatewayConnection conn(test_settings(), gw.factory(), bus);
    ASSERT_TRUE(conn.start());
    ASSERT_TRUE(conn.wait_for_state(ConnectionState::OPEN, 2000));

    RpcResult r = conn.call("status");
    ASSERT_TRUE(r.ok) << r.error;
    EXPECT_EQ(2, r.result["sessions"]);
    EXPECT_EQ(0u, conn.correlator().pending_count());
}

TEST(GatewayConnection, GatewayErrorKeepsConnectionOpen) {
    FakeGateway gw;
    Json err = Json::object();
    err["message"] = "nope";
    gw.respond_error("exec.write", err);

    EventBus bus;
    GatewayConnection conn(test_settings(), gw.factory(), bus);
    ASSERT_TRUE(conn.start());
    ASSERT_TRUE(conn.wait_for_state(ConnectionState::OPEN, 2000));

    RpcResult r = conn.call("exec.write", Json::object());
    EXPECT_EQ(GatewayErrorCode::GATEWAY_ERROR, r.code);
    EXPECT_EQ("nope", r.error);
    EXPECT_EQ(ConnectionState::OPEN, conn.state());
}

TEST(GatewayConnection, UnansweredCallTimesOut) {
    FakeGateway gw;
    EventBus bus;
    GatewayConnection conn(test_settings(), gw.factory(), bus);
    ASSERT_TRUE(conn.start());
    ASSERT_TRUE(conn.wait_for_state(ConnectionState::OPEN, 2000));

    RpcResult r = conn.call("exec.create", Json::object(), 100);
    EXPECT_EQ(GatewayErrorCode::TIMEOUT, r.code);
    EXPECT_EQ(ConnectionState::OPEN, conn.state());
}

TEST(GatewayConnection, DropRejectsPendingCallsOnceAndReconnects) {
    FakeGateway gw;
    EventBus bus;
    StatusLog log;
    log.attach(bus);
    GatewayConnection conn(test_settings(), gw.factory(), bus);
    ASSERT_TRUE(conn.start());
    ASSERT_TRUE(conn.wait_for_state(ConnectionState::OPEN, 2000));
    uint64_t gen = conn.status().generation;

    std::future<RpcResult> a = conn.call_async("exec.write", Json::object(), 0);
    std::future<RpcResult> b = conn.call_async("exec.write", Json::object(), 0);
    ASSERT_TRUE(gw.wait_for("exec.write", 2));

    gw.drop();

    ASSERT_EQ(std::future_status::ready, a.wait_for(std::chrono::seconds(2)));
    ASSERT_EQ(std::future_status::ready, b.wait_for(std::chrono::seconds(2)));
    EXPECT_EQ(GatewayErrorCode::CONNECTION_LOST, a.get().code);
    EXPECT_EQ(GatewayErrorCode::CONNECTION_LOST, b.get().code);

    ASSERT_TRUE(conn.wait_for_open(gen, 3000));
    EXPECT_EQ(2, gw.opens());
    EXPECT_GE(log.count_state("closed"), 1u);
    EXPECT_EQ(0u, conn.correlator().pending_count());

    // New generation works normally
    EXPECT_TRUE(conn.call("health").ok);
}

TEST(GatewayConnection, RetriesWithBackoffAfterFailedOpens) {
    FakeGateway gw;
    gw.fail_next_opens(3);
    EventBus bus;
    StatusLog log;
    log.attach(bus);
    GatewayConnection conn(test_settings(), gw.factory(), bus);

    ASSERT_TRUE(conn.start());
    ASSERT_TRUE(conn.wait_for_state(ConnectionState::OPEN, 3000));
    EXPECT_EQ(3, gw.failed_opens());
    EXPECT_EQ(1, gw.opens());

    // Attempt counter resets once open
    ConnectionStatus st = conn.status();
    EXPECT_EQ(0, st.attempt);
    EXPECT_TRUE(st.last_error.empty());
}

TEST(GatewayConnection, FailedHandshakeIsRetried) {
    FakeGateway gw;
    int refusals = 0;
    gw.on("connect", [&refusals](FakeGateway& g, const Frame& req) {
        if (refusals < 2) {
            ++refusals;
            Json err = Json::object();
            err["message"] = "bad auth";
            g.reply_error(req.id, err);
        } else {
            g.reply_ok(req.id, FakeGateway::hello_payload());
        }
    });

    EventBus bus;
    GatewayConnection conn(test_settings(), gw.factory(), bus);
    ASSERT_TRUE(conn.start());
    ASSERT_TRUE(conn.wait_for_state(ConnectionState::OPEN, 3000));
    EXPECT_EQ(3, gw.opens());
}

TEST(GatewayConnection, MissedHeartbeatCountsAsLoss) {
    FakeGateway gw;
    gw.silence("health");

    GatewaySettings s = test_settings();
    s.heartbeat_interval_ms = 50;
    s.heartbeat_timeout_ms = 100;

    EventBus bus;
    GatewayConnection conn(s, gw.factory(), bus);
    ASSERT_TRUE(conn.start());
    ASSERT_TRUE(conn.wait_for_state(ConnectionState::OPEN, 2000));

    ASSERT_TRUE(gw.wait_for("health", 1));
    ASSERT_TRUE(wait_until([&gw]() { return gw.opens() >= 2; }, 3000));
}

TEST(GatewayConnection, AnsweredHeartbeatKeepsGeneration) {
    FakeGateway gw;
    GatewaySettings s = test_settings();
    s.heartbeat_interval_ms = 30;
    s.heartbeat_timeout_ms = 500;

    EventBus bus;
    GatewayConnection conn(s, gw.factory(), bus);
    ASSERT_TRUE(conn.start());
    ASSERT_TRUE(conn.wait_for_state(ConnectionState::OPEN, 2000));

    ASSERT_TRUE(gw.wait_for("health", 3));
    EXPECT_EQ(1, gw.opens());
    EXPECT_EQ(ConnectionState::OPEN, conn.state());
}

TEST(GatewayConnection, MalformedFramesAreDropped) {
    FakeGateway gw;
    EventBus bus;
    std::mutex mutex;
    std::vector<std::string> topics;
    bus.subscribe(EventBus::WILDCARD, [&](const std::string& t, const Json&) {
        if (t == GatewayConnection::STATUS_TOPIC) return;
        std::lock_guard<std::mutex> lock(mutex);
        topics.push_back(t);
    });

    GatewayConnection conn(test_settings(), gw.factory(), bus);
    ASSERT_TRUE(conn.start());
    ASSERT_TRUE(conn.wait_for_state(ConnectionState::OPEN, 2000));

    gw.push_raw("this is not json");
    gw.push_raw("{\"type\":\"mystery\"}");
    gw.push_raw("{\"type\":\"event\",\"topic\":\"agent\",\"payload\":{}}\n{broken\n"
                "{\"type\":\"event\",\"event\":\"chat\",\"payload\":{}}");

    ASSERT_TRUE(wait_until([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return topics.size() >= 2;
    }));
    EXPECT_EQ(ConnectionState::OPEN, conn.state());
    EXPECT_EQ(1, gw.opens());
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ("agent", topics[0]);
    EXPECT_EQ("chat", topics[1]);
}

TEST(GatewayConnection, ReconnectNowOpensNewGeneration) {
    FakeGateway gw;
    EventBus bus;
    StatusLog log;
    log.attach(bus);
    GatewayConnection conn(test_settings(), gw.factory(), bus);

    EXPECT_FALSE(conn.reconnect_now());

    ASSERT_TRUE(conn.start());
    ASSERT_TRUE(conn.wait_for_state(ConnectionState::OPEN, 2000));
    uint64_t gen = conn.status().generation;

    EXPECT_TRUE(conn.reconnect_now());
    ASSERT_TRUE(conn.wait_for_open(gen, 2000));
    EXPECT_EQ(2, gw.opens());
    EXPECT_GE(log.count_state("closing"), 1u);
}

TEST(GatewayConnection, UpdateSettingsStartsStoppedConnection) {
    FakeGateway gw;
    EventBus bus;
    GatewaySettings s = test_settings();
    s.token.clear();
    GatewayConnection conn(s, gw.factory(), bus);
    EXPECT_FALSE(conn.start());

    GatewaySettings fixed = test_settings();
    fixed.token = "fresh";
    EXPECT_TRUE(conn.update_settings(fixed));
    ASSERT_TRUE(conn.wait_for_open(0, 2000));

    Frame connect;
    ASSERT_TRUE(gw.last("connect", connect));
    EXPECT_EQ("fresh", connect.params["auth"]["token"]);
    EXPECT_FALSE(conn.status().fatal);
}

TEST(GatewayConnection, ClearingCredentialsStopsWithoutRetry) {
    FakeGateway gw;
    EventBus bus;
    StatusLog log;
    log.attach(bus);
    GatewayConnection conn(test_settings(), gw.factory(), bus);
    ASSERT_TRUE(conn.start());
    ASSERT_TRUE(conn.wait_for_state(ConnectionState::OPEN, 2000));

    GatewaySettings cleared = test_settings();
    cleared.token.clear();
    cleared.password.clear();
    EXPECT_FALSE(conn.update_settings(cleared));

    ConnectionStatus st = conn.status();
    EXPECT_EQ(ConnectionState::CLOSED, st.state);
    EXPECT_TRUE(st.fatal);
    EXPECT_EQ("missing_credentials", st.last_error);
    EXPECT_TRUE(log.last()["fatal"].get<bool>());

    sleep_ms(150);
    EXPECT_EQ(1, gw.opens());
    EXPECT_EQ(1u, gw.count("connect"));
    EXPECT_EQ(GatewayErrorCode::CONNECTION_LOST, conn.call("health").code);

    // Credentials supplied later bring it back
    EXPECT_TRUE(conn.update_settings(test_settings()));
    ASSERT_TRUE(conn.wait_for_open(st.generation, 2000));
    EXPECT_FALSE(conn.status().fatal);
}

TEST(GatewayConnection, StopRejectsPendingAndCloses) {
    FakeGateway gw;
    EventBus bus;
    GatewayConnection conn(test_settings(), gw.factory(), bus);
    ASSERT_TRUE(conn.start());
    ASSERT_TRUE(conn.wait_for_state(ConnectionState::OPEN, 2000));

    std::future<RpcResult> pending = conn.call_async("exec.create", Json::object(), 0);
    ASSERT_TRUE(gw.wait_for("exec.create"));
    conn.stop();

    EXPECT_EQ(GatewayErrorCode::CONNECTION_LOST, pending.get().code);
    EXPECT_EQ(ConnectionState::CLOSED, conn.state());

    sleep_ms(100);
    EXPECT_EQ(1, gw.opens());
    EXPECT_EQ(GatewayErrorCode::CONNECTION_LOST, conn.call("health").code);
}

TEST(GatewayConnection, EventsReachSubscribers) {
    FakeGateway gw;
    EventBus bus;
    std::promise<Json> got;
    bus.subscribe("agent", [&got](const std::string&, const Json& p) {
        got.set_value(p);
    });

    GatewayConnection conn(test_settings(), gw.factory(), bus);
    ASSERT_TRUE(conn.start());
    ASSERT_TRUE(conn.wait_for_state(ConnectionState::OPEN, 2000));

    Json payload = Json::object();
    payload["runId"] = "r1";
    gw.push_event("agent", payload);

    std::future<Json> f = got.get_future();
    ASSERT_EQ(std::future_status::ready, f.wait_for(std::chrono::seconds(2)));
    EXPECT_EQ("r1", f.get()["runId"]);
}
