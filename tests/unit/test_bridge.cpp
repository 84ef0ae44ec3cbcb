#include <gtest/gtest.h>

#include <clawsuite/bridge/bridge.hpp>

#include "util/fake_gateway.hpp"

#include <atomic>
#include <mutex>
#include <vector>

using namespace clawsuite;
using clawsuite::testing::FakeGateway;
using clawsuite::testing::test_settings;
using clawsuite::testing::wait_until;

namespace {

// Browser stand-in: keeps every message, can be told to start failing
class RecordingSink : public BridgeSink {
public:
    RecordingSink() : fail_(false), closed_(false) {}

    bool send_text(const std::string& text) override {
        if (fail_) return false;
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.push_back(Json::parse(text));
        return true;
    }

    void close() override { closed_ = true; }

    void fail() { fail_ = true; }
    bool closed() const { return closed_; }

    std::vector<Json> messages() {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    size_t count(const std::string& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (size_t i = 0; i < messages_.size(); ++i) {
            if (messages_[i]["event"] == event) ++n;
        }
        return n;
    }

    Json first(const std::string& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < messages_.size(); ++i) {
            if (messages_[i]["event"] == event) return messages_[i]["data"];
        }
        return Json();
    }

private:
    std::mutex mutex_;
    std::vector<Json> messages_;
    std::atomic<bool> fail_;
    std::atomic<bool> closed_;
};

class BridgeTest : public ::testing::Test {
protected:
    BridgeTest() : next_exec_(0) {}

    void SetUp() override {
        gw.on("exec", [this](FakeGateway& g, const Frame& req) {
            Json result = Json::object();
            result["execId"] = "e-" + std::to_string(++next_exec_);
            g.reply_ok(req.id, result);
        });
        gw.respond_with("exec.write", Json::object());
        gw.respond_with("exec.resize", Json::object());
        gw.respond_with("exec.close", Json::object());

        conn.reset(new GatewayConnection(test_settings(), gw.factory(), bus));
        exec.reset(new ExecSessionManager(*conn));
        pool.reset(new ThreadPool(4));
        ASSERT_TRUE(conn->start());
        ASSERT_TRUE(conn->wait_for_state(ConnectionState::OPEN, 2000));
    }

    void TearDown() override {
        bridge.reset();
        pool.reset();
        exec.reset();
        conn.reset();
    }

    void make_bridge(const BridgeSettings& settings = BridgeSettings()) {
        bridge.reset(new BrowserBridge(*conn, *exec, *pool, settings));
    }

    ChannelId tab(const std::shared_ptr<RecordingSink>& sink) {
        return bridge->open_channel(sink)->id();
    }

    // Open a terminal on `id` and return its session id
    std::string open_on(ChannelId id) {
        ExecResult r = bridge->open_terminal(id, ExecOptions());
        EXPECT_TRUE(r.ok) << r.error;
        return r.session.id;
    }

    void push_output(const std::string& exec_id, const std::string& data) {
        Json out = Json::object();
        out["execId"] = exec_id;
        out["data"] = data;
        gw.push_event("exec.output", out);
    }

    FakeGateway gw;
    EventBus bus;
    std::atomic<int> next_exec_;
    std::unique_ptr<GatewayConnection> conn;
    std::unique_ptr<ExecSessionManager> exec;
    std::unique_ptr<ThreadPool> pool;
    std::unique_ptr<BrowserBridge> bridge;
};

} // namespace

TEST(BridgeOptions, LenientParse) {
    ExecOptions o = BrowserBridge::parse_exec_options(
        Json::parse(R"({"command":["bash","-l"],"cwd":"/srv","cols":90,"rows":"x","env":{"A":"1","B":2}})"));
    ASSERT_EQ(2u, o.command.size());
    EXPECT_EQ("-l", o.command[1]);
    EXPECT_EQ("/srv", o.cwd);
    EXPECT_EQ(90, o.cols);
    EXPECT_EQ(0, o.rows);
    EXPECT_EQ(1u, o.env.size());
    EXPECT_TRUE(o.pty);

    EXPECT_EQ("htop", BrowserBridge::parse_exec_options(Json::parse(R"({"command":"htop"})")).command[0]);
    EXPECT_TRUE(BrowserBridge::parse_exec_options(Json("nonsense")).command.empty());
}

TEST_F(BridgeTest, SessionMessageComesFirst) {
    make_bridge();
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    ChannelId id = tab(sink);

    std::string sid = open_on(id);
    ExecSession s;
    ASSERT_TRUE(exec->get(sid, s));
    push_output(s.exec_id, "$ ");

    ASSERT_TRUE(wait_until([&sink]() { return sink->count("event") == 1; }));
    std::vector<Json> msgs = sink->messages();
    EXPECT_EQ("session", msgs[0]["event"]);
    EXPECT_EQ(sid, msgs[0]["data"]["sessionId"]);
    EXPECT_EQ(s.exec_id, msgs[0]["data"]["execId"]);
    EXPECT_EQ("$ ", sink->first("event")["payload"]["data"]);
}

TEST_F(BridgeTest, FailedOpenReportsErrorThenClose) {
    Json err = Json::object();
    err["message"] = "spawn failed";
    gw.respond_error("exec", err);
    make_bridge();

    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    ChannelId id = tab(sink);
    ExecResult r = bridge->open_terminal(id, ExecOptions());
    EXPECT_FALSE(r.ok);

    std::vector<Json> msgs = sink->messages();
    ASSERT_EQ(2u, msgs.size());
    EXPECT_EQ("error", msgs[0]["event"]);
    EXPECT_EQ("close", msgs[1]["event"]);
    EXPECT_EQ(0u, sink->count("session"));
    EXPECT_TRUE(bridge->channel(id)->watched().empty());
}

TEST_F(BridgeTest, EveryWatchingTabGetsEachMessageOnce) {
    make_bridge();
    std::shared_ptr<RecordingSink> s1 = std::make_shared<RecordingSink>();
    std::shared_ptr<RecordingSink> s2 = std::make_shared<RecordingSink>();
    std::shared_ptr<RecordingSink> s3 = std::make_shared<RecordingSink>();
    ChannelId t1 = tab(s1);
    ChannelId t2 = tab(s2);
    ChannelId t3 = tab(s3);

    std::string sid = open_on(t1);
    ASSERT_TRUE(bridge->attach_terminal(t2, sid));
    ASSERT_TRUE(bridge->attach_terminal(t3, sid));
    EXPECT_TRUE(bridge->attach_terminal(t3, sid));
    EXPECT_EQ(3u, bridge->watcher_count(sid));

    ExecSession s;
    ASSERT_TRUE(exec->get(sid, s));
    push_output(s.exec_id, "hi");

    ASSERT_TRUE(wait_until([&]() {
        return s1->count("event") == 1 && s2->count("event") == 1 && s3->count("event") == 1;
    }));
    sleep_ms(50);
    EXPECT_EQ(1u, s1->count("event"));
    EXPECT_EQ(1u, s2->count("event"));
    EXPECT_EQ(1u, s3->count("event"));
}

TEST_F(BridgeTest, AttachToUnknownSessionFails) {
    make_bridge();
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    ChannelId id = tab(sink);

    EXPECT_FALSE(bridge->attach_terminal(id, "missing"));
    EXPECT_EQ("session_closed", sink->first("error")["code"]);
}

TEST_F(BridgeTest, DisconnectUnsubscribesAndStopsDelivery) {
    make_bridge();
    std::shared_ptr<RecordingSink> s1 = std::make_shared<RecordingSink>();
    std::shared_ptr<RecordingSink> s2 = std::make_shared<RecordingSink>();
    ChannelId t1 = tab(s1);
    ChannelId t2 = tab(s2);

    std::string sid = open_on(t1);
    ASSERT_TRUE(bridge->attach_terminal(t2, sid));
    size_t subs = bus.total_subscriptions();

    EXPECT_TRUE(bridge->disconnect(t2));
    EXPECT_FALSE(bridge->disconnect(t2));
    EXPECT_EQ(subs - 1, bus.total_subscriptions());
    EXPECT_EQ(1u, bridge->channel_count());

    ExecSession s;
    ASSERT_TRUE(exec->get(sid, s));
    push_output(s.exec_id, "after");
    ASSERT_TRUE(wait_until([&s1]() { return s1->count("event") == 1; }));
    sleep_ms(50);
    EXPECT_EQ(0u, s2->count("event"));

    // t1 opened it and still watches: nothing was closed
    EXPECT_EQ(0u, gw.count("exec.close"));
}

TEST_F(BridgeTest, OwnerLeavingWhileOthersWatchKeepsSession) {
    make_bridge();
    std::shared_ptr<RecordingSink> s1 = std::make_shared<RecordingSink>();
    std::shared_ptr<RecordingSink> s2 = std::make_shared<RecordingSink>();
    ChannelId t1 = tab(s1);
    ChannelId t2 = tab(s2);

    std::string sid = open_on(t1);
    ASSERT_TRUE(bridge->attach_terminal(t2, sid));

    bridge->disconnect(t1);
    ASSERT_TRUE(pool->wait_idle(2000));
    EXPECT_EQ(1u, exec->session_count());
    EXPECT_EQ(0u, gw.count("exec.close"));
}

TEST_F(BridgeTest, OrphanedSessionIsClosed) {
    make_bridge();
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    ChannelId id = tab(sink);
    std::string sid = open_on(id);

    bridge->disconnect(id);
    ASSERT_TRUE(gw.wait_for("exec.close"));
    ASSERT_TRUE(wait_until([this]() { return exec->session_count() == 0; }));
}

TEST_F(BridgeTest, OrphanPolicyCanKeepSessions) {
    BridgeSettings settings;
    settings.close_orphaned_sessions = false;
    make_bridge(settings);

    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    ChannelId id = tab(sink);
    std::string sid = open_on(id);

    bridge->disconnect(id);
    ASSERT_TRUE(pool->wait_idle(2000));
    EXPECT_EQ(0u, gw.count("exec.close"));
    EXPECT_EQ(1u, exec->session_count());

    // Another tab can pick it up later
    std::shared_ptr<RecordingSink> later = std::make_shared<RecordingSink>();
    EXPECT_TRUE(bridge->attach_terminal(tab(later), sid));
}

TEST_F(BridgeTest, DeadSinkIsReaped) {
    BridgeSettings settings;
    settings.keepalive_ms = 1;
    make_bridge(settings);

    std::shared_ptr<RecordingSink> good = std::make_shared<RecordingSink>();
    std::shared_ptr<RecordingSink> bad = std::make_shared<RecordingSink>();
    tab(good);
    ChannelId gone = tab(bad);
    bad->fail();

    sleep_ms(5);
    EXPECT_EQ(1u, bridge->poll());
    EXPECT_EQ(1u, bridge->channel_count());
    EXPECT_FALSE(bridge->channel(gone));
    EXPECT_GE(good->count("ping"), 1u);
}

TEST_F(BridgeTest, FailedSendStopsFurtherWrites) {
    make_bridge();
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    std::shared_ptr<BridgeChannel> chan = bridge->open_channel(sink);

    EXPECT_TRUE(chan->send("a", Json()));
    sink->fail();
    EXPECT_FALSE(chan->send("b", Json()));
    EXPECT_FALSE(chan->alive());
    EXPECT_FALSE(chan->mark_dead());
}

TEST(BridgeChannelBacklog, SilentBrowserGoesDeadAtTheCap) {
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    BridgeChannel chan(7, sink, 3);

    EXPECT_TRUE(chan.send("a", Json()));
    EXPECT_TRUE(chan.send("b", Json()));
    chan.note_browser_activity();
    EXPECT_EQ(0u, chan.unanswered());

    EXPECT_TRUE(chan.send("c", Json()));
    EXPECT_TRUE(chan.send("d", Json()));
    EXPECT_TRUE(chan.send("e", Json()));
    EXPECT_FALSE(chan.send("f", Json()));
    EXPECT_FALSE(chan.alive());
    EXPECT_EQ(5u, sink->messages().size());

    // No limit when the cap is 0
    std::shared_ptr<RecordingSink> other = std::make_shared<RecordingSink>();
    BridgeChannel unlimited(8, other);
    for (int i = 0; i < 100; ++i) {
        EXPECT_TRUE(unlimited.send("x", Json()));
    }
}

TEST_F(BridgeTest, StalledTabIsReapedWhileOthersKeepStreaming) {
    BridgeSettings settings;
    settings.keepalive_ms = 0;
    settings.max_pending_messages = 5;
    make_bridge(settings);

    std::shared_ptr<RecordingSink> reading = std::make_shared<RecordingSink>();
    std::shared_ptr<RecordingSink> stalled = std::make_shared<RecordingSink>();
    ChannelId owner = tab(reading);
    ChannelId silent = tab(stalled);

    std::string sid = open_on(owner);
    ASSERT_TRUE(bridge->attach_terminal(silent, sid));
    ExecSession s;
    ASSERT_TRUE(exec->get(sid, s));

    // The reading tab answers after every chunk; the stalled one never does
    for (size_t i = 1; i <= 8; ++i) {
        push_output(s.exec_id, "chunk");
        ASSERT_TRUE(wait_until([&]() { return reading->count("event") == i; }));
        bridge->handle_message(owner, R"({"type":"pong"})");
    }

    EXPECT_FALSE(bridge->channel(silent)->alive());
    EXPECT_LE(stalled->messages().size(), 5u);
    EXPECT_EQ(0u, reading->count("error"));

    EXPECT_EQ(1u, bridge->poll());
    EXPECT_FALSE(bridge->channel(silent));
    EXPECT_TRUE(bridge->channel(owner)->alive());
    EXPECT_EQ(1u, bridge->watcher_count(sid));
    EXPECT_EQ(1u, exec->session_count());
}

TEST_F(BridgeTest, InputIsForwardedInOrder) {
    make_bridge();
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    ChannelId id = tab(sink);
    std::string sid = open_on(id);

    bridge->handle_message(id, R"({"type":"input","data":"l"})");
    bridge->handle_message(id, R"({"type":"input","sessionId":")" + sid + R"(","data":"s\n"})");
    ASSERT_TRUE(gw.wait_for("exec.write", 2));

    std::vector<Frame> sent = gw.sent();
    std::vector<std::string> data;
    for (size_t i = 0; i < sent.size(); ++i) {
        if (sent[i].method == "exec.write") data.push_back(sent[i].params["data"]);
    }
    ASSERT_EQ(2u, data.size());
    EXPECT_EQ("l", data[0]);
    EXPECT_EQ("s\n", data[1]);
    EXPECT_EQ(0u, sink->count("error"));
}

TEST_F(BridgeTest, CommandsNeedAWatchedSession) {
    make_bridge();
    std::shared_ptr<RecordingSink> owner = std::make_shared<RecordingSink>();
    std::shared_ptr<RecordingSink> other = std::make_shared<RecordingSink>();
    std::string sid = open_on(tab(owner));
    ChannelId id = tab(other);

    bridge->handle_message(id, R"({"type":"input","sessionId":")" + sid + R"(","data":"x"})");
    bridge->handle_message(id, R"({"type":"input","data":"x"})");
    EXPECT_EQ(2u, other->count("error"));
    EXPECT_EQ(0u, gw.count("exec.write"));
}

TEST_F(BridgeTest, ResizeAndCloseFromBrowser) {
    make_bridge();
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    ChannelId id = tab(sink);
    std::string sid = open_on(id);

    bridge->handle_message(id, R"({"type":"resize","cols":0,"rows":10})");
    EXPECT_EQ("invalid_argument", sink->first("error")["code"]);

    bridge->handle_message(id, R"({"type":"resize","cols":132,"rows":43})");
    ASSERT_TRUE(gw.wait_for("exec.resize"));

    bridge->handle_message(id, R"({"type":"close"})");
    ASSERT_TRUE(wait_until([&sink]() { return sink->count("close") == 1; }));
    EXPECT_EQ("closed by browser", sink->first("close")["reason"]);
    EXPECT_EQ(0u, exec->session_count());
}

TEST_F(BridgeTest, OpenMessageStartsTerminalOnPool) {
    make_bridge();
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    ChannelId id = tab(sink);

    bridge->handle_message(id, R"({"type":"open","command":["/bin/sh"],"cols":80,"rows":24})");
    ASSERT_TRUE(wait_until([&sink]() { return sink->count("session") == 1; }));

    Frame req;
    ASSERT_TRUE(gw.last("exec", req));
    EXPECT_EQ("/bin/sh", req.params["command"][0]);
    EXPECT_EQ(80, req.params["cols"]);
}

TEST_F(BridgeTest, PingAndBadMessages) {
    make_bridge();
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    ChannelId id = tab(sink);

    bridge->handle_message(id, R"({"type":"ping"})");
    EXPECT_EQ(1u, sink->count("pong"));

    bridge->handle_message(id, "not json");
    bridge->handle_message(id, R"({"type":"teleport"})");
    EXPECT_EQ(2u, sink->count("error"));
}

TEST_F(BridgeTest, ActivityFeedRelaysGatewayEvents) {
    make_bridge();
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    ChannelId id = tab(sink);

    ASSERT_TRUE(bridge->watch_activity(id));
    std::vector<Json> msgs = sink->messages();
    ASSERT_EQ(1u, msgs.size());
    EXPECT_EQ("status", msgs[0]["event"]);
    EXPECT_EQ("open", msgs[0]["data"]["state"]);

    Json payload = Json::object();
    payload["runId"] = "r-9";
    gw.push_event("agent", payload);
    ASSERT_TRUE(wait_until([&sink]() { return sink->count("event") == 1; }));
    EXPECT_EQ("agent", sink->first("event")["event"]);
    EXPECT_EQ("r-9", sink->first("event")["payload"]["runId"]);

    // Terminal feeds stay on their own channels
    std::string sid = open_on(tab(std::make_shared<RecordingSink>()));
    ExecSession s;
    ASSERT_TRUE(exec->get(sid, s));
    push_output(s.exec_id, "private");
    sleep_ms(50);
    for (const Json& m : sink->messages()) {
        if (m["event"] != "event") continue;
        EXPECT_NE("exec:" + sid, m["data"]["event"]);
    }
}

TEST_F(BridgeTest, ConnectionLossClosesTerminalsInTabs) {
    make_bridge();
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    ChannelId id = tab(sink);
    open_on(id);

    gw.drop();
    ASSERT_TRUE(wait_until([&sink]() { return sink->count("close") == 1; }));
    EXPECT_EQ("connection lost", sink->first("close")["reason"]);
    EXPECT_TRUE(bridge->channel(id)->watched().empty());
}

TEST_F(BridgeTest, ShutdownClosesEverything) {
    make_bridge();
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    ChannelId id = tab(sink);
    open_on(id);

    bridge->shutdown();
    EXPECT_EQ(0u, bridge->channel_count());
    EXPECT_TRUE(sink->closed());
    EXPECT_EQ(1u, gw.count("exec.close"));
    EXPECT_EQ(0u, exec->session_count());
}
