#include <gtest/gtest.h>

#include <clawsuite/core/utils.hpp>
#include <clawsuite/gateway/rpc.hpp>

#include <chrono>
#include <set>
#include <thread>
#include <vector>

using namespace clawsuite;

namespace {

// Captures what the correlator would put on the wire
struct Wire {
    std::vector<Frame> frames;
    bool accept;

    Wire() : accept(true) {}

    RpcCorrelator::SendFn sender() {
        return [this](const Frame& f) {
            frames.push_back(f);
            return accept;
        };
    }
};

} // namespace

TEST(RpcCorrelator, IdsAreUniqueAndPrefixed) {
    RpcCorrelator a;
    RpcCorrelator b;
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        EXPECT_TRUE(seen.insert(a.next_id()).second);
        EXPECT_TRUE(seen.insert(b.next_id()).second);
    }
    std::string id = a.next_id();
    EXPECT_NE(std::string::npos, id.find('-'));
}

TEST(RpcCorrelator, ResolvesMatchingResponse) {
    RpcCorrelator rpc;
    Wire wire;
    std::string id;
    std::future<RpcResult> f = rpc.call_async("exec.create", Json::object(), 1000,
                                              wire.sender(), &id);

    ASSERT_EQ(1u, wire.frames.size());
    EXPECT_EQ(id, wire.frames[0].id);
    EXPECT_EQ("exec.create", wire.frames[0].method);
    EXPECT_TRUE(rpc.is_pending(id));

    Json result = Json::object();
    result["execId"] = "e-1";
    EXPECT_TRUE(rpc.resolve(Frame::response_ok(id, result)));

    RpcResult r = f.get();
    EXPECT_TRUE(r.ok);
    EXPECT_EQ("e-1", r.result["execId"]);
    EXPECT_EQ(0u, rpc.pending_count());
}

TEST(RpcCorrelator, ErrorResponseBecomesGatewayError) {
    RpcCorrelator rpc;
    Wire wire;
    std::string id;
    std::future<RpcResult> f = rpc.call_async("exec.write", Json::object(), 1000,
                                              wire.sender(), &id);

    Json err = Json::object();
    err["code"] = "ENOENT";
    err["message"] = "no such exec";
    rpc.resolve(Frame::response_error(id, err));

    RpcResult r = f.get();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(GatewayErrorCode::GATEWAY_ERROR, r.code);
    EXPECT_EQ("no such exec", r.error);
    EXPECT_EQ("ENOENT", r.error_payload["code"]);
}

TEST(RpcCorrelator, UnknownAndDuplicateResponsesAreDropped) {
    RpcCorrelator rpc;
    Wire wire;
    std::string id;
    std::future<RpcResult> f = rpc.call_async("health", Json(), 1000, wire.sender(), &id);

    EXPECT_FALSE(rpc.resolve(Frame::response_ok("nobody-1", Json::object())));
    EXPECT_TRUE(rpc.resolve(Frame::response_ok(id, Json::object())));
    EXPECT_FALSE(rpc.resolve(Frame::response_ok(id, Json::object())));
    EXPECT_TRUE(f.get().ok);
}

TEST(RpcCorrelator, SendFailureSettlesAsConnectionLost) {
    RpcCorrelator rpc;
    Wire wire;
    wire.accept = false;

    RpcResult r = rpc.call("exec.write", Json::object(), 1000, wire.sender());
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(GatewayErrorCode::CONNECTION_LOST, r.code);
    EXPECT_EQ(0u, rpc.pending_count());
}

TEST(RpcCorrelator, BlockingCallTimesOut) {
    RpcCorrelator rpc;
    Wire wire;

    int64_t start = monotonic_ms();
    RpcResult r = rpc.call("exec.create", Json::object(), 100, wire.sender());
    int64_t elapsed = monotonic_ms() - start;

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(GatewayErrorCode::TIMEOUT, r.code);
    EXPECT_GE(elapsed, 90);
    EXPECT_EQ(0u, rpc.pending_count());

    // A late answer finds nothing to settle
    EXPECT_FALSE(rpc.resolve(Frame::response_ok(wire.frames[0].id, Json::object())));
}

TEST(RpcCorrelator, ExpireOverdueOnlyTouchesPastDeadlines) {
    RpcCorrelator rpc;
    Wire wire;
    std::string short_id;
    std::string long_id;
    std::string none_id;
    std::future<RpcResult> a = rpc.call_async("a", Json(), 50, wire.sender(), &short_id);
    std::future<RpcResult> b = rpc.call_async("b", Json(), 60000, wire.sender(), &long_id);
    std::future<RpcResult> c = rpc.call_async("c", Json(), 0, wire.sender(), &none_id);

    EXPECT_EQ(1u, rpc.expire_overdue(monotonic_ms() + 1000));
    EXPECT_EQ(GatewayErrorCode::TIMEOUT, a.get().code);
    EXPECT_TRUE(rpc.is_pending(long_id));
    EXPECT_TRUE(rpc.is_pending(none_id));
}

TEST(RpcCorrelator, FailAllRejectsEachPendingCallOnce) {
    RpcCorrelator rpc;
    Wire wire;
    std::vector<std::future<RpcResult> > futures;
    for (int i = 0; i < 3; ++i) {
        futures.push_back(rpc.call_async("exec.write", Json::object(), 0, wire.sender()));
    }

    EXPECT_EQ(3u, rpc.fail_all(GatewayErrorCode::CONNECTION_LOST, "connection lost"));
    EXPECT_EQ(0u, rpc.fail_all(GatewayErrorCode::CONNECTION_LOST, "connection lost"));

    for (size_t i = 0; i < futures.size(); ++i) {
        RpcResult r = futures[i].get();
        EXPECT_EQ(GatewayErrorCode::CONNECTION_LOST, r.code);
        EXPECT_EQ("connection lost", r.error);
    }
}

TEST(RpcCorrelator, ResponseRacingSendIsNotLost) {
    RpcCorrelator rpc;
    // The peer answers before send() returns
    RpcCorrelator::SendFn eager = [&rpc](const Frame& f) {
        Json result = Json::object();
        result["echo"] = f.method;
        rpc.resolve(Frame::response_ok(f.id, result));
        return true;
    };

    RpcResult r = rpc.call("ping", Json(), 1000, eager);
    ASSERT_TRUE(r.ok);
    EXPECT_EQ("ping", r.result["echo"]);
}

TEST(RpcResult, ToJsonShapes) {
    Json ok = RpcResult::success(Json::object()).to_json();
    EXPECT_TRUE(ok["ok"].get<bool>());
    EXPECT_TRUE(ok.contains("payload"));

    Json bad = RpcResult::fail(GatewayErrorCode::TIMEOUT, "late").to_json();
    EXPECT_FALSE(bad["ok"].get<bool>());
    EXPECT_EQ("timeout", bad["code"]);
    EXPECT_EQ("late", bad["error"]);
    EXPECT_FALSE(bad.contains("details"));
}

TEST(GatewayErrorMessage, PicksMostUsefulText) {
    EXPECT_EQ("plain", gateway_error_message(Json("plain")));

    Json with_message = Json::object();
    with_message["message"] = "bad";
    with_message["code"] = "E1";
    EXPECT_EQ("bad", gateway_error_message(with_message));

    Json only_code = Json::object();
    only_code["code"] = "E2";
    EXPECT_EQ("E2", gateway_error_message(only_code));

    EXPECT_EQ("gateway error", gateway_error_message(Json()));
}
