#ifndef CLAWSUITE_GATEWAY_RPC_HPP
#define CLAWSUITE_GATEWAY_RPC_HPP

#include "errors.hpp"
#include "frame.hpp"

#include <atomic>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace clawsuite {

// Correlates outgoing requests with their responses.
//
// Every call gets a fresh id and a PendingCall entry. The entry is removed
// exactly once: by a matching response, by its deadline, or by fail_all()
// when the connection drops. Responses are matched by id only; the peer may
// answer out of order, and answers for unknown ids (late or duplicate) are
// dropped without error.
class RpcCorrelator {
public:
    // Writes one frame to the transport; false when it could not be sent
    typedef std::function<bool(const Frame&)> SendFn;

    RpcCorrelator();

    // "<instance prefix>-<process counter>"; never repeats in a process
    std::string next_id();

    // Register and send without waiting. A timeout_ms <= 0 means the call only
    // ends on a response or on fail_all(). Dropping the future is allowed.
    std::future<RpcResult> call_async(const std::string& method, const Json& params,
                                      int timeout_ms, const SendFn& send,
                                      std::string* id_out = nullptr);

    // Blocking form of call_async(); rejects with TIMEOUT at the deadline
    RpcResult call(const std::string& method, const Json& params,
                   int timeout_ms, const SendFn& send);

    // Settle the call matching a response frame. False if no such call.
    bool resolve(const Frame& response);

    // Reject one call with TIMEOUT. False if it was already settled.
    bool expire(const std::string& id);

    // Reject every outstanding call; returns how many were pending
    size_t fail_all(GatewayErrorCode code, const std::string& message);

    // Reject calls whose deadline is before now_ms (monotonic clock)
    size_t expire_overdue(int64_t now_ms);

    size_t pending_count() const;
    bool is_pending(const std::string& id) const;

private:
    struct PendingCall {
        std::string id;
        std::string method;
        int64_t created_at;
        int64_t deadline;   // 0 = none
        std::promise<RpcResult> promise;

        PendingCall() : created_at(0), deadline(0) {}
    };
    typedef std::shared_ptr<PendingCall> PendingPtr;

    bool settle(const std::string& id, const RpcResult& result);

    std::string prefix_;
    mutable std::mutex mutex_;
    std::map<std::string, PendingPtr> pending_;

    static std::atomic<uint64_t> counter_;
};

} // namespace clawsuite

#endif // CLAWSUITE_GATEWAY_RPC_HPP
