#include <clawsuite/gateway/rpc.hpp>
#include <clawsuite/core/logger.hpp>
#include <clawsuite/core/utils.hpp>

#include <chrono>
#include <vector>

namespace clawsuite {

std::atomic<uint64_t> RpcCorrelator::counter_(0);

RpcCorrelator::RpcCorrelator() : prefix_(random_hex(4)) {}

std::string RpcCorrelator::next_id() {
    return prefix_ + "-" + std::to_string(++counter_);
}

std::future<RpcResult> RpcCorrelator::call_async(const std::string& method,
                                                 const Json& params,
                                                 int timeout_ms,
                                                 const SendFn& send,
                                                 std::string* id_out) {
    PendingPtr call = std::make_shared<PendingCall>();
    call->method = method;
    call->created_at = monotonic_ms();
    call->deadline = timeout_ms > 0 ? call->created_at + timeout_ms : 0;
    std::future<RpcResult> future = call->promise.get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        do {
            call->id = next_id();
        } while (pending_.count(call->id) != 0);
        pending_[call->id] = call;
    }

    if (id_out) *id_out = call->id;

    // Registered before sending: the response may beat send() back
    Frame frame = Frame::request(call->id, method, params);
    if (!send || !send(frame)) {
        settle(call->id, RpcResult::fail(GatewayErrorCode::CONNECTION_LOST,
                                         "gateway not connected"));
    }

    return future;
}

RpcResult RpcCorrelator::call(const std::string& method, const Json& params,
                              int timeout_ms, const SendFn& send) {
    std::string id;
    std::future<RpcResult> future = call_async(method, params, timeout_ms, send, &id);

    if (timeout_ms > 0 &&
        future.wait_for(std::chrono::milliseconds(timeout_ms)) == std::future_status::timeout) {
        // Lost the race if a response settled it first; get() returns that
        expire(id);
    }
    return future.get();
}

bool RpcCorrelator::settle(const std::string& id, const RpcResult& result) {
    PendingPtr call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, PendingPtr>::iterator it = pending_.find(id);
        if (it == pending_.end()) return false;
        call = it->second;
        pending_.erase(it);
    }
    call->promise.set_value(result);
    return true;
}

bool RpcCorrelator::resolve(const Frame& response) {
    if (response.type != FrameType::RESPONSE) return false;

    RpcResult result = response.ok
        ? RpcResult::success(response.result)
        : RpcResult::fail(GatewayErrorCode::GATEWAY_ERROR,
                          gateway_error_message(response.error), response.error);

    if (!settle(response.id, result)) {
        LOG_DEBUG("Dropping response for unknown request id %s", response.id.c_str());
        return false;
    }
    return true;
}

bool RpcCorrelator::expire(const std::string& id) {
    std::string method;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, PendingPtr>::const_iterator it = pending_.find(id);
        if (it == pending_.end()) return false;
        method = it->second->method;
    }
    bool expired = settle(id, RpcResult::fail(GatewayErrorCode::TIMEOUT,
                                              "gateway request '" + method + "' timed out"));
    if (expired) {
        LOG_WARN("Request %s (%s) timed out", id.c_str(), method.c_str());
    }
    return expired;
}

size_t RpcCorrelator::fail_all(GatewayErrorCode code, const std::string& message) {
    std::map<std::string, PendingPtr> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failed.swap(pending_);
    }

    for (std::map<std::string, PendingPtr>::iterator it = failed.begin();
         it != failed.end(); ++it) {
        it->second->promise.set_value(RpcResult::fail(code, message));
    }

    if (!failed.empty()) {
        LOG_INFO("Rejected %zu pending gateway request(s): %s", failed.size(), message.c_str());
    }
    return failed.size();
}

size_t RpcCorrelator::expire_overdue(int64_t now_ms) {
    std::vector<std::string> overdue;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (std::map<std::string, PendingPtr>::const_iterator it = pending_.begin();
             it != pending_.end(); ++it) {
            if (it->second->deadline > 0 && it->second->deadline < now_ms) {
                overdue.push_back(it->first);
            }
        }
    }

    size_t count = 0;
    for (size_t i = 0; i < overdue.size(); ++i) {
        if (expire(overdue[i])) ++count;
    }
    return count;
}

size_t RpcCorrelator::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool RpcCorrelator::is_pending(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(id) != 0;
}

} // namespace clawsuite
