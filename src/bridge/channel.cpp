#include <clawsuite/bridge/channel.hpp>
#include <clawsuite/core/logger.hpp>
#include <clawsuite/core/utils.hpp>

namespace clawsuite {

BridgeChannel::BridgeChannel(ChannelId id, const std::shared_ptr<BridgeSink>& sink,
                             size_t max_unanswered)
    : id_(id)
    , sink_(sink)
    , alive_(sink != nullptr)
    , activity_(false)
    , last_send_ms_(monotonic_ms())
    , max_unanswered_(max_unanswered)
    , unanswered_(0) {}

bool BridgeChannel::send(const std::string& event, const Json& data) {
    if (!alive_) return false;

    Json message = Json::object();
    message["event"] = event;
    message["data"] = data;
    std::string text = message.dump(-1, ' ', false, Json::error_handler_t::replace);

    bool ok;
    {
        std::lock_guard<std::mutex> lock(send_mutex_);
        if (!alive_) return false;
        if (max_unanswered_ > 0 && unanswered_ >= max_unanswered_) {
            if (mark_dead()) {
                LOG_WARN("Bridge channel %llu: browser stopped reading (%zu messages unanswered)",
                         static_cast<unsigned long long>(id_), max_unanswered_);
            }
            return false;
        }
        ok = sink_->send_text(text);
        if (ok) ++unanswered_;
    }

    if (!ok) {
        if (mark_dead()) {
            LOG_INFO("Bridge channel %llu: browser went away",
                     static_cast<unsigned long long>(id_));
        }
        return false;
    }
    last_send_ms_ = monotonic_ms();
    return true;
}

bool BridgeChannel::mark_dead() {
    return alive_.exchange(false);
}

void BridgeChannel::close_sink() {
    if (sink_) sink_->close();
}

void BridgeChannel::add_subscription(EventBus::SubscriptionId sub) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.push_back(sub);
}

std::vector<EventBus::SubscriptionId> BridgeChannel::take_subscriptions() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EventBus::SubscriptionId> out;
    out.swap(subscriptions_);
    return out;
}

size_t BridgeChannel::subscription_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

void BridgeChannel::watch(const std::string& session_id, bool owned) {
    std::lock_guard<std::mutex> lock(mutex_);
    watched_.insert(session_id);
    if (owned) owned_.insert(session_id);
}

void BridgeChannel::unwatch(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    watched_.erase(session_id);
    owned_.erase(session_id);
}

bool BridgeChannel::watches(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return watched_.count(session_id) != 0;
}

std::vector<std::string> BridgeChannel::watched() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(watched_.begin(), watched_.end());
}

std::vector<std::string> BridgeChannel::owned() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(owned_.begin(), owned_.end());
}

std::string BridgeChannel::sole_session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return watched_.size() == 1 ? *watched_.begin() : std::string();
}

} // namespace clawsuite
