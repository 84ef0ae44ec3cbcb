#ifndef CLAWSUITE_BRIDGE_CHANNEL_HPP
#define CLAWSUITE_BRIDGE_CHANNEL_HPP

#include "../core/json.hpp"
#include "../gateway/event_bus.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace clawsuite {

// The browser end of a channel (a Crow WebSocket connection in the server)
class BridgeSink {
public:
    virtual ~BridgeSink() {}

    // Must not block on the browser. False once the browser side is gone.
    virtual bool send_text(const std::string& text) = 0;

    // Ask the browser transport to close; default does nothing
    virtual void close() {}
};

typedef uint64_t ChannelId;

// One browser tab's output stream.
//
// Messages go out as {"event": <name>, "data": <json>}. The first failed
// write flips the liveness flag; after that every send is a no-op and the
// bridge reaps the channel.
//
// Sinks never report how much the browser has drained, so the backlog is
// bounded by counting messages sent since the browser was last heard from
// (any message, including its answer to a "ping"). Past `max_unanswered`
// the channel counts as stalled and goes dead. 0 means no limit.
class BridgeChannel {
public:
    BridgeChannel(ChannelId id, const std::shared_ptr<BridgeSink>& sink,
                  size_t max_unanswered = 0);

    ChannelId id() const { return id_; }
    bool alive() const { return alive_; }

    bool send(const std::string& event, const Json& data);

    // Stop writing; returns false if it was already dead
    bool mark_dead();

    // The browser sent something; its backlog is assumed drained
    void note_browser_activity() { unanswered_ = 0; }
    size_t unanswered() const { return unanswered_; }

    void add_subscription(EventBus::SubscriptionId sub);
    std::vector<EventBus::SubscriptionId> take_subscriptions();
    size_t subscription_count() const;

    // Sessions this channel watches; `owned` marks the ones it opened
    void watch(const std::string& session_id, bool owned);
    void unwatch(const std::string& session_id);
    bool watches(const std::string& session_id) const;
    std::vector<std::string> watched() const;
    std::vector<std::string> owned() const;

    // The only watched session, or "" when there are none or several
    std::string sole_session() const;

    bool watching_activity() const { return activity_; }
    void set_watching_activity(bool on) { activity_ = on; }

    int64_t last_send_ms() const { return last_send_ms_; }
    // Ask the browser transport to close
    void close_sink();

private:
    ChannelId id_;
    std::shared_ptr<BridgeSink> sink_;
    std::atomic<bool> alive_;
    std::atomic<bool> activity_;
    std::atomic<int64_t> last_send_ms_;
    size_t max_unanswered_;
    std::atomic<size_t> unanswered_;

    std::mutex send_mutex_;     // keeps each message whole on the sink

    mutable std::mutex mutex_;
    std::vector<EventBus::SubscriptionId> subscriptions_;
    std::set<std::string> watched_;
    std::set<std::string> owned_;
};

} // namespace clawsuite

#endif // CLAWSUITE_BRIDGE_CHANNEL_HPP
