#ifndef CLAWSUITE_GATEWAY_EVENT_BUS_HPP
#define CLAWSUITE_GATEWAY_EVENT_BUS_HPP

#include "../core/json.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace clawsuite {

// Topic-keyed publish/subscribe.
//
// publish() is synchronous fan-out to a snapshot of the subscribers of the
// topic plus wildcard ("*") subscribers. A subscriber that throws is logged
// and skipped; the others still receive the event. Nothing is queued: an
// event with no subscribers is dropped. Subscriptions end only through
// unsubscribe().
class EventBus {
public:
    typedef uint64_t SubscriptionId;
    typedef std::function<void(const std::string& topic, const Json& payload)> DeliverFn;

    static const char* const WILDCARD;

    EventBus();

    SubscriptionId subscribe(const std::string& topic, DeliverFn deliver);

    // False when the id is unknown (already unsubscribed)
    bool unsubscribe(SubscriptionId id);

    // Returns the number of subscribers the event was handed to
    size_t publish(const std::string& topic, const Json& payload);

    // Exact-topic subscribers, wildcard subscribers excluded
    size_t subscriber_count(const std::string& topic) const;
    size_t total_subscriptions() const;

private:
    struct Subscriber {
        std::string topic;
        DeliverFn deliver;
    };

    mutable std::mutex mutex_;
    SubscriptionId next_id_;
    std::map<SubscriptionId, Subscriber> subscribers_;
};

} // namespace clawsuite

#endif // CLAWSUITE_GATEWAY_EVENT_BUS_HPP
