#include <clawsuite/gateway/event_bus.hpp>
#include <clawsuite/core/logger.hpp>

#include <exception>
#include <utility>
#include <vector>

namespace clawsuite {

const char* const EventBus::WILDCARD = "*";

EventBus::EventBus() : next_id_(1) {}

EventBus::SubscriptionId EventBus::subscribe(const std::string& topic, DeliverFn deliver) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    Subscriber sub;
    sub.topic = topic;
    sub.deliver = std::move(deliver);
    subscribers_[id] = sub;
    LOG_DEBUG("EventBus: subscription %llu on '%s'",
              static_cast<unsigned long long>(id), topic.c_str());
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.erase(id) != 0;
}

size_t EventBus::publish(const std::string& topic, const Json& payload) {
    std::vector<std::pair<SubscriptionId, DeliverFn> > targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (std::map<SubscriptionId, Subscriber>::const_iterator it = subscribers_.begin();
             it != subscribers_.end(); ++it) {
            if (it->second.topic == topic || it->second.topic == WILDCARD) {
                targets.push_back(std::make_pair(it->first, it->second.deliver));
            }
        }
    }

    // Deliver outside the lock so subscribers may (un)subscribe from inside
    size_t delivered = 0;
    for (size_t i = 0; i < targets.size(); ++i) {
        try {
            targets[i].second(topic, payload);
            ++delivered;
        } catch (const std::exception& e) {
            LOG_WARN("EventBus: subscriber %llu failed on '%s': %s",
                     static_cast<unsigned long long>(targets[i].first), topic.c_str(), e.what());
        } catch (...) {
            LOG_WARN("EventBus: subscriber %llu failed on '%s' with unknown exception",
                     static_cast<unsigned long long>(targets[i].first), topic.c_str());
        }
    }
    return delivered;
}

size_t EventBus::subscriber_count(const std::string& topic) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (std::map<SubscriptionId, Subscriber>::const_iterator it = subscribers_.begin();
         it != subscribers_.end(); ++it) {
        if (it->second.topic == topic) ++count;
    }
    return count;
}

size_t EventBus::total_subscriptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

} // namespace clawsuite
