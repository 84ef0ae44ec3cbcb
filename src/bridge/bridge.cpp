#include <clawsuite/bridge/bridge.hpp>
#include <clawsuite/core/logger.hpp>
#include <clawsuite/core/utils.hpp>

#include <chrono>
#include <future>
#include <utility>
#include <vector>

namespace clawsuite {

BridgeSettings BridgeSettings::from_config(const Config& cfg) {
    BridgeSettings s;
    s.keepalive_ms = static_cast<int>(cfg.get_int("bridge.keepalive_ms", s.keepalive_ms));
    s.close_orphaned_sessions = cfg.get_bool("bridge.close_orphaned_sessions",
                                             s.close_orphaned_sessions);
    int64_t pending = cfg.get_int("bridge.max_pending_messages",
                                  static_cast<int64_t>(s.max_pending_messages));
    s.max_pending_messages = pending > 0 ? static_cast<size_t>(pending) : 0;
    return s;
}

// ============================================================================
// TerminalTap: one channel's view of one terminal feed
// ============================================================================

// Holds feed messages back until the "session" message went out, so the
// browser always learns the session id first.
struct BrowserBridge::TerminalTap {
    std::weak_ptr<BridgeChannel> channel;
    std::string session_id;

    std::mutex mutex;
    bool released;
    std::vector<std::pair<std::string, Json> > held;

    TerminalTap() : released(false) {}

    void forward(const std::string& type, const Json& data) {
        std::shared_ptr<BridgeChannel> chan = channel.lock();
        if (!chan) return;
        chan->send(type, data);
        if (type == "close") {
            chan->unwatch(session_id);
        }
    }

    void deliver(const Json& message) {
        std::string type = json_string_field(message, "type", "event");
        Json data = message.contains("data") ? message["data"] : Json();

        std::lock_guard<std::mutex> lock(mutex);
        if (!released) {
            held.push_back(std::make_pair(type, data));
            return;
        }
        forward(type, data);
    }

    // Send `first` (unless null) then everything held so far
    void release(const std::string& first_event, const Json& first) {
        std::lock_guard<std::mutex> lock(mutex);
        if (released) return;
        released = true;

        std::shared_ptr<BridgeChannel> chan = channel.lock();
        if (chan && !first.is_null()) {
            chan->send(first_event, first);
        }
        for (size_t i = 0; i < held.size(); ++i) {
            forward(held[i].first, held[i].second);
        }
        held.clear();
    }
};

// ============================================================================
// Channels
// ============================================================================

BrowserBridge::BrowserBridge(GatewayConnection& connection, ExecSessionManager& exec,
                             ThreadPool& pool, const BridgeSettings& settings)
    : connection_(connection)
    , exec_(exec)
    , bus_(connection.events())
    , pool_(pool)
    , settings_(settings)
    , next_id_(1)
    , last_ping_ms_(monotonic_ms()) {}

BrowserBridge::~BrowserBridge() {
    shutdown();
}

ExecOptions BrowserBridge::parse_exec_options(const Json& body) {
    ExecOptions options;
    options.pty = true;
    if (!body.is_object()) return options;

    if (body.contains("command")) {
        const Json& cmd = body["command"];
        if (cmd.is_array()) {
            for (size_t i = 0; i < cmd.size(); ++i) {
                options.command.push_back(cmd[i].is_string() ? cmd[i].get<std::string>()
                                                             : cmd[i].dump());
            }
        } else if (cmd.is_string() && !cmd.get<std::string>().empty()) {
            options.command.push_back(cmd.get<std::string>());
        }
    }

    if (body.contains("cwd") && body["cwd"].is_string()) {
        options.cwd = body["cwd"].get<std::string>();
    }
    if (body.contains("cols") && body["cols"].is_number()) {
        options.cols = body["cols"].get<int>();
    }
    if (body.contains("rows") && body["rows"].is_number()) {
        options.rows = body["rows"].get<int>();
    }
    if (body.contains("env") && body["env"].is_object()) {
        const Json& env = body["env"];
        for (Json::const_iterator it = env.begin(); it != env.end(); ++it) {
            if (it.value().is_string()) {
                options.env[it.key()] = it.value().get<std::string>();
            }
        }
    }
    return options;
}

std::shared_ptr<BridgeChannel> BrowserBridge::open_channel(const std::shared_ptr<BridgeSink>& sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    ChannelId id = next_id_++;
    std::shared_ptr<BridgeChannel> chan =
        std::make_shared<BridgeChannel>(id, sink, settings_.max_pending_messages);
    channels_[id] = chan;
    LOG_DEBUG("Bridge channel %llu opened", static_cast<unsigned long long>(id));
    return chan;
}

std::shared_ptr<BridgeChannel> BrowserBridge::channel(ChannelId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<ChannelId, std::shared_ptr<BridgeChannel> >::const_iterator it = channels_.find(id);
    return it == channels_.end() ? std::shared_ptr<BridgeChannel>() : it->second;
}

size_t BrowserBridge::channel_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channels_.size();
}

size_t BrowserBridge::watcher_count(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (std::map<ChannelId, std::shared_ptr<BridgeChannel> >::const_iterator it = channels_.begin();
         it != channels_.end(); ++it) {
        if (it->second->alive() && it->second->watches(session_id)) ++n;
    }
    return n;
}

// ============================================================================
// Terminals
// ============================================================================

BrowserBridge::TapPtr BrowserBridge::subscribe_terminal(const std::shared_ptr<BridgeChannel>& chan,
                                                        const std::string& session_id,
                                                        bool owned) {
    TapPtr tap = std::make_shared<TerminalTap>();
    tap->channel = chan;
    tap->session_id = session_id;

    EventBus::SubscriptionId sub = bus_.subscribe(ExecSessionManager::topic_for(session_id),
        [tap](const std::string&, const Json& message) {
            tap->deliver(message);
        });
    chan->add_subscription(sub);
    chan->watch(session_id, owned);
    return tap;
}

ExecResult BrowserBridge::open_terminal(ChannelId id, const ExecOptions& options) {
    std::shared_ptr<BridgeChannel> chan = channel(id);
    if (!chan || !chan->alive()) {
        return ExecResult::fail(GatewayErrorCode::SESSION_CLOSED, "browser channel is closed");
    }

    // Subscribe before the gateway can produce output for the session
    ExecSession session = exec_.prepare(options);
    TapPtr tap = subscribe_terminal(chan, session.id, true);

    ExecResult result = exec_.start(session.id);
    if (!result.ok) {
        // The feed already carried the error and the close
        tap->release("", Json());
        return result;
    }

    Json hello = Json::object();
    hello["sessionId"] = result.session.id;
    hello["execId"] = result.session.exec_id;
    tap->release("session", hello);
    return result;
}

bool BrowserBridge::open_terminal_async(ChannelId id, const ExecOptions& options) {
    std::shared_ptr<BridgeChannel> chan = channel(id);
    if (!chan) return false;

    bool queued = pool_.enqueue([this, id, options]() {
        open_terminal(id, options);
    });
    if (!queued) {
        send_error(chan, "server is shutting down", GatewayErrorCode::CONNECTION_LOST);
    }
    return queued;
}

bool BrowserBridge::attach_terminal(ChannelId id, const std::string& session_id) {
    std::shared_ptr<BridgeChannel> chan = channel(id);
    if (!chan || !chan->alive()) return false;

    ExecSession session;
    if (!exec_.get(session_id, session) || session.state != ExecState::READY) {
        send_error(chan, "no such terminal session", GatewayErrorCode::SESSION_CLOSED, session_id);
        return false;
    }
    if (chan->watches(session_id)) return true;

    TapPtr tap = subscribe_terminal(chan, session_id, false);
    Json hello = Json::object();
    hello["sessionId"] = session.id;
    hello["execId"] = session.exec_id;
    tap->release("session", hello);
    return true;
}

bool BrowserBridge::watch_activity(ChannelId id) {
    std::shared_ptr<BridgeChannel> chan = channel(id);
    if (!chan || !chan->alive()) return false;
    if (chan->watching_activity()) return true;
    chan->set_watching_activity(true);

    std::weak_ptr<BridgeChannel> weak = chan;
    EventBus::SubscriptionId sub = bus_.subscribe(EventBus::WILDCARD,
        [weak](const std::string& topic, const Json& payload) {
            std::shared_ptr<BridgeChannel> c = weak.lock();
            if (!c) return;
            if (topic == GatewayConnection::STATUS_TOPIC) {
                c->send("status", payload);
            } else if (!starts_with(topic, "exec:")) {
                Json data = Json::object();
                data["event"] = topic;
                data["payload"] = payload;
                c->send("event", data);
            }
        });
    chan->add_subscription(sub);

    chan->send("status", connection_.status().to_json());
    return true;
}

// ============================================================================
// Browser commands
// ============================================================================

void BrowserBridge::send_error(const std::shared_ptr<BridgeChannel>& chan, const std::string& message,
                               GatewayErrorCode code, const std::string& session_id) {
    Json data = Json::object();
    data["message"] = message;
    data["code"] = gateway_error_str(code);
    if (!session_id.empty()) data["sessionId"] = session_id;
    chan->send("error", data);
}

std::string BrowserBridge::target_session(const std::shared_ptr<BridgeChannel>& chan,
                                          const Json& msg) const {
    std::string sid = json_string_field(msg, "sessionId", "");
    return sid.empty() ? chan->sole_session() : sid;
}

void BrowserBridge::handle_message(ChannelId id, const std::string& text) {
    std::shared_ptr<BridgeChannel> chan = channel(id);
    if (!chan || !chan->alive()) return;
    chan->note_browser_activity();

    Json msg;
    std::string parse_error;
    if (!json_try_parse(text, msg, &parse_error) || !msg.is_object()) {
        send_error(chan, "invalid message");
        return;
    }

    std::string type = json_string_field(msg, "type", "");

    if (type == "open") {
        open_terminal_async(id, parse_exec_options(msg));
    } else if (type == "attach") {
        attach_terminal(id, json_string_field(msg, "sessionId", ""));
    } else if (type == "activity") {
        watch_activity(id);
    } else if (type == "input" || type == "resize" || type == "close") {
        std::string sid = target_session(chan, msg);
        if (sid.empty() || !chan->watches(sid)) {
            send_error(chan, "not attached to that terminal session",
                       GatewayErrorCode::SESSION_CLOSED, sid);
            return;
        }

        if (type == "input") {
            // Sent here so keystrokes keep their order; only the wait for
            // the acknowledgement moves to the pool
            std::shared_ptr<std::future<RpcResult> > pending =
                std::make_shared<std::future<RpcResult> >(
                    exec_.write_async(sid, json_string_field(msg, "data", "")));
            if (pending->wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
                RpcResult r = pending->get();
                if (!r.ok) send_error(chan, r.error, r.code, sid);
                return;
            }
            bool queued = pool_.enqueue([this, chan, sid, pending]() {
                RpcResult r = pending->get();
                if (!r.ok) send_error(chan, r.error, r.code, sid);
            });
            if (!queued) {
                LOG_DEBUG("Input for %s sent without waiting for its acknowledgement", sid.c_str());
            }
        } else if (type == "resize") {
            int cols = msg.contains("cols") && msg["cols"].is_number() ? msg["cols"].get<int>() : 0;
            int rows = msg.contains("rows") && msg["rows"].is_number() ? msg["rows"].get<int>() : 0;
            RpcResult r = exec_.resize(sid, cols, rows);
            if (!r.ok) send_error(chan, r.error, r.code, sid);
        } else if (!pool_.enqueue([this, sid]() { exec_.close(sid, "closed by browser"); })) {
            send_error(chan, "server is shutting down", GatewayErrorCode::CONNECTION_LOST, sid);
        }
    } else if (type == "ping") {
        Json pong = Json::object();
        pong["t"] = current_timestamp_ms();
        chan->send("pong", pong);
    } else if (type == "pong") {
        // answer to our keep-alive; nothing beyond the activity above
    } else {
        send_error(chan, "unknown message type '" + type + "'");
    }
}

// ============================================================================
// Keep-alive and teardown
// ============================================================================

size_t BrowserBridge::poll() {
    std::vector<std::shared_ptr<BridgeChannel> > snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (std::map<ChannelId, std::shared_ptr<BridgeChannel> >::iterator it = channels_.begin();
             it != channels_.end(); ++it) {
            snapshot.push_back(it->second);
        }
    }

    int64_t now = monotonic_ms();
    bool ping = settings_.keepalive_ms > 0 && now - last_ping_ms_ >= settings_.keepalive_ms;
    if (ping) last_ping_ms_ = now;

    std::vector<ChannelId> dead;
    for (size_t i = 0; i < snapshot.size(); ++i) {
        if (ping && snapshot[i]->alive()) {
            Json data = Json::object();
            data["t"] = current_timestamp_ms();
            snapshot[i]->send("ping", data);
        }
        if (!snapshot[i]->alive()) {
            dead.push_back(snapshot[i]->id());
        }
    }

    for (size_t i = 0; i < dead.size(); ++i) {
        disconnect(dead[i], "send failed");
    }
    return dead.size();
}

std::vector<std::string> BrowserBridge::orphans_of(const std::shared_ptr<BridgeChannel>& chan) const {
    std::vector<std::string> orphans;
    std::vector<std::string> owned = chan->owned();
    for (size_t i = 0; i < owned.size(); ++i) {
        if (watcher_count(owned[i]) == 0) {
            orphans.push_back(owned[i]);
        }
    }
    return orphans;
}

void BrowserBridge::close_sessions(const std::vector<std::string>& session_ids,
                                   const std::string& reason) {
    for (size_t i = 0; i < session_ids.size(); ++i) {
        exec_.close(session_ids[i], reason);
    }
}

bool BrowserBridge::disconnect(ChannelId id, const std::string& reason) {
    std::shared_ptr<BridgeChannel> chan;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<ChannelId, std::shared_ptr<BridgeChannel> >::iterator it = channels_.find(id);
        if (it == channels_.end()) return false;
        chan = it->second;
        channels_.erase(it);
    }

    chan->mark_dead();
    std::vector<EventBus::SubscriptionId> subs = chan->take_subscriptions();
    for (size_t i = 0; i < subs.size(); ++i) {
        bus_.unsubscribe(subs[i]);
    }

    LOG_INFO("Bridge channel %llu disconnected (%s)",
             static_cast<unsigned long long>(id), reason.c_str());

    if (!settings_.close_orphaned_sessions) return true;

    std::vector<std::string> orphans = orphans_of(chan);
    if (orphans.empty()) return true;

    // exec.close waits on the gateway; keep it off the caller's thread
    if (!pool_.enqueue([this, orphans]() { close_sessions(orphans, "browser disconnected"); })) {
        close_sessions(orphans, "browser disconnected");
    }
    return true;
}

void BrowserBridge::shutdown() {
    std::map<ChannelId, std::shared_ptr<BridgeChannel> > channels;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channels.swap(channels_);
    }

    std::vector<std::string> orphans;
    for (std::map<ChannelId, std::shared_ptr<BridgeChannel> >::iterator it = channels.begin();
         it != channels.end(); ++it) {
        std::shared_ptr<BridgeChannel> chan = it->second;
        chan->mark_dead();
        std::vector<EventBus::SubscriptionId> subs = chan->take_subscriptions();
        for (size_t i = 0; i < subs.size(); ++i) {
            bus_.unsubscribe(subs[i]);
        }
        if (settings_.close_orphaned_sessions) {
            std::vector<std::string> owned = chan->owned();
            orphans.insert(orphans.end(), owned.begin(), owned.end());
        }
        chan->close_sink();
    }

    close_sessions(orphans, "server shutting down");
}

} // namespace clawsuite
