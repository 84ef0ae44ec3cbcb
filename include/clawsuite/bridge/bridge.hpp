/*
 * ClawSuite - Browser bridge
 *
 * Turns browser requests (new terminal, attach, activity feed) into
 * gateway work and relays the resulting streams to each tab on its own
 * channel.
 */
#ifndef CLAWSUITE_BRIDGE_BRIDGE_HPP
#define CLAWSUITE_BRIDGE_BRIDGE_HPP

#include "channel.hpp"
#include "../core/config.hpp"
#include "../core/thread_pool.hpp"
#include "../gateway/connection.hpp"
#include "../gateway/exec.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace clawsuite {

struct BridgeSettings {
    int keepalive_ms;               // 0 disables pings
    bool close_orphaned_sessions;   // close a tab's terminals nobody else watches
    size_t max_pending_messages;    // sent since the tab was last heard from; 0 = no limit

    BridgeSettings()
        : keepalive_ms(15000), close_orphaned_sessions(true), max_pending_messages(10000) {}

    static BridgeSettings from_config(const Config& cfg);
};

class BrowserBridge {
public:
    BrowserBridge(GatewayConnection& connection, ExecSessionManager& exec,
                  ThreadPool& pool, const BridgeSettings& settings = BridgeSettings());
    ~BrowserBridge();

    BrowserBridge(const BrowserBridge&) = delete;
    BrowserBridge& operator=(const BrowserBridge&) = delete;

    // Lenient parse of {command, cwd, env, cols, rows}; pty is always on
    static ExecOptions parse_exec_options(const Json& body);

    std::shared_ptr<BridgeChannel> open_channel(const std::shared_ptr<BridgeSink>& sink);
    std::shared_ptr<BridgeChannel> channel(ChannelId id) const;

    // Blocks until the gateway answers. On success the channel gets
    // "session" {sessionId, execId} before any output of the terminal;
    // on failure the terminal's "error"/"close" messages reach it instead.
    ExecResult open_terminal(ChannelId id, const ExecOptions& options);

    // Same, run on the worker pool
    bool open_terminal_async(ChannelId id, const ExecOptions& options);

    // Watch a session another channel opened
    bool attach_terminal(ChannelId id, const std::string& session_id);

    // Every gateway event plus connection status changes
    bool watch_activity(ChannelId id);

    // Browser commands: open, attach, input, resize, close, activity,
    // ping and pong. Every message counts as browser activity.
    void handle_message(ChannelId id, const std::string& text);

    // Keep-alive pings and reaping of dead channels; returns how many
    // channels were reaped
    size_t poll();

    // Browser went away: unsubscribe everything, then close the sessions
    // only this channel was holding (if the policy says so)
    bool disconnect(ChannelId id, const std::string& reason = "browser disconnected");

    // Disconnect every channel; orphans are closed inline
    void shutdown();

    size_t channel_count() const;
    size_t watcher_count(const std::string& session_id) const;

private:
    struct TerminalTap;
    typedef std::shared_ptr<TerminalTap> TapPtr;

    TapPtr subscribe_terminal(const std::shared_ptr<BridgeChannel>& chan,
                              const std::string& session_id, bool owned);

    std::vector<std::string> orphans_of(const std::shared_ptr<BridgeChannel>& chan) const;
    void close_sessions(const std::vector<std::string>& session_ids, const std::string& reason);

    void send_error(const std::shared_ptr<BridgeChannel>& chan, const std::string& message,
                    GatewayErrorCode code = GatewayErrorCode::INVALID_ARGUMENT,
                    const std::string& session_id = "");

    // sessionId from the message, else the channel's only session
    std::string target_session(const std::shared_ptr<BridgeChannel>& chan, const Json& msg) const;

    GatewayConnection& connection_;
    ExecSessionManager& exec_;
    EventBus& bus_;
    ThreadPool& pool_;
    BridgeSettings settings_;

    mutable std::mutex mutex_;
    std::map<ChannelId, std::shared_ptr<BridgeChannel> > channels_;
    ChannelId next_id_;
    int64_t last_ping_ms_;
};

} // namespace clawsuite

#endif // CLAWSUITE_BRIDGE_BRIDGE_HPP
