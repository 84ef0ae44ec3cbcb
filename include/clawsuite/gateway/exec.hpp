#ifndef CLAWSUITE_GATEWAY_EXEC_HPP
#define CLAWSUITE_GATEWAY_EXEC_HPP

#include "connection.hpp"
#include "errors.hpp"
#include "event_bus.hpp"
#include "../core/config.hpp"

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace clawsuite {

enum class ExecState {
    CREATING,
    READY,
    CLOSING,
    CLOSED
};

const char* exec_state_str(ExecState state);

struct ExecSettings {
    int create_timeout_ms;
    int write_timeout_ms;
    int close_timeout_ms;
    std::string default_command;

    ExecSettings()
        : create_timeout_ms(15000)
        , write_timeout_ms(10000)
        , close_timeout_ms(5000)
        , default_command("/bin/zsh") {}

    static ExecSettings from_config(const Config& cfg);
};

// What to run on the gateway side
struct ExecOptions {
    std::vector<std::string> command;
    std::string cwd;
    std::map<std::string, std::string> env;
    int cols;       // 0 = let the gateway decide
    int rows;
    bool pty;

    ExecOptions() : cols(0), rows(0), pty(true) {}

    // Params of the "exec" request; unset fields are omitted
    Json to_params() const;
};

// Snapshot of one session; the manager owns the live record
struct ExecSession {
    std::string id;         // local id, also names the feed topic
    std::string exec_id;    // gateway id, empty until acknowledged
    int64_t created_at;
    ExecState state;
    int pending_writers;

    ExecSession() : created_at(0), state(ExecState::CLOSED), pending_writers(0) {}

    Json to_json() const;
};

struct ExecResult {
    bool ok;
    ExecSession session;
    GatewayErrorCode code;
    std::string error;
    Json error_payload;

    ExecResult() : ok(false), code(GatewayErrorCode::NONE) {}

    static ExecResult success(const ExecSession& session) {
        ExecResult r;
        r.ok = true;
        r.session = session;
        return r;
    }

    static ExecResult fail(GatewayErrorCode code, const std::string& message,
                           const ExecSession& session = ExecSession(),
                           const Json& payload = Json()) {
        ExecResult r;
        r.ok = false;
        r.code = code;
        r.error = message;
        r.session = session;
        r.error_payload = payload;
        return r;
    }
};

// Interactive gateway-side processes (terminals) on top of the shared
// connection.
//
// Each session moves Creating -> Ready -> Closing -> Closed and is gone
// from the table once Closed. Its feed is the bus topic topic_for(id); the
// messages are {"type":"event"|"error"|"close","data":...}. Subscribers
// only see what is published after they subscribe.
//
// When the connection drops every session is closed with reason
// "connection lost". A reconnect never brings a session back.
class ExecSessionManager {
public:
    // Compatibility shim: the gateway has named the exec id differently
    // across versions. Tried in order; the first string or integer wins.
    static const std::vector<std::string>& exec_id_fields();
    static std::string pick_exec_id(const Json& payload);

    static std::string topic_for(const std::string& session_id);

    ExecSessionManager(GatewayConnection& connection, const ExecSettings& settings = ExecSettings());
    ~ExecSessionManager();

    ExecSessionManager(const ExecSessionManager&) = delete;
    ExecSessionManager& operator=(const ExecSessionManager&) = delete;

    // Register a Creating session without any I/O
    ExecSession prepare(const ExecOptions& options);

    // Issue the "exec" request for a prepared session. timeout_ms < 0 uses
    // the configured create timeout. Fails if another start is in flight.
    ExecResult start(const std::string& session_id, int timeout_ms = -1);

    ExecResult create(const ExecOptions& options, int timeout_ms = -1);

    // Ready sessions only; anything else is SESSION_NOT_READY (or
    // SESSION_CLOSED for unknown ids) without touching the connection.
    // Resolves once the gateway acknowledged the write was queued.
    RpcResult write(const std::string& session_id, const std::string& data, int timeout_ms = -1);
    std::future<RpcResult> write_async(const std::string& session_id, const std::string& data);

    // Fire-and-forget; the result only reports whether it was sent
    RpcResult resize(const std::string& session_id, int cols, int rows);

    // Idempotent. False when the session was already gone.
    bool close(const std::string& session_id, const std::string& reason = "closed");

    // Close every session locally (no gateway calls); returns how many
    size_t invalidate_all(const std::string& reason);

    bool get(const std::string& session_id, ExecSession& out) const;
    size_t session_count() const;

private:
    struct Record {
        ExecSession info;
        ExecOptions options;
        bool create_in_flight;

        Record() : create_in_flight(false) {}
    };
    typedef std::shared_ptr<Record> RecordPtr;

    void on_gateway_event(const std::string& topic, const Json& payload);
    void on_status(const Json& status);

    // Drop the record and emit "close" on its feed; no-op once it is gone
    void finish(const std::string& session_id, const std::string& reason);

    // Resolve a session for write/resize; fills `error` otherwise
    RecordPtr ready_record(const std::string& session_id, RpcResult& error) const;

    void emit(const std::string& session_id, const std::string& type, const Json& data);

    GatewayConnection& connection_;
    EventBus& bus_;
    ExecSettings settings_;

    mutable std::mutex mutex_;
    std::map<std::string, RecordPtr> sessions_;
    std::map<std::string, std::string> by_exec_id_;    // exec id -> session id

    EventBus::SubscriptionId event_sub_;
    EventBus::SubscriptionId status_sub_;
};

} // namespace clawsuite

#endif // CLAWSUITE_GATEWAY_EXEC_HPP
