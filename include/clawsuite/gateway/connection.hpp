#ifndef CLAWSUITE_GATEWAY_CONNECTION_HPP
#define CLAWSUITE_GATEWAY_CONNECTION_HPP

#include "backoff.hpp"
#include "errors.hpp"
#include "event_bus.hpp"
#include "rpc.hpp"
#include "transport.hpp"
#include "../core/config.hpp"

#include <atomic>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace clawsuite {

enum class ConnectionState {
    CONNECTING,
    OPEN,
    CLOSING,
    CLOSED
};

const char* connection_state_str(ConnectionState state);

// Where and how to reach the gateway
struct GatewaySettings {
    std::string url;
    std::string token;
    std::string password;

    std::string client_id;
    std::string client_version;
    int min_protocol;
    int max_protocol;

    int connect_timeout_ms;
    int handshake_timeout_ms;
    int request_timeout_ms;     // default for call() when none is given

    std::string heartbeat_method;
    int heartbeat_interval_ms;
    int heartbeat_timeout_ms;

    int64_t backoff_base_ms;
    int64_t backoff_max_ms;
    double backoff_jitter;

    GatewaySettings();

    bool has_credentials() const { return !token.empty() || !password.empty(); }

    // Params of the "connect" handshake request
    Json connect_params() const;

    // gateway.* keys, falling back to CLAWDBOT_GATEWAY_{URL,TOKEN,PASSWORD}
    static GatewaySettings from_config(const Config& cfg);
};

struct ConnectionStatus {
    ConnectionState state;
    int attempt;            // consecutive failed attempts since the last open
    int64_t delay_ms;       // last scheduled reconnect delay
    std::string last_error;
    std::string url;
    bool fatal;             // start() refused; no retries will happen
    uint64_t generation;    // successful opens so far

    ConnectionStatus()
        : state(ConnectionState::CLOSED), attempt(0), delay_ms(0), fatal(false), generation(0) {}

    Json to_json() const;
};

// Owns the one transport connection to the gateway.
//
// A supervisor thread drives Connecting -> Open -> Closed and reconnects
// with exponential backoff. Each generation gets a fresh transport and a
// reader thread; nothing from a previous generation is carried over, and
// every call still pending when a generation ends is rejected with
// CONNECTION_LOST. Every state change is published on STATUS_TOPIC.
//
// This is the only component that touches the transport. Outgoing frames
// are written under one mutex in the order callers reach it.
class GatewayConnection {
public:
    static const char* const STATUS_TOPIC;

    GatewayConnection(const GatewaySettings& settings, TransportFactory factory, EventBus& bus);
    ~GatewayConnection();

    GatewayConnection(const GatewayConnection&) = delete;
    GatewayConnection& operator=(const GatewayConnection&) = delete;

    // Fails (and stays Closed for good) when no credential is configured
    bool start();

    // Close and stop reconnecting; pending calls are rejected
    void stop();

    // Drop the current generation and connect again right away with the
    // backoff reset. False if the connection was never started.
    bool reconnect_now();

    // Swap url/credentials and reconnect (or start, if not running yet)
    bool update_settings(const GatewaySettings& settings);
    GatewaySettings settings() const;

    // timeout_ms < 0 uses settings().request_timeout_ms; 0 waits forever
    RpcResult call(const std::string& method, const Json& params = Json::object(),
                   int timeout_ms = -1);
    std::future<RpcResult> call_async(const std::string& method,
                                      const Json& params = Json::object(),
                                      int timeout_ms = -1);

    ConnectionStatus status() const;
    ConnectionState state() const;

    // Payload of the last successful handshake
    Json hello() const;

    bool wait_for_state(ConnectionState state, int timeout_ms) const;

    // True once a generation newer than `after` is Open
    bool wait_for_open(uint64_t after, int timeout_ms) const;

    EventBus& events() { return bus_; }
    const RpcCorrelator& correlator() const { return correlator_; }

private:
    void supervise();
    bool open_generation(std::string& error);
    void run_open();
    void teardown(ConnectionState final_state, const std::string& reason);
    void reader_loop(Transport* transport);
    void handle_message(const std::string& text);
    void mark_lost(const std::string& reason);

    bool send_frame(const Frame& frame);   // only while Open
    bool write_frame(const Frame& frame);  // any live transport (handshake)

    void set_state(ConnectionState state, const std::string& error = "");
    int resolve_timeout(int timeout_ms) const;

    EventBus& bus_;
    TransportFactory factory_;
    RpcCorrelator correlator_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    GatewaySettings settings_;
    ConnectionStatus status_;
    Backoff backoff_;
    Json hello_;
    bool started_;
    bool stop_requested_;
    bool reconnect_requested_;
    bool lost_;
    std::string lost_reason_;

    std::mutex send_mutex_;
    std::unique_ptr<Transport> transport_;

    std::thread supervisor_;
    std::thread reader_;
};

} // namespace clawsuite

#endif // CLAWSUITE_GATEWAY_CONNECTION_HPP
