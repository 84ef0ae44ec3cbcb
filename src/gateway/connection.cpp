/*
 * ClawSuite - Gateway connection manager
 *
 * Thread layout per GatewayConnection:
 *   supervisor  connect, handshake, heartbeat, teardown, backoff
 *   reader      one per generation; decodes frames, resolves calls,
 *               publishes events
 * Callers block only their own thread inside call().
 */
#include <clawsuite/gateway/connection.hpp>
#include <clawsuite/core/logger.hpp>
#include <clawsuite/core/utils.hpp>

#include <algorithm>
#include <chrono>

namespace clawsuite {

const char* const GatewayConnection::STATUS_TOPIC = "gateway.status";

static const int READ_SLICE_MS = 200;
static const int MAX_SUPERVISOR_TICK_MS = 250;

const char* connection_state_str(ConnectionState state) {
    switch (state) {
        case ConnectionState::CONNECTING: return "connecting";
        case ConnectionState::OPEN:       return "open";
        case ConnectionState::CLOSING:    return "closing";
        case ConnectionState::CLOSED:     return "closed";
    }
    return "unknown";
}

// ============================================================================
// GatewaySettings
// ============================================================================

GatewaySettings::GatewaySettings()
    : url("ws://127.0.0.1:18789")
    , client_id("clawsuite")
    , client_version("0.3.0")
    , min_protocol(3)
    , max_protocol(3)
    , connect_timeout_ms(10000)
    , handshake_timeout_ms(10000)
    , request_timeout_ms(30000)
    , heartbeat_method("health")
    , heartbeat_interval_ms(30000)
    , heartbeat_timeout_ms(10000)
    , backoff_base_ms(1000)
    , backoff_max_ms(30000)
    , backoff_jitter(0.2) {}

Json GatewaySettings::connect_params() const {
    Json client = Json::object();
    client["id"] = client_id;
    client["displayName"] = "ClawSuite";
    client["version"] = client_version;
    client["platform"] = "linux";
    client["mode"] = "backend";

    Json auth = Json::object();
    if (!token.empty()) auth["token"] = token;
    if (!password.empty()) auth["password"] = password;

    Json params = Json::object();
    params["minProtocol"] = min_protocol;
    params["maxProtocol"] = max_protocol;
    params["client"] = client;
    params["auth"] = auth;
    return params;
}

GatewaySettings GatewaySettings::from_config(const Config& cfg) {
    GatewaySettings s;
    s.url = cfg.get_string_env("gateway.url", "CLAWDBOT_GATEWAY_URL", s.url);
    s.token = cfg.get_string_env("gateway.token", "CLAWDBOT_GATEWAY_TOKEN");
    s.password = cfg.get_string_env("gateway.password", "CLAWDBOT_GATEWAY_PASSWORD");
    s.client_id = cfg.get_string("gateway.client_id", s.client_id);

    s.min_protocol = static_cast<int>(cfg.get_int("gateway.min_protocol", s.min_protocol));
    s.max_protocol = static_cast<int>(cfg.get_int("gateway.max_protocol", s.max_protocol));

    s.connect_timeout_ms = static_cast<int>(cfg.get_int("gateway.connect_timeout_ms", s.connect_timeout_ms));
    s.handshake_timeout_ms = static_cast<int>(cfg.get_int("gateway.handshake_timeout_ms", s.handshake_timeout_ms));
    s.request_timeout_ms = static_cast<int>(cfg.get_int("gateway.request_timeout_ms", s.request_timeout_ms));

    s.heartbeat_method = cfg.get_string("gateway.heartbeat_method", s.heartbeat_method);
    s.heartbeat_interval_ms = static_cast<int>(cfg.get_int("gateway.heartbeat_interval_ms", s.heartbeat_interval_ms));
    s.heartbeat_timeout_ms = static_cast<int>(cfg.get_int("gateway.heartbeat_timeout_ms", s.heartbeat_timeout_ms));

    s.backoff_base_ms = cfg.get_int("gateway.backoff_base_ms", s.backoff_base_ms);
    s.backoff_max_ms = cfg.get_int("gateway.backoff_max_ms", s.backoff_max_ms);
    s.backoff_jitter = cfg.get_double("gateway.backoff_jitter", s.backoff_jitter);
    return s;
}

Json ConnectionStatus::to_json() const {
    Json j = Json::object();
    j["state"] = connection_state_str(state);
    j["attempt"] = attempt;
    j["delayMs"] = delay_ms;
    j["url"] = url;
    j["fatal"] = fatal;
    j["generation"] = generation;
    if (!last_error.empty()) {
        j["lastError"] = last_error;
    }
    return j;
}

// ============================================================================
// Lifecycle
// ============================================================================

GatewayConnection::GatewayConnection(const GatewaySettings& settings,
                                     TransportFactory factory, EventBus& bus)
    : bus_(bus)
    , factory_(factory)
    , settings_(settings)
    , backoff_(settings.backoff_base_ms, settings.backoff_max_ms, settings.backoff_jitter)
    , started_(false)
    , stop_requested_(false)
    , reconnect_requested_(false)
    , lost_(false) {
    status_.url = settings.url;
}

GatewayConnection::~GatewayConnection() {
    stop();
}

bool GatewayConnection::start() {
    ConnectionStatus snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_) return true;

        status_.url = settings_.url;
        if (!settings_.has_credentials()) {
            status_.state = ConnectionState::CLOSED;
            status_.fatal = true;
            status_.last_error = gateway_error_str(GatewayErrorCode::MISSING_CREDENTIALS);
            snapshot = status_;
        } else {
            started_ = true;
            stop_requested_ = false;
            reconnect_requested_ = false;
            status_.fatal = false;
            status_.last_error.clear();
        }
    }

    if (snapshot.fatal) {
        LOG_ERROR("Gateway token or password required (set gateway.token / CLAWDBOT_GATEWAY_TOKEN "
                  "or gateway.password / CLAWDBOT_GATEWAY_PASSWORD); not connecting");
        bus_.publish(STATUS_TOPIC, snapshot.to_json());
        return false;
    }

    LOG_INFO("Gateway connection starting (%s)", settings().url.c_str());
    supervisor_ = std::thread(&GatewayConnection::supervise, this);
    return true;
}

void GatewayConnection::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!started_) return;
        stop_requested_ = true;
    }
    cv_.notify_all();

    // Unblock a handshake or heartbeat the supervisor may be waiting on
    correlator_.fail_all(GatewayErrorCode::CONNECTION_LOST, "gateway connection stopped");
    {
        std::lock_guard<std::mutex> lock(send_mutex_);
        if (transport_) transport_->close();
    }

    if (supervisor_.joinable()) {
        supervisor_.join();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        started_ = false;
    }
    LOG_INFO("Gateway connection stopped");
}

bool GatewayConnection::reconnect_now() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!started_ || stop_requested_) return false;
        reconnect_requested_ = true;
        backoff_.reset();
        status_.attempt = 0;
        status_.delay_ms = 0;
    }
    cv_.notify_all();

    LOG_INFO("Gateway reconnect requested");
    {
        std::lock_guard<std::mutex> lock(send_mutex_);
        if (transport_) transport_->close();
    }
    return true;
}

bool GatewayConnection::update_settings(const GatewaySettings& settings) {
    bool running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_ = settings;
        backoff_ = Backoff(settings.backoff_base_ms, settings.backoff_max_ms, settings.backoff_jitter);
        status_.url = settings.url;
        running = started_;
    }

    if (!settings.has_credentials()) {
        // start() refuses and publishes the fatal status
        if (running) stop();
        return start();
    }
    return running ? reconnect_now() : start();
}

GatewaySettings GatewayConnection::settings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

// ============================================================================
// Supervisor
// ============================================================================

void GatewayConnection::supervise() {
    for (;;) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_requested_) break;
            reconnect_requested_ = false;
            lost_ = false;
            lost_reason_.clear();
        }
        set_state(ConnectionState::CONNECTING);

        std::string error;
        if (open_generation(error)) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                backoff_.reset();
                status_.attempt = 0;
                status_.delay_ms = 0;
                status_.last_error.clear();
                ++status_.generation;
            }
            set_state(ConnectionState::OPEN);
            LOG_INFO("Gateway connection open");

            run_open();

            bool graceful;
            std::string reason;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                graceful = stop_requested_ || reconnect_requested_;
                if (stop_requested_) {
                    reason = "gateway connection stopped";
                } else if (reconnect_requested_) {
                    reason = "reconnect requested";
                } else {
                    reason = lost_reason_.empty() ? "gateway connection lost" : lost_reason_;
                }
            }
            if (graceful) {
                set_state(ConnectionState::CLOSING);
            } else {
                LOG_WARN("Gateway connection lost: %s", reason.c_str());
            }
            teardown(ConnectionState::CLOSED, reason);
        } else {
            LOG_WARN("Gateway connection failed: %s", error.c_str());
            teardown(ConnectionState::CLOSED, error);
        }

        int64_t delay = 0;
        int attempt = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_requested_) break;
            if (reconnect_requested_) continue;
            delay = backoff_.next_delay_ms();
            attempt = backoff_.attempt();
            status_.attempt = attempt;
            status_.delay_ms = delay;
        }
        bus_.publish(STATUS_TOPIC, status().to_json());
        LOG_INFO("Reconnecting to gateway in %lld ms (attempt %d)",
                 static_cast<long long>(delay), attempt);

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(delay), [this] {
            return stop_requested_ || reconnect_requested_;
        });
    }

    set_state(ConnectionState::CLOSED);
}

bool GatewayConnection::open_generation(std::string& error) {
    GatewaySettings s = settings();

    std::unique_ptr<Transport> transport;
    if (factory_) {
        transport = factory_();
    }
    if (!transport) {
        error = "no transport available";
        return false;
    }

    if (!transport->open(s.url, s.connect_timeout_ms, error)) {
        if (error.empty()) error = "failed to open " + s.url;
        return false;
    }

    Transport* raw = transport.get();
    {
        std::lock_guard<std::mutex> lock(send_mutex_);
        transport_ = std::move(transport);
    }
    reader_ = std::thread(&GatewayConnection::reader_loop, this, raw);

    RpcResult hello = correlator_.call("connect", s.connect_params(), s.handshake_timeout_ms,
                                       [this](const Frame& f) { return write_frame(f); });
    if (!hello.ok) {
        error = "handshake failed: " + hello.error;
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (lost_) {
        error = lost_reason_;
        return false;
    }
    hello_ = hello.result;
    return true;
}

void GatewayConnection::run_open() {
    GatewaySettings s = settings();
    int tick_ms = MAX_SUPERVISOR_TICK_MS;
    if (s.heartbeat_interval_ms > 0) {
        tick_ms = std::max(5, std::min(tick_ms, s.heartbeat_interval_ms));
    }
    int64_t next_heartbeat = monotonic_ms() + s.heartbeat_interval_ms;

    for (;;) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, std::chrono::milliseconds(tick_ms), [this] {
                return stop_requested_ || reconnect_requested_ || lost_;
            });
            if (stop_requested_ || reconnect_requested_ || lost_) return;
        }

        int64_t now = monotonic_ms();
        correlator_.expire_overdue(now);

        if (s.heartbeat_interval_ms > 0 && now >= next_heartbeat) {
            RpcResult beat = correlator_.call(s.heartbeat_method, Json::object(),
                                              s.heartbeat_timeout_ms,
                                              [this](const Frame& f) { return send_frame(f); });
            // An error answer still proves the peer is alive
            if (!beat.ok && beat.code != GatewayErrorCode::GATEWAY_ERROR) {
                mark_lost("heartbeat failed: " + beat.error);
                return;
            }
            next_heartbeat = monotonic_ms() + s.heartbeat_interval_ms;
        }
    }
}

void GatewayConnection::teardown(ConnectionState final_state, const std::string& reason) {
    std::unique_ptr<Transport> transport;
    {
        std::lock_guard<std::mutex> lock(send_mutex_);
        transport.swap(transport_);
    }
    if (transport) {
        transport->close();
    }
    if (reader_.joinable()) {
        reader_.join();
    }
    transport.reset();

    correlator_.fail_all(GatewayErrorCode::CONNECTION_LOST,
                         reason.empty() ? "gateway connection lost" : reason);
    set_state(final_state, reason);
}

void GatewayConnection::mark_lost(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!lost_) {
            lost_ = true;
            lost_reason_ = reason;
        }
    }
    cv_.notify_all();
    correlator_.fail_all(GatewayErrorCode::CONNECTION_LOST, reason);
}

// ============================================================================
// Reader
// ============================================================================

void GatewayConnection::reader_loop(Transport* transport) {
    for (;;) {
        std::string message;
        RecvStatus st = transport->receive(message, READ_SLICE_MS);
        if (st == RecvStatus::MESSAGE) {
            handle_message(message);
        } else if (st == RecvStatus::CLOSED) {
            mark_lost("gateway closed the connection");
            return;
        }
    }
}

void GatewayConnection::handle_message(const std::string& text) {
    std::vector<std::string> lines = FrameCodec::split_lines(text);
    for (size_t i = 0; i < lines.size(); ++i) {
        DecodeResult decoded = FrameCodec::decode(lines[i]);
        if (!decoded.ok) {
            LOG_WARN("Dropping malformed gateway frame (%s): %.120s",
                     decoded.error.c_str(), lines[i].c_str());
            continue;
        }

        const Frame& frame = decoded.frame;
        switch (frame.type) {
            case FrameType::RESPONSE:
                correlator_.resolve(frame);
                break;
            case FrameType::EVENT:
                bus_.publish(frame.topic, frame.payload);
                break;
            case FrameType::REQUEST:
                LOG_DEBUG("Ignoring gateway-initiated request '%s'", frame.method.c_str());
                break;
        }
    }
}

// ============================================================================
// Calls
// ============================================================================

bool GatewayConnection::write_frame(const Frame& frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_requested_ || lost_) return false;
    }

    std::string text = FrameCodec::encode(frame);
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (!transport_) return false;
    return transport_->send_text(text);
}

bool GatewayConnection::send_frame(const Frame& frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_.state != ConnectionState::OPEN) return false;
    }
    return write_frame(frame);
}

int GatewayConnection::resolve_timeout(int timeout_ms) const {
    if (timeout_ms >= 0) return timeout_ms;
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_.request_timeout_ms;
}

RpcResult GatewayConnection::call(const std::string& method, const Json& params, int timeout_ms) {
    return correlator_.call(method, params, resolve_timeout(timeout_ms),
                            [this](const Frame& f) { return send_frame(f); });
}

std::future<RpcResult> GatewayConnection::call_async(const std::string& method,
                                                     const Json& params, int timeout_ms) {
    return correlator_.call_async(method, params, resolve_timeout(timeout_ms),
                                  [this](const Frame& f) { return send_frame(f); });
}

// ============================================================================
// Status
// ============================================================================

void GatewayConnection::set_state(ConnectionState state, const std::string& error) {
    ConnectionStatus snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_.state = state;
        if (!error.empty()) {
            status_.last_error = error;
        }
        snapshot = status_;
    }
    cv_.notify_all();
    LOG_DEBUG("Gateway connection state: %s", connection_state_str(state));
    bus_.publish(STATUS_TOPIC, snapshot.to_json());
}

ConnectionStatus GatewayConnection::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

ConnectionState GatewayConnection::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_.state;
}

Json GatewayConnection::hello() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hello_;
}

bool GatewayConnection::wait_for_state(ConnectionState state, int timeout_ms) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this, state] {
        return status_.state == state;
    });
}

bool GatewayConnection::wait_for_open(uint64_t after, int timeout_ms) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this, after] {
        return status_.state == ConnectionState::OPEN && status_.generation > after;
    });
}

} // namespace clawsuite
