#include <clawsuite/http/api.hpp>
#include <clawsuite/core/logger.hpp>
#include <clawsuite/core/utils.hpp>

#include <chrono>

namespace clawsuite {

ApiSettings ApiSettings::from_config(const Config& cfg) {
    ApiSettings s;
    s.port = static_cast<int>(cfg.get_int("bridge.port", s.port));
    s.bind = cfg.get_string("bridge.bind", s.bind);
    s.auth_token = cfg.get_string_env("bridge.auth_token", "CLAWSUITE_AUTH_TOKEN");
    s.input_rate_limit = static_cast<int>(cfg.get_int("bridge.input_rate_limit", s.input_rate_limit));
    s.input_rate_window_s = static_cast<int>(cfg.get_int("bridge.input_rate_window_s",
                                                         s.input_rate_window_s));
    s.reconnect_wait_ms = static_cast<int>(cfg.get_int("bridge.reconnect_wait_ms", s.reconnect_wait_ms));
    return s;
}

ApiResponse ApiResponse::from_rpc(const RpcResult& result) {
    int status = 200;
    switch (result.code) {
        case GatewayErrorCode::NONE:                status = 200; break;
        case GatewayErrorCode::SESSION_CLOSED:      status = 404; break;
        case GatewayErrorCode::SESSION_NOT_READY:   status = 409; break;
        case GatewayErrorCode::INVALID_ARGUMENT:    status = 400; break;
        case GatewayErrorCode::TIMEOUT:             status = 504; break;
        case GatewayErrorCode::GATEWAY_ERROR:       status = 502; break;
        case GatewayErrorCode::DECODE_ERROR:        status = 502; break;
        case GatewayErrorCode::CONNECTION_LOST:
        case GatewayErrorCode::MISSING_CREDENTIALS: status = 503; break;
    }

    ApiResponse r;
    r.status = result.ok ? 200 : status;
    r.body = result.to_json();
    return r;
}

ApiHandlers::ApiHandlers(GatewayConnection& connection, ExecSessionManager& exec,
                         const ApiSettings& settings)
    : connection_(connection)
    , exec_(exec)
    , settings_(settings)
    , input_limiter_(settings.input_rate_limit,
                     static_cast<int64_t>(settings.input_rate_window_s) * 1000) {}

bool ApiHandlers::parse_body(const std::string& body, Json& out) {
    if (trim(body).empty()) {
        out = Json::object();
        return true;
    }
    return json_try_parse(body, out) && out.is_object();
}

// ============================================================================
// Auth and client identity
// ============================================================================

bool ApiHandlers::authorized(const std::string& authorization,
                             const std::string& query_token) const {
    if (settings_.auth_token.empty()) return true;

    std::string header = trim(authorization);
    if (starts_with(to_lower(header), "bearer ")) {
        if (trim(header.substr(7)) == settings_.auth_token) return true;
    }
    return !query_token.empty() && query_token == settings_.auth_token;
}

std::string ApiHandlers::client_address(const std::string& forwarded_for,
                                        const std::string& real_ip,
                                        const std::string& remote) {
    if (!forwarded_for.empty()) {
        std::string first = trim(split(forwarded_for, ',')[0]);
        if (!first.empty()) return first;
    }
    std::string real = trim(real_ip);
    if (!real.empty()) return real;
    return remote.empty() ? "unknown" : remote;
}

// ============================================================================
// Terminal endpoints
// ============================================================================

ApiResponse ApiHandlers::terminal_input(const std::string& client, const std::string& body) {
    RateLimitResult limit = input_limiter_.check("terminal:" + client);
    if (!limit.allowed) {
        LOG_DEBUG("Terminal input from %s rate limited", client.c_str());
        ApiResponse r = ApiResponse::error(429, "Too many requests");
        r.body["retryAfterMs"] = limit.retry_after_ms;
        return r;
    }

    Json req;
    if (!parse_body(body, req)) {
        return ApiResponse::error(400, "invalid JSON body");
    }
    std::string session_id = json_string_field(req, "sessionId", "");
    std::string data = req.contains("data") && req["data"].is_string()
        ? req["data"].get<std::string>() : std::string();

    ExecSession session;
    if (session_id.empty() || !exec_.get(session_id, session)) {
        return ApiResponse::error(404, "terminal session not found");
    }

    // Input is relayed without waiting for the gateway's acknowledgement;
    // only failures known right away are reported
    std::future<RpcResult> pending = exec_.write_async(session_id, data);
    if (pending.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
        RpcResult sent = pending.get();
        if (!sent.ok) return ApiResponse::from_rpc(sent);
    }
    return ApiResponse::ok(Json::object());
}

ApiResponse ApiHandlers::terminal_resize(const std::string& body) {
    Json req;
    if (!parse_body(body, req)) {
        return ApiResponse::error(400, "invalid JSON body");
    }
    std::string session_id = json_string_field(req, "sessionId", "");
    int cols = req.contains("cols") && req["cols"].is_number() ? req["cols"].get<int>() : 0;
    int rows = req.contains("rows") && req["rows"].is_number() ? req["rows"].get<int>() : 0;

    RpcResult r = exec_.resize(session_id, cols, rows);
    return r.ok ? ApiResponse::ok(Json::object()) : ApiResponse::from_rpc(r);
}

ApiResponse ApiHandlers::terminal_close(const std::string& body) {
    Json req;
    if (!parse_body(body, req)) {
        return ApiResponse::error(400, "invalid JSON body");
    }
    std::string session_id = json_string_field(req, "sessionId", "");
    if (session_id.empty()) {
        return ApiResponse::error(400, "sessionId is required");
    }

    Json out = Json::object();
    out["closed"] = exec_.close(session_id, "closed by request");
    return ApiResponse::ok(out);
}

// ============================================================================
// Gateway endpoints
// ============================================================================

ApiResponse ApiHandlers::gateway_status() const {
    Json out = Json::object();
    out["status"] = connection_.status().to_json();
    out["pendingCalls"] = connection_.correlator().pending_count();
    out["sessions"] = exec_.session_count();
    return ApiResponse::ok(out);
}

ApiResponse ApiHandlers::gateway_reconnect() {
    uint64_t before = connection_.status().generation;
    bool requested = connection_.reconnect_now();
    bool open = requested && connection_.wait_for_open(before, settings_.reconnect_wait_ms);

    ConnectionStatus status = connection_.status();
    Json out = Json::object();
    out["ok"] = open;
    out["state"] = status.to_json();
    if (!open) {
        out["error"] = !requested ? "gateway connection is not running"
                     : status.last_error.empty() ? "gateway did not come back in time"
                     : status.last_error;
        ApiResponse r;
        r.status = 503;
        r.body = out;
        return r;
    }
    return ApiResponse::ok(out);
}

bool ApiHandlers::sanitize_value(const Json& value, const std::string& field,
                                 std::string& out, std::string& error) {
    if (!value.is_string()) {
        error = field + " must be a string";
        return false;
    }
    std::string clean = trim(strip_control_chars(value.get<std::string>()));
    if (clean.size() > MAX_CONFIG_VALUE) {
        error = field + " is too long";
        return false;
    }
    out = clean;
    return true;
}

bool ApiHandlers::sanitize_gateway_url(const Json& value, std::string& out, std::string& error) {
    std::string url;
    if (!sanitize_value(value, "url", url, error)) return false;
    if (url.empty()) {
        out = url;
        return true;
    }

    std::string lower = to_lower(url);
    size_t scheme_len = 0;
    if (starts_with(lower, "ws://")) {
        scheme_len = 5;
    } else if (starts_with(lower, "wss://")) {
        scheme_len = 6;
    } else if (lower.find("://") != std::string::npos) {
        error = "Gateway URL must use ws:// or wss://";
        return false;
    } else {
        error = "Invalid gateway URL";
        return false;
    }

    std::string rest = url.substr(scheme_len);
    if (rest.empty() || rest[0] == '/' || rest[0] == ':' ||
        rest.find(' ') != std::string::npos) {
        error = "Invalid gateway URL";
        return false;
    }
    out = url;
    return true;
}

ApiResponse ApiHandlers::gateway_config() const {
    GatewaySettings s = connection_.settings();
    Json out = Json::object();
    out["url"] = s.url;
    out["hasToken"] = !s.token.empty();
    out["hasPassword"] = !s.password.empty();
    return ApiResponse::ok(out);
}

ApiResponse ApiHandlers::update_gateway_config(const std::string& body) {
    Json req;
    if (!parse_body(body, req)) {
        return ApiResponse::error(400, "invalid JSON body");
    }

    GatewaySettings s = connection_.settings();
    std::string error;

    if (req.contains("url")) {
        std::string url;
        if (!sanitize_gateway_url(req["url"], url, error)) {
            return ApiResponse::error(400, error);
        }
        s.url = url.empty() ? GatewaySettings().url : url;
    }
    if (req.contains("token")) {
        if (!sanitize_value(req["token"], "token", s.token, error)) {
            return ApiResponse::error(400, error);
        }
    }
    if (req.contains("password")) {
        if (!sanitize_value(req["password"], "password", s.password, error)) {
            return ApiResponse::error(400, error);
        }
    }

    LOG_INFO("Gateway settings updated via API (url %s)", s.url.c_str());

    uint64_t before = connection_.status().generation;
    bool running = connection_.update_settings(s);
    bool connected = running && connection_.wait_for_open(before, settings_.reconnect_wait_ms);

    Json out = Json::object();
    out["ok"] = true;
    out["connected"] = connected;
    if (!connected) {
        std::string reason = connection_.status().last_error;
        if (reason.empty()) reason = "timed out waiting for the gateway";
        out["error"] = "Config saved but connection failed: " + reason;
    }
    return ApiResponse::ok(out);
}

ApiResponse ApiHandlers::health() const {
    ConnectionStatus status = connection_.status();
    Json out = Json::object();
    out["gateway"] = connection_state_str(status.state);
    out["sessions"] = exec_.session_count();
    out["time"] = current_timestamp_ms();
    return ApiResponse::ok(out);
}

size_t ApiHandlers::cleanup_rate_limits() {
    return input_limiter_.cleanup(static_cast<int64_t>(settings_.input_rate_window_s) * 1000);
}

} // namespace clawsuite
