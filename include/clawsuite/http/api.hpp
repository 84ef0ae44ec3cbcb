#ifndef CLAWSUITE_HTTP_API_HPP
#define CLAWSUITE_HTTP_API_HPP

#include "../core/config.hpp"
#include "../core/json.hpp"
#include "../core/rate_limiter.hpp"
#include "../gateway/connection.hpp"
#include "../gateway/exec.hpp"

#include <string>

namespace clawsuite {

struct ApiSettings {
    int port;
    std::string bind;
    std::string auth_token;         // empty = every request is authenticated
    int input_rate_limit;           // terminal-input requests per window per client
    int input_rate_window_s;
    int reconnect_wait_ms;          // how long reconnect endpoints wait for Open

    ApiSettings()
        : port(3000)
        , bind("127.0.0.1")
        , input_rate_limit(60)
        , input_rate_window_s(60)
        , reconnect_wait_ms(5000) {}

    static ApiSettings from_config(const Config& cfg);
};

// Status code plus JSON body, independent of the HTTP library
struct ApiResponse {
    int status;
    Json body;

    ApiResponse() : status(200), body(Json::object()) {}

    static ApiResponse ok(const Json& body) {
        ApiResponse r;
        r.body = body;
        if (!r.body.contains("ok")) r.body["ok"] = true;
        return r;
    }

    static ApiResponse error(int status, const std::string& message) {
        ApiResponse r;
        r.status = status;
        r.body["ok"] = false;
        r.body["error"] = message;
        return r;
    }

    static ApiResponse from_rpc(const RpcResult& result);
};

// The JSON endpoints of the dashboard server. The Crow layer only moves
// bytes in and out; everything observable lives here.
class ApiHandlers {
public:
    static constexpr size_t MAX_CONFIG_VALUE = 500;

    ApiHandlers(GatewayConnection& connection, ExecSessionManager& exec,
                const ApiSettings& settings = ApiSettings());

    const ApiSettings& settings() const { return settings_; }

    // `Authorization: Bearer <t>` header or `token` query parameter
    bool authorized(const std::string& authorization, const std::string& query_token) const;

    // First X-Forwarded-For entry, else X-Real-IP, else the peer address
    static std::string client_address(const std::string& forwarded_for,
                                      const std::string& real_ip,
                                      const std::string& remote);

    // POST /api/terminal-input {sessionId, data}
    ApiResponse terminal_input(const std::string& client, const std::string& body);

    // POST /api/terminal-resize {sessionId, cols, rows}
    ApiResponse terminal_resize(const std::string& body);

    // POST /api/terminal-close {sessionId}
    ApiResponse terminal_close(const std::string& body);

    // GET /api/gateway/status
    ApiResponse gateway_status() const;

    // POST /api/gateway/reconnect
    ApiResponse gateway_reconnect();

    // GET and POST /api/gateway-config
    ApiResponse gateway_config() const;
    ApiResponse update_gateway_config(const std::string& body);

    // GET /health
    ApiResponse health() const;

    size_t cleanup_rate_limits();

    // Control characters removed, trimmed, at most MAX_CONFIG_VALUE chars
    static bool sanitize_value(const Json& value, const std::string& field,
                               std::string& out, std::string& error);

    // sanitize_value() plus a ws:// or wss:// scheme and a host
    static bool sanitize_gateway_url(const Json& value, std::string& out, std::string& error);

private:
    static bool parse_body(const std::string& body, Json& out);

    GatewayConnection& connection_;
    ExecSessionManager& exec_;
    ApiSettings settings_;
    KeyedRateLimiter input_limiter_;
};

} // namespace clawsuite

#endif // CLAWSUITE_HTTP_API_HPP
