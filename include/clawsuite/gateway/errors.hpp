#ifndef CLAWSUITE_GATEWAY_ERRORS_HPP
#define CLAWSUITE_GATEWAY_ERRORS_HPP

#include "../core/json.hpp"
#include <string>

namespace clawsuite {

enum class GatewayErrorCode {
    NONE,
    DECODE_ERROR,         // Malformed frame; dropped, connection survives
    TIMEOUT,              // No response before the deadline
    CONNECTION_LOST,      // Transport closed, heartbeat failed or never connected
    MISSING_CREDENTIALS,  // Neither token nor password configured
    SESSION_NOT_READY,    // Exec call before create completed
    SESSION_CLOSED,       // Exec session closed or unknown
    GATEWAY_ERROR,        // Peer answered ok:false
    INVALID_ARGUMENT
};

const char* gateway_error_str(GatewayErrorCode code);

// Outcome of one RPC. On failure `error` is a readable message and, for
// GATEWAY_ERROR, `error_payload` is the peer's error object untouched.
struct RpcResult {
    bool ok;
    Json result;
    GatewayErrorCode code;
    std::string error;
    Json error_payload;

    RpcResult() : ok(false), code(GatewayErrorCode::NONE) {}

    static RpcResult success(const Json& result) {
        RpcResult r;
        r.ok = true;
        r.result = result;
        return r;
    }

    static RpcResult fail(GatewayErrorCode code, const std::string& message,
                          const Json& payload = Json()) {
        RpcResult r;
        r.ok = false;
        r.code = code;
        r.error = message;
        r.error_payload = payload;
        return r;
    }

    // {"ok":false,"code":...,"error":...} for HTTP replies
    Json to_json() const;
};

// Pull a human readable message out of a gateway error payload
std::string gateway_error_message(const Json& error_payload);

} // namespace clawsuite

#endif // CLAWSUITE_GATEWAY_ERRORS_HPP
