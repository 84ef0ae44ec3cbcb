#include <clawsuite/gateway/errors.hpp>

namespace clawsuite {

const char* gateway_error_str(GatewayErrorCode code) {
    switch (code) {
        case GatewayErrorCode::NONE:                return "none";
        case GatewayErrorCode::DECODE_ERROR:        return "decode_error";
        case GatewayErrorCode::TIMEOUT:             return "timeout";
        case GatewayErrorCode::CONNECTION_LOST:     return "connection_lost";
        case GatewayErrorCode::MISSING_CREDENTIALS: return "missing_credentials";
        case GatewayErrorCode::SESSION_NOT_READY:   return "session_not_ready";
        case GatewayErrorCode::SESSION_CLOSED:      return "session_closed";
        case GatewayErrorCode::GATEWAY_ERROR:       return "gateway_error";
        case GatewayErrorCode::INVALID_ARGUMENT:    return "invalid_argument";
    }
    return "unknown";
}

Json RpcResult::to_json() const {
    Json j = Json::object();
    j["ok"] = ok;
    if (ok) {
        j["payload"] = result;
        return j;
    }
    j["code"] = gateway_error_str(code);
    j["error"] = error;
    if (!error_payload.is_null()) {
        j["details"] = error_payload;
    }
    return j;
}

std::string gateway_error_message(const Json& error_payload) {
    if (error_payload.is_string()) {
        return error_payload.get<std::string>();
    }
    if (error_payload.is_object()) {
        std::string message = json_string_field(error_payload, "message");
        if (!message.empty()) return message;
        std::string code = json_string_field(error_payload, "code");
        if (!code.empty()) return code;
    }
    if (error_payload.is_null()) {
        return "gateway error";
    }
    return error_payload.dump();
}

} // namespace clawsuite
