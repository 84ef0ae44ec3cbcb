/*
 * ClawSuite - Gateway frame codec
 *
 * Wire shapes:
 *   {"type":"req",   "id":..., "method":..., "params":{...}}
 *   {"type":"res",   "id":..., "ok":true,  "result":...}
 *   {"type":"res",   "id":..., "ok":false, "error":...}
 *   {"type":"event", "topic":..., "payload":...}
 *
 * Older gateways answer with "payload" instead of "result", name the event
 * topic "event", and may ship the event body as a JSON string in
 * "payloadJSON". All three are accepted on decode; encode always writes
 * the canonical names.
 */
#include <clawsuite/gateway/frame.hpp>
#include <clawsuite/core/utils.hpp>

namespace clawsuite {

const char* frame_type_str(FrameType type) {
    switch (type) {
        case FrameType::REQUEST:  return "req";
        case FrameType::RESPONSE: return "res";
        case FrameType::EVENT:    return "event";
    }
    return "unknown";
}

Frame Frame::request(const std::string& id, const std::string& method,
                     const Json& params) {
    Frame f;
    f.type = FrameType::REQUEST;
    f.id = id;
    f.method = method;
    f.params = params.is_null() ? Json::object() : params;
    return f;
}

Frame Frame::response_ok(const std::string& id, const Json& result) {
    Frame f;
    f.type = FrameType::RESPONSE;
    f.id = id;
    f.ok = true;
    f.result = result;
    return f;
}

Frame Frame::response_error(const std::string& id, const Json& error) {
    Frame f;
    f.type = FrameType::RESPONSE;
    f.id = id;
    f.ok = false;
    f.error = error;
    return f;
}

Frame Frame::event(const std::string& topic, const Json& payload) {
    Frame f;
    f.type = FrameType::EVENT;
    f.topic = topic;
    f.payload = payload;
    return f;
}

// ============================================================================
// Encoding
// ============================================================================

Json FrameCodec::to_json(const Frame& frame) {
    Json j = Json::object();
    j["type"] = frame_type_str(frame.type);

    switch (frame.type) {
        case FrameType::REQUEST:
            j["id"] = frame.id;
            j["method"] = frame.method;
            j["params"] = frame.params.is_null() ? Json::object() : frame.params;
            break;
        case FrameType::RESPONSE:
            j["id"] = frame.id;
            j["ok"] = frame.ok;
            if (frame.ok) {
                j["result"] = frame.result;
            } else {
                j["error"] = frame.error;
            }
            break;
        case FrameType::EVENT:
            j["topic"] = frame.topic;
            j["payload"] = frame.payload;
            break;
    }
    return j;
}

std::string FrameCodec::encode(const Frame& frame) {
    // dump() escapes control characters, so the line never contains a raw '\n'.
    // Invalid UTF-8 in user data is replaced rather than thrown on.
    return to_json(frame).dump(-1, ' ', false, Json::error_handler_t::replace);
}

// ============================================================================
// Decoding
// ============================================================================

static bool read_id(const Json& j, std::string& out) {
    Json::const_iterator it = j.find("id");
    if (it == j.end()) return false;
    if (it->is_string()) {
        out = it->get<std::string>();
        return !out.empty();
    }
    if (it->is_number_integer()) {
        out = std::to_string(it->get<int64_t>());
        return true;
    }
    return false;
}

DecodeResult FrameCodec::from_json(const Json& j) {
    if (!j.is_object()) {
        return DecodeResult::fail("frame is not a JSON object");
    }

    Json::const_iterator type_it = j.find("type");
    if (type_it == j.end()) {
        return DecodeResult::fail("frame has no type");
    }
    if (!type_it->is_string()) {
        return DecodeResult::fail("frame type is not a string");
    }

    std::string type = type_it->get<std::string>();
    Frame f;

    if (type == "req") {
        f.type = FrameType::REQUEST;
        if (!read_id(j, f.id)) {
            return DecodeResult::fail("req frame without a valid id");
        }
        Json::const_iterator m = j.find("method");
        if (m == j.end() || !m->is_string() || m->get<std::string>().empty()) {
            return DecodeResult::fail("req frame without a method");
        }
        f.method = m->get<std::string>();
        Json::const_iterator p = j.find("params");
        f.params = (p == j.end() || p->is_null()) ? Json::object() : *p;
        return DecodeResult::success(f);
    }

    if (type == "res") {
        f.type = FrameType::RESPONSE;
        if (!read_id(j, f.id)) {
            return DecodeResult::fail("res frame without a valid id");
        }
        Json::const_iterator ok = j.find("ok");
        if (ok == j.end() || !ok->is_boolean()) {
            return DecodeResult::fail("res frame without boolean ok");
        }
        f.ok = ok->get<bool>();
        if (f.ok) {
            if (j.contains("result")) {
                f.result = j["result"];
            } else if (j.contains("payload")) {
                f.result = j["payload"];
            }
        } else {
            Json::const_iterator e = j.find("error");
            if (e == j.end() || e->is_null()) {
                Json err = Json::object();
                err["message"] = "gateway returned ok:false without an error";
                f.error = err;
            } else {
                f.error = *e;
            }
        }
        return DecodeResult::success(f);
    }

    if (type == "event") {
        f.type = FrameType::EVENT;
        std::string topic = json_string_field(j, "topic");
        if (topic.empty()) {
            topic = json_string_field(j, "event");
        }
        if (topic.empty()) {
            return DecodeResult::fail("event frame without a topic");
        }
        f.topic = topic;

        if (j.contains("payload")) {
            f.payload = j["payload"];
        } else {
            Json::const_iterator pj = j.find("payloadJSON");
            if (pj != j.end() && pj->is_string()) {
                Json parsed;
                if (json_try_parse(pj->get<std::string>(), parsed)) {
                    f.payload = parsed;
                }
            }
        }
        return DecodeResult::success(f);
    }

    return DecodeResult::fail("unknown frame type '" + type + "'");
}

DecodeResult FrameCodec::decode(const std::string& text) {
    Json j;
    std::string error;
    if (!json_try_parse(text, j, &error)) {
        return DecodeResult::fail("invalid JSON: " + error);
    }
    return from_json(j);
}

std::vector<std::string> FrameCodec::split_lines(const std::string& chunk) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= chunk.size()) {
        size_t end = chunk.find('\n', start);
        if (end == std::string::npos) end = chunk.size();
        std::string line = trim(chunk.substr(start, end - start));
        if (!line.empty()) {
            lines.push_back(line);
        }
        start = end + 1;
    }
    return lines;
}

} // namespace clawsuite
