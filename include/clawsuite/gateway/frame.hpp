#ifndef CLAWSUITE_GATEWAY_FRAME_HPP
#define CLAWSUITE_GATEWAY_FRAME_HPP

#include "../core/json.hpp"
#include <string>
#include <vector>

namespace clawsuite {

enum class FrameType {
    REQUEST,   // "req"
    RESPONSE,  // "res"
    EVENT      // "event"
};

const char* frame_type_str(FrameType type);

// One protocol message. Only the members of the active type are meaningful:
//   REQUEST   id, method, params
//   RESPONSE  id, ok, result (ok) or error (!ok)
//   EVENT     topic, payload
struct Frame {
    FrameType type;
    std::string id;
    std::string method;
    Json params;
    bool ok;
    Json result;
    Json error;
    std::string topic;
    Json payload;

    Frame() : type(FrameType::EVENT), ok(false) {}

    static Frame request(const std::string& id, const std::string& method,
                         const Json& params);
    static Frame response_ok(const std::string& id, const Json& result);
    static Frame response_error(const std::string& id, const Json& error);
    static Frame event(const std::string& topic, const Json& payload);
};

struct DecodeResult {
    bool ok;
    Frame frame;
    std::string error;

    DecodeResult() : ok(false) {}

    static DecodeResult success(const Frame& frame) {
        DecodeResult r;
        r.ok = true;
        r.frame = frame;
        return r;
    }

    static DecodeResult fail(const std::string& error) {
        DecodeResult r;
        r.error = error;
        return r;
    }
};

// Newline-delimited JSON frames. decode() never throws.
class FrameCodec {
public:
    static std::string encode(const Frame& frame);
    static Json to_json(const Frame& frame);

    static DecodeResult decode(const std::string& text);
    static DecodeResult from_json(const Json& j);

    // Split a transport message into frame candidates, skipping blank lines
    static std::vector<std::string> split_lines(const std::string& chunk);
};

} // namespace clawsuite

#endif // CLAWSUITE_GATEWAY_FRAME_HPP
