#include "mcprelay/sdk/ChannelMessage.hpp"

namespace mcprelay {
namespace sdk {

namespace {

bool read_string(const Json& object, const char* key, std::string& out) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return !out.empty();
}

} // namespace

ChannelMessage ChannelMessage::registered(const std::string& message) {
    ChannelMessage msg;
    msg.type = Type::REGISTERED;
    msg.message = message;
    return msg;
}

ChannelMessage ChannelMessage::error(const std::string& message) {
    ChannelMessage msg;
    msg.type = Type::ERROR;
    msg.message = message;
    return msg;
}

ChannelMessage ChannelMessage::request(const CorrelationId& id, const std::string& method, const Json& params) {
    ChannelMessage msg;
    msg.type = Type::REQUEST;
    msg.request_id = id;
    msg.method = method;
    msg.params = params;
    return msg;
}

ChannelMessage ChannelMessage::response(const CorrelationId& id, const Json& result) {
    ChannelMessage msg;
    msg.type = Type::RESPONSE;
    msg.request_id = id;
    msg.result = result;
    return msg;
}

ChannelMessage ChannelMessage::rotate_key(const KeyHash& new_key_hash) {
    ChannelMessage msg;
    msg.type = Type::ROTATE_KEY;
    msg.new_key_hash = new_key_hash;
    return msg;
}

ChannelMessage ChannelMessage::ping() {
    ChannelMessage msg;
    msg.type = Type::PING;
    return msg;
}

ChannelMessage ChannelMessage::pong() {
    ChannelMessage msg;
    msg.type = Type::PONG;
    return msg;
}

std::string ChannelMessage::encode() const {
    Json frame = Json::object();
    frame["type"] = type == Type::UNKNOWN ? type_name : type_to_string(type);

    switch (type) {
        case Type::REGISTERED:
        case Type::ERROR:
            frame["message"] = message;
            break;
        case Type::REQUEST:
            frame["requestId"] = request_id;
            frame["method"] = method;
            if (!params.is_null()) {
                frame["params"] = params;
            }
            break;
        case Type::RESPONSE:
            frame["requestId"] = request_id;
            frame["result"] = result;
            break;
        case Type::ROTATE_KEY:
            frame["newKeyHash"] = new_key_hash;
            break;
        default:
            break;
    }

    // Downstream text is not guaranteed to be valid UTF-8
    return frame.dump(-1, ' ', false, Json::error_handler_t::replace);
}

Result<ChannelMessage> ChannelMessage::decode(const std::string& frame) {
    Json object = Json::parse(frame, nullptr, false);
    if (object.is_discarded() || !object.is_object()) {
        return {ErrorCode::MALFORMED_MESSAGE, "frame is not a JSON object"};
    }

    ChannelMessage msg;
    if (!read_string(object, "type", msg.type_name)) {
        return {ErrorCode::MALFORMED_MESSAGE, "frame has no type"};
    }
    msg.type = type_from_string(msg.type_name);

    switch (msg.type) {
        case Type::REGISTERED:
        case Type::ERROR:
            read_string(object, "message", msg.message);
            break;
        case Type::REQUEST:
            if (!read_string(object, "requestId", msg.request_id) ||
                !read_string(object, "method", msg.method)) {
                return {ErrorCode::MALFORMED_MESSAGE, "request without requestId or method"};
            }
            if (object.contains("params")) {
                msg.params = object["params"];
            }
            break;
        case Type::RESPONSE:
            if (!read_string(object, "requestId", msg.request_id)) {
                return {ErrorCode::MALFORMED_MESSAGE, "response without requestId"};
            }
            if (object.contains("result")) {
                msg.result = object["result"];
            }
            break;
        case Type::ROTATE_KEY:
            // A missing key is answered by the relay, not dropped here
            read_string(object, "newKeyHash", msg.new_key_hash);
            break;
        default:
            break;
    }

    return msg;
}

std::string ChannelMessage::type_to_string(Type type) {
    switch (type) {
        case Type::REGISTERED: return "registered";
        case Type::ERROR: return "error";
        case Type::REQUEST: return "request";
        case Type::RESPONSE: return "response";
        case Type::ROTATE_KEY: return "rotate_key";
        case Type::PING: return "ping";
        case Type::PONG: return "pong";
        default: return "unknown";
    }
}

ChannelMessage::Type ChannelMessage::type_from_string(const std::string& name) {
    if (name == "registered") return Type::REGISTERED;
    if (name == "error") return Type::ERROR;
    if (name == "request") return Type::REQUEST;
    if (name == "response") return Type::RESPONSE;
    if (name == "rotate_key" || name == "rotate-key") return Type::ROTATE_KEY;
    if (name == "ping") return Type::PING;
    if (name == "pong") return Type::PONG;
    return Type::UNKNOWN;
}

} // namespace sdk
} // namespace mcprelay
