#pragma once

#include "mcprelay/sdk/types.hpp"
#include <string>

namespace mcprelay {
namespace sdk {

/**
 * @brief Messages exchanged between the relay and a bridge over the WebSocket
 *
 * Every frame is one flat JSON object with a "type" tag. Fields that do not
 * belong to a type are neither written nor read.
 */
struct ChannelMessage {
    enum class Type {
        REGISTERED,  // relay -> bridge: {message}
        ERROR,       // relay -> bridge: {message}
        REQUEST,     // relay -> bridge: {requestId, method, params?}
        RESPONSE,    // bridge -> relay: {requestId, result}
        ROTATE_KEY,  // bridge -> relay: {newKeyHash}
        PING,
        PONG,
        UNKNOWN      // anything else; ignored by both sides
    };

    Type type = Type::UNKNOWN;
    std::string type_name;
    std::string message;
    CorrelationId request_id;
    std::string method;
    Json params;   // null when absent
    Json result;
    KeyHash new_key_hash;

    static ChannelMessage registered(const std::string& message);
    static ChannelMessage error(const std::string& message);
    static ChannelMessage request(const CorrelationId& id, const std::string& method, const Json& params);
    static ChannelMessage response(const CorrelationId& id, const Json& result);
    static ChannelMessage rotate_key(const KeyHash& new_key_hash);
    static ChannelMessage ping();
    static ChannelMessage pong();

    /**
     * @brief Serialize to a single JSON text frame
     */
    std::string encode() const;

    /**
     * @brief Parse a text frame
     * @return MALFORMED_MESSAGE if the frame is not a JSON object with a
     *         string "type" or a known type lacks its required fields.
     *         Unrecognized types decode successfully as UNKNOWN.
     */
    static Result<ChannelMessage> decode(const std::string& frame);

    static std::string type_to_string(Type type);
    static Type type_from_string(const std::string& name);
};

} // namespace sdk
} // namespace mcprelay
