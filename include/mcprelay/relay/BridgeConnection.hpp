#pragma once

#include "mcprelay/sdk/types.hpp"
#include <cstdint>
#include <mutex>
#include <string>

namespace mcprelay {
namespace relay {

/**
 * @brief One live, message-oriented channel from a bridge to the relay
 *
 * The transport tags every connection with the node identity it was accepted
 * for and the fingerprint it is currently registered under. The tags travel
 * with the connection itself, so an actor that lost its tables can re-adopt
 * live connections from the transport directory.
 *
 * send() and close() are asynchronous and may be called from any thread.
 */
class BridgeConnection {
public:
    BridgeConnection(sdk::NodeId node_id, sdk::KeyHash key_tag)
        : node_id_(std::move(node_id)), key_tag_(std::move(key_tag)) {}

    virtual ~BridgeConnection() = default;

    BridgeConnection(const BridgeConnection&) = delete;
    BridgeConnection& operator=(const BridgeConnection&) = delete;

    // Queue a text frame; silently dropped once the connection is closing
    virtual void send(std::string frame) = 0;

    virtual void close(std::uint16_t code, const std::string& reason) = 0;

    // False once closed or once a close has been initiated
    virtual bool is_open() const = 0;

    // Remote endpoint, for log lines
    virtual std::string describe() const = 0;

    const sdk::NodeId& node_id() const { return node_id_; }

    sdk::KeyHash key_tag() const {
        std::lock_guard<std::mutex> lock(tag_mutex_);
        return key_tag_;
    }

    void set_key_tag(const sdk::KeyHash& key_hash) {
        std::lock_guard<std::mutex> lock(tag_mutex_);
        key_tag_ = key_hash;
    }

private:
    const sdk::NodeId node_id_;
    mutable std::mutex tag_mutex_;
    sdk::KeyHash key_tag_;
};

} // namespace relay
} // namespace mcprelay
