#include "mcprelay/relay/RelayActor.hpp"
#include "mcprelay/sdk/ChannelMessage.hpp"
#include "mcprelay/sdk/HashService.hpp"
#include "mcprelay/sdk/SecureLogger.hpp"
#include "mcprelay/sdk/constants.hpp"
#include <boost/beast/websocket/rfc6455.hpp>

namespace mcprelay {
namespace relay {

using sdk::ChannelMessage;
using sdk::SecureLogger;

namespace {

const std::uint16_t CLOSE_NORMAL =
    static_cast<std::uint16_t>(boost::beast::websocket::close_code::normal);

} // namespace

RelayActor::RelayActor(net::io_context& ioc, sdk::NodeId node_id, ConnectionLookup lookup,
                       IdleHandler on_idle)
    : strand_(net::make_strand(ioc)),
      node_id_(std::move(node_id)),
      lookup_(std::move(lookup)),
      on_idle_(std::move(on_idle)),
      multiplexer_(std::make_shared<RequestMultiplexer>(strand_)) {
}

void RelayActor::connect(const sdk::KeyHash& key_hash, ConnectionPtr connection) {
    net::post(strand_, [self = shared_from_this(), key_hash, connection = std::move(connection)]() {
        self->do_connect(key_hash, connection);
    });
}

void RelayActor::status(std::optional<sdk::KeyHash> key_hash, StatusHandler handler) {
    net::post(strand_, [self = shared_from_this(), key_hash = std::move(key_hash),
                        handler = std::move(handler)]() {
        const bool online = key_hash ? self->find_connection(*key_hash) != nullptr
                                     : self->has_connection();
        handler(online);
    });
}

void RelayActor::forward(const sdk::KeyHash& key_hash,
                         const std::string& method,
                         sdk::Json params,
                         std::chrono::milliseconds timeout,
                         ForwardHandler handler) {
    net::post(strand_, [self = shared_from_this(), key_hash, method, params = std::move(params),
                        timeout, handler = std::move(handler)]() mutable {
        auto connection = self->find_connection(key_hash);
        if (!connection) {
            handler(sdk::Result<sdk::Json>(sdk::ErrorCode::NOT_CONNECTED));
            return;
        }
        self->send_request(connection, method, params, timeout, std::move(handler));
    });
}

void RelayActor::authorized_forward(const sdk::KeyHash& presented_key_hash,
                                    const std::string& method,
                                    sdk::Json params,
                                    std::chrono::milliseconds timeout,
                                    ForwardHandler handler) {
    net::post(strand_, [self = shared_from_this(), presented_key_hash, method,
                        params = std::move(params), timeout, handler = std::move(handler)]() mutable {
        if (!self->has_connection()) {
            handler(sdk::Result<sdk::Json>(sdk::ErrorCode::NOT_CONNECTED));
            return;
        }

        auto connection = self->match_connection(presented_key_hash);
        if (!connection) {
            SecureLogger::instance().warning("Rejected request for node " +
                                             SecureLogger::redact(self->node_id_) +
                                             ": key does not match any bridge");
            handler(sdk::Result<sdk::Json>(sdk::ErrorCode::UNAUTHORIZED));
            return;
        }

        self->send_request(connection, method, params, timeout, std::move(handler));
    });
}

void RelayActor::on_message(ConnectionPtr connection, std::string frame) {
    net::post(strand_, [self = shared_from_this(), connection = std::move(connection),
                        frame = std::move(frame)]() {
        auto decoded = ChannelMessage::decode(frame);
        if (decoded.is_err()) {
            SecureLogger::instance().warning("Dropping frame from " + connection->describe() +
                                             ": " + decoded.error_detail());
            return;
        }

        const auto& message = decoded.value();
        switch (message.type) {
            case ChannelMessage::Type::RESPONSE:
                if (!self->multiplexer_->resolve(message.request_id, message.result)) {
                    SecureLogger::instance().debug("Ignoring response for unknown request " +
                                                   message.request_id);
                }
                self->update_counters();
                break;

            case ChannelMessage::Type::ROTATE_KEY:
                self->do_rotate(connection, message.new_key_hash);
                break;

            case ChannelMessage::Type::PING:
                connection->send(ChannelMessage::pong().encode());
                break;

            default:
                SecureLogger::instance().debug("Ignoring '" + message.type_name + "' message from " +
                                               connection->describe());
                break;
        }
    });
}

void RelayActor::on_closed(ConnectionPtr connection) {
    net::post(strand_, [self = shared_from_this(), connection = std::move(connection)]() {
        const auto key_hash = self->registry_.fingerprint_of(connection);
        if (self->registry_.remove(connection)) {
            SecureLogger::instance().info("Bridge disconnected for node " +
                                          SecureLogger::redact(self->node_id_) + " (key " +
                                          SecureLogger::redact(key_hash.value_or("")) + ")");
        }
        self->update_counters();
        self->notify_if_idle();
    });
}

void RelayActor::suspend() {
    net::post(strand_, [self = shared_from_this()]() {
        self->registry_.clear();
        self->update_counters();
        SecureLogger::instance().info("Relay state for node " + SecureLogger::redact(self->node_id_) +
                                      " suspended");
    });
}

void RelayActor::do_connect(const sdk::KeyHash& key_hash, const ConnectionPtr& connection) {
    auto existing = registry_.find(key_hash);
    if (existing && existing != connection) {
        registry_.remove(existing);
        existing->close(CLOSE_NORMAL, sdk::constants::CLOSE_REASON_REPLACED);
        SecureLogger::instance().info("Replaced bridge " + existing->describe() + " for node " +
                                      SecureLogger::redact(node_id_));
    }

    registry_.install(key_hash, connection);
    update_counters();

    connection->send(ChannelMessage::registered("Bridge registered successfully").encode());

    SecureLogger::instance().info("Bridge " + connection->describe() + " registered for node " +
                                  SecureLogger::redact(node_id_) + " (key " +
                                  SecureLogger::redact(key_hash) + ")");
}

void RelayActor::do_rotate(const ConnectionPtr& connection, const sdk::KeyHash& new_key_hash) {
    if (new_key_hash.empty()) {
        connection->send(ChannelMessage::error("Missing newKeyHash").encode());
        return;
    }

    auto moved = registry_.move(connection, new_key_hash);
    if (moved.is_err()) {
        SecureLogger::instance().warning("Key rotation from unregistered bridge " + connection->describe() +
                                         ": " + moved.error_detail());
        connection->send(ChannelMessage::error("Failed to rotate key").encode());
        return;
    }

    if (const auto& displaced = moved.value()) {
        displaced->close(CLOSE_NORMAL, sdk::constants::CLOSE_REASON_REPLACED);
    }
    update_counters();

    connection->send(ChannelMessage::registered("Key rotated successfully").encode());

    SecureLogger::instance().info("Bridge " + connection->describe() + " for node " +
                                  SecureLogger::redact(node_id_) + " rotated to key " +
                                  SecureLogger::redact(new_key_hash));
}

RelayActor::ConnectionPtr RelayActor::find_connection(const sdk::KeyHash& key_hash) {
    auto connection = registry_.find(key_hash);
    if (!connection) {
        recover();
        connection = registry_.find(key_hash);
    }
    return connection;
}

RelayActor::ConnectionPtr RelayActor::match_connection(const sdk::KeyHash& presented_key_hash) {
    for (int attempt = 0; attempt < 2; ++attempt) {
        // Every registered fingerprint is compared in full
        ConnectionPtr match;
        for (const auto& key_hash : registry_.fingerprints()) {
            if (sdk::HashService::equals(key_hash, presented_key_hash)) {
                match = registry_.find(key_hash);
            }
        }
        if (match || attempt > 0) {
            return match;
        }
        recover();
    }
    return nullptr;
}

bool RelayActor::has_connection() {
    if (registry_.empty()) {
        recover();
    }
    return !registry_.empty();
}

void RelayActor::recover() {
    if (!lookup_) {
        return;
    }

    const std::size_t adopted = registry_.adopt(lookup_());
    if (adopted > 0) {
        SecureLogger::instance().info("Recovered " + std::to_string(adopted) +
                                      " bridge connection(s) for node " + SecureLogger::redact(node_id_));
        update_counters();
    }
}

void RelayActor::send_request(const ConnectionPtr& connection,
                              const std::string& method,
                              const sdk::Json& params,
                              std::chrono::milliseconds timeout,
                              ForwardHandler handler) {
    std::weak_ptr<RelayActor> weak_self = shared_from_this();
    multiplexer_->dispatch(*connection, method, params, timeout,
        [weak_self, handler = std::move(handler)](sdk::Result<sdk::Json> result) {
            handler(std::move(result));
            if (auto self = weak_self.lock()) {
                self->update_counters();
                self->notify_if_idle();
            }
        });
    update_counters();
}

void RelayActor::update_counters() {
    connection_count_ = registry_.size();
    pending_count_ = multiplexer_->pending();
}

void RelayActor::notify_if_idle() {
    if (on_idle_ && registry_.empty() && multiplexer_->pending() == 0) {
        on_idle_(*this);
    }
}

} // namespace relay
} // namespace mcprelay
