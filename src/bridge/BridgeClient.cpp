#include "mcprelay/bridge/BridgeClient.hpp"
#include "mcprelay/sdk/HttpClient.hpp"
#include "mcprelay/sdk/SecureLogger.hpp"
#include "mcprelay/sdk/version.hpp"
#include <future>

namespace mcprelay {
namespace bridge {

using sdk::ChannelMessage;
using sdk::ErrorCode;
using sdk::Json;
using sdk::SecureLogger;

BridgeClient::BridgeClient(BridgeConfig config, std::shared_ptr<ProtocolAdapter> adapter)
    : BridgeClient(std::move(config), std::move(adapter), Options()) {
}

BridgeClient::Channel::Channel(net::io_context& ioc, ssl::context* tls) {
    if (tls) {
        secure = std::make_unique<SecureStream>(ioc, *tls);
    } else {
        plain = std::make_unique<PlainStream>(ioc);
    }
}

beast::tcp_stream& BridgeClient::Channel::tcp() {
    return secure ? beast::get_lowest_layer(*secure) : beast::get_lowest_layer(*plain);
}

BridgeClient::BridgeClient(BridgeConfig config, std::shared_ptr<ProtocolAdapter> adapter, Options options)
    : tls_context_(ssl::context::tls_client),
      work_(net::make_work_guard(ioc_)),
      resolver_(ioc_),
      reconnect_timer_(ioc_),
      ping_timer_(ioc_),
      config_(std::move(config)),
      adapter_(std::move(adapter)),
      options_(options),
      workers_(std::make_unique<sdk::ThreadPool>(options.worker_threads, "bridge")) {
    if (!adapter_) {
        throw std::invalid_argument("BridgeClient requires a protocol adapter");
    }

    beast::error_code ec;
    tls_context_.set_default_verify_paths(ec);
    if (ec) {
        SecureLogger::instance().warning("Cannot load system CA certificates: " + ec.message());
    }
    tls_context_.set_verify_mode(ssl::verify_peer);
}

BridgeClient::~BridgeClient() {
    stop();
    workers_.reset();
}

sdk::Result<void> BridgeClient::start() {
    if (state_ == State::STOPPED || started_.exchange(true)) {
        return {ErrorCode::INVALID_STATE, "Bridge client was already started"};
    }

    BridgeConfig config;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config = config_;
    }

    auto url = config.bridge_url();
    if (url.is_err()) {
        started_ = false;
        return {url.error(), url.error_detail()};
    }
    auto parsed = sdk::Url::parse(url.value());
    if (parsed.is_err()) {
        started_ = false;
        return {ErrorCode::CONFIG_ERROR, parsed.error_detail()};
    }

    SecureLogger::instance().info("Initializing local MCP session at " + config.pieces_endpoint);
    auto init = adapter_->initialize();
    if (init.is_err()) {
        SecureLogger::instance().warning("Failed to initialize MCP (" + init.error_detail() +
                                         "); will retry when requests arrive");
    }

    io_thread_ = std::thread([this] {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            SecureLogger::instance().error("Exception in bridge I/O thread: " + std::string(e.what()));
        }
    });

    net::post(ioc_, [this] { do_connect(); });
    return {};
}

void BridgeClient::stop() {
    if (!io_thread_.joinable()) {
        state_ = State::STOPPED;
        return;
    }

    net::post(ioc_, [this] { shutdown(); });

    if (io_thread_.get_id() == std::this_thread::get_id()) {
        io_thread_.detach();
        return;
    }
    io_thread_.join();

    SecureLogger::instance().info("Bridge stopped");
}

sdk::Result<void> BridgeClient::rotate_key(const sdk::KeyHash& new_key_hash) {
    if (new_key_hash.empty()) {
        return {ErrorCode::INVALID_PARAMETER, "New key hash is empty"};
    }
    if (state_ != State::CONNECTED || !io_thread_.joinable() ||
        io_thread_.get_id() == std::this_thread::get_id()) {
        return {ErrorCode::INVALID_STATE, "Bridge is not connected"};
    }

    auto outcome = std::make_shared<std::promise<sdk::Result<void>>>();
    auto future = outcome->get_future();

    net::post(ioc_, [this, outcome, new_key_hash] {
        if (state_ != State::CONNECTED || !channel_) {
            outcome->set_value(sdk::Result<void>(ErrorCode::INVALID_STATE, "Bridge is not connected"));
            return;
        }

        write(channel_, ChannelMessage::rotate_key(new_key_hash).encode());
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            config_.key_hash = new_key_hash;
        }
        outcome->set_value(sdk::Result<void>());
    });

    // The I/O thread may be shutting down concurrently
    if (future.wait_for(sdk::constants::CONNECTION_TIMEOUT) != std::future_status::ready) {
        return {ErrorCode::INVALID_STATE, "Bridge is not running"};
    }

    auto result = future.get();
    if (result.is_err()) {
        return result;
    }

    SecureLogger::instance().info("Rotating key to " + SecureLogger::redact(new_key_hash));

    KeyChangeListener listener;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        listener = key_listener_;
    }
    if (listener) {
        listener(new_key_hash);
    }
    return result;
}

sdk::KeyHash BridgeClient::key_hash() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_.key_hash;
}

void BridgeClient::set_key_change_listener(KeyChangeListener listener) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    key_listener_ = std::move(listener);
}

std::string BridgeClient::state_to_string(State state) {
    switch (state) {
        case State::DISCONNECTED: return "disconnected";
        case State::CONNECTING: return "connecting";
        case State::CONNECTED: return "connected";
        case State::STOPPED: return "stopped";
        default: return "unknown";
    }
}

void BridgeClient::do_connect() {
    // Never start a second attempt next to a live one
    if (state_ != State::DISCONNECTED) {
        return;
    }

    BridgeConfig config;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config = config_;
    }

    auto url = config.bridge_url();
    auto parsed = url.is_ok() ? sdk::Url::parse(url.value()) : sdk::Result<sdk::Url>(url.error(), url.error_detail());
    if (parsed.is_err()) {
        SecureLogger::instance().error("Cannot build relay URL: " + parsed.error_detail());
        schedule_reconnect();
        return;
    }
    const sdk::Url target = parsed.value();

    state_ = State::CONNECTING;
    registered_ = false;

    auto channel = std::make_shared<Channel>(ioc_, target.is_secure() ? &tls_context_ : nullptr);
    channel_ = channel;

    SecureLogger::instance().info("Connecting to relay " + target.host_header() + " as node " +
                                  SecureLogger::redact(config.node_id) + (target.is_secure() ? " over TLS" : ""));

    resolver_.async_resolve(target.host, std::to_string(target.port),
        [this, channel, target](beast::error_code ec, tcp::resolver::results_type results) {
            if (channel != channel_) {
                return;
            }
            if (ec) {
                on_disconnected(channel, "cannot resolve " + target.host + ": " + ec.message());
                return;
            }

            // Bounds the TCP connect and, for wss, the TLS handshake
            channel->tcp().expires_after(sdk::constants::CONNECTION_TIMEOUT);
            channel->tcp().async_connect(results,
                [this, channel, target](beast::error_code ec, const tcp::endpoint&) {
                    if (channel != channel_) {
                        return;
                    }
                    if (ec) {
                        on_disconnected(channel, "cannot connect: " + ec.message());
                        return;
                    }
                    on_tcp_connected(channel, target);
                });
        });
}

void BridgeClient::on_tcp_connected(const ChannelPtr& channel, const sdk::Url& target) {
    if (!channel->secure) {
        do_ws_handshake(channel, target);
        return;
    }

    auto& tls = channel->secure->next_layer();
    if (!SSL_set_tlsext_host_name(tls.native_handle(), target.host.c_str())) {
        on_disconnected(channel, "cannot set TLS server name for " + target.host);
        return;
    }
    tls.set_verify_callback(ssl::host_name_verification(target.host));

    tls.async_handshake(ssl::stream_base::client,
        [this, channel, target](beast::error_code ec) {
            if (channel != channel_) {
                return;
            }
            if (ec) {
                on_disconnected(channel, "TLS handshake failed: " + ec.message());
                return;
            }
            do_ws_handshake(channel, target);
        });
}

void BridgeClient::do_ws_handshake(const ChannelPtr& channel, const sdk::Url& target) {
    // The websocket stream manages its own timeouts from here on
    channel->tcp().expires_never();

    channel->visit([this, channel, &target](auto& ws) {
        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws.set_option(websocket::stream_base::decorator(
            [](websocket::request_type& req) {
                req.set(beast::http::field::user_agent,
                        sdk::constants::BRIDGE_CLIENT_NAME + "/" + Version::str);
            }));
        ws.read_message_max(sdk::constants::MAX_MESSAGE_SIZE);

        ws.async_handshake(target.host_header(), target.target,
            [this, channel](beast::error_code ec) {
                if (channel != channel_) {
                    return;
                }
                if (ec) {
                    on_disconnected(channel, "handshake failed: " + ec.message());
                    return;
                }
                on_connected(channel);
            });
    });
}

void BridgeClient::on_connected(const ChannelPtr& channel) {
    state_ = State::CONNECTED;
    reconnect_timer_.cancel();

    SecureLogger::instance().info("Connected to relay");

    schedule_ping(channel);
    do_read(channel);
}

void BridgeClient::do_read(const ChannelPtr& channel) {
    channel->visit([this, channel](auto& ws) {
        ws.async_read(channel->buffer,
            [this, channel, &ws](beast::error_code ec, std::size_t) {
                if (channel != channel_) {
                    return;
                }
                if (ec) {
                    if (ec == websocket::error::closed) {
                        const auto& reason = ws.reason();
                        on_disconnected(channel, "closed by relay (" + std::to_string(reason.code) + ": " +
                                                 std::string(reason.reason.data(), reason.reason.size()) + ")");
                    } else {
                        on_disconnected(channel, ec.message());
                    }
                    return;
                }

                const std::string frame = beast::buffers_to_string(channel->buffer.data());
                channel->buffer.consume(channel->buffer.size());

                handle_frame(channel, frame);
                do_read(channel);
            });
    });
}

void BridgeClient::handle_frame(const ChannelPtr& channel, const std::string& frame) {
    auto decoded = ChannelMessage::decode(frame);
    if (decoded.is_err()) {
        SecureLogger::instance().warning("Failed to handle relay message: " + decoded.error_detail());
        return;
    }

    const auto& message = decoded.value();
    switch (message.type) {
        case ChannelMessage::Type::REGISTERED:
            registered_ = true;
            SecureLogger::instance().info(message.message.empty() ? "Registered with relay" : message.message);
            break;

        case ChannelMessage::Type::ERROR:
            SecureLogger::instance().error("Relay error: " + message.message);
            break;

        case ChannelMessage::Type::REQUEST:
            handle_request(message);
            break;

        case ChannelMessage::Type::PING:
            write(channel, ChannelMessage::pong().encode());
            break;

        case ChannelMessage::Type::PONG:
            SecureLogger::instance().trace("Pong from relay");
            break;

        default:
            SecureLogger::instance().debug("Ignoring '" + message.type_name + "' message from relay");
            break;
    }
}

void BridgeClient::handle_request(ChannelMessage request) {
    SecureLogger::instance().info("Request " + request.request_id + ": " + request.method);

    auto task = [this, request]() {
        std::string frame;
        try {
            auto result = adapter_->invoke(request.method, request.params);

            Json payload;
            if (result.is_ok()) {
                payload = result.value();
            } else {
                SecureLogger::instance().warning("Request " + request.request_id + " failed: " +
                                                 result.error_message());
                payload = {{"error", result.error_detail()}};
            }
            frame = ChannelMessage::response(request.request_id, payload).encode();
        } catch (const std::exception& e) {
            // The relay is still waiting on this id; answer rather than let it time out
            SecureLogger::instance().error("Request " + request.request_id + " raised: " + e.what());
            frame = ChannelMessage::response(request.request_id, {{"error", std::string(e.what())}}).encode();
        }

        net::post(ioc_, [this, frame = std::move(frame), id = request.request_id]() mutable {
            // The relay matches by id, so any live connection of this node will do
            if (!channel_ || state_ != State::CONNECTED) {
                SecureLogger::instance().warning("Dropping response " + id + ": not connected");
                return;
            }
            write(channel_, std::move(frame));
        });
    };

    try {
        workers_->enqueue(std::move(task));
    } catch (const std::runtime_error& e) {
        SecureLogger::instance().error("Cannot schedule request " + request.request_id + ": " + e.what());
        write(channel_, ChannelMessage::response(request.request_id,
                                                 {{"error", "Bridge is shutting down"}}).encode());
    }
}

void BridgeClient::write(const ChannelPtr& channel, std::string frame) {
    channel->outbox.push_back(std::move(frame));
    if (channel->outbox.size() == 1) {
        do_write(channel);
    }
}

void BridgeClient::do_write(const ChannelPtr& channel) {
    channel->visit([this, channel](auto& ws) {
        ws.text(true);
        ws.async_write(net::buffer(channel->outbox.front()),
            [this, channel](beast::error_code ec, std::size_t) {
                if (ec) {
                    SecureLogger::instance().debug("WebSocket write failed: " + ec.message());
                    channel->outbox.clear();
                    return;
                }

                channel->outbox.pop_front();
                if (!channel->outbox.empty()) {
                    do_write(channel);
                }
            });
    });
}

void BridgeClient::on_disconnected(const ChannelPtr& channel, const std::string& why) {
    if (channel != channel_) {
        return;
    }

    channel_.reset();
    ping_timer_.cancel();
    registered_ = false;

    if (state_ == State::STOPPED) {
        return;
    }

    state_ = State::DISCONNECTED;
    SecureLogger::instance().warning("Disconnected from relay: " + why);
    schedule_reconnect();
}

void BridgeClient::schedule_reconnect() {
    if (state_ == State::STOPPED) {
        return;
    }

    SecureLogger::instance().info("Reconnecting in " + std::to_string(options_.reconnect_delay.count()) + "ms");

    reconnect_timer_.expires_after(options_.reconnect_delay);
    reconnect_timer_.async_wait([this](beast::error_code ec) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        if (state_ == State::DISCONNECTED) {
            do_connect();
        }
    });
}

void BridgeClient::schedule_ping(const ChannelPtr& channel) {
    ping_timer_.expires_after(options_.ping_interval);
    ping_timer_.async_wait([this, channel](beast::error_code ec) {
        if (ec || channel != channel_ || state_ != State::CONNECTED) {
            return;
        }
        write(channel, ChannelMessage::ping().encode());
        schedule_ping(channel);
    });
}

void BridgeClient::shutdown() {
    const State previous = state_.exchange(State::STOPPED);
    registered_ = false;

    reconnect_timer_.cancel();
    ping_timer_.cancel();
    resolver_.cancel();

    if (channel_) {
        auto channel = channel_;
        if (previous == State::CONNECTED) {
            channel->visit([channel](auto& ws) {
                ws.async_close(
                    websocket::close_reason(websocket::close_code::normal, sdk::constants::CLOSE_REASON_STOPPED),
                    [channel](beast::error_code ec) {
                        if (ec) {
                            SecureLogger::instance().debug("WebSocket close failed: " + ec.message());
                        }
                    });
            });
        } else {
            channel->tcp().cancel();
        }
    }

    // Let run() return once the close handshake and pending handlers finish
    work_.reset();
}

} // namespace bridge
} // namespace mcprelay
