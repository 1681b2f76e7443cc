#include "mcprelay/relay/HTTPServer.hpp"
#include "mcprelay/sdk/SecureLogger.hpp"
#include "mcprelay/sdk/constants.hpp"
#include "mcprelay/sdk/version.hpp"
#include <stdexcept>

namespace mcprelay {
namespace relay {

using sdk::SecureLogger;

namespace {

std::string endpoint_string(const tcp::socket& socket) {
    beast::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace

HTTPServer::HTTPServer(const RelayConfig& config, std::shared_ptr<sdk::HashService> hasher)
    : config_(config), hasher_(std::move(hasher)) {
    if (!hasher_) {
        throw std::invalid_argument("HTTPServer requires a hash service");
    }

    // Initialize io_context
    ioc_ = std::make_unique<net::io_context>(static_cast<int>(config_.io_threads));
    hub_ = std::make_unique<RelayHub>(*ioc_);
    router_ = std::make_unique<ApiRouter>(*hub_, *hasher_,
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.forward_timeout));
}

HTTPServer::~HTTPServer() {
    stop();
}

void HTTPServer::start() {
    if (running_) {
        SecureLogger::instance().warning("HTTP server already running");
        return;
    }

    try {
        running_ = true;

        // Create and launch the listener
        auto endpoint = tcp::endpoint(net::ip::make_address(config_.bind_address), config_.port);
        listener_ = std::make_shared<Listener>(*ioc_, endpoint, *hub_, *router_);
        bound_port_ = listener_->port();
        listener_->start();

        // Run the I/O service on multiple threads
        threads_.reserve(config_.io_threads);
        for (std::size_t i = 0; i < config_.io_threads; ++i) {
            threads_.emplace_back([this] {
                try {
                    ioc_->run();
                } catch (const std::exception& e) {
                    SecureLogger::instance().error("Exception in HTTP server thread: " + std::string(e.what()));
                }
            });
        }

        SecureLogger::instance().info("HTTP server started on " + config_.bind_address + ":" +
                                      std::to_string(bound_port_) + " with " +
                                      std::to_string(config_.io_threads) + " I/O threads");

    } catch (const std::exception& e) {
        SecureLogger::instance().error("Failed to start HTTP server: " + std::string(e.what()));
        running_ = false;
        throw;
    }
}

void HTTPServer::stop() {
    if (!running_) {
        return;
    }

    running_ = false;

    // Stop the io_context
    ioc_->stop();

    // Join all threads
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    threads_.clear();
    listener_.reset();

    SecureLogger::instance().info("HTTP server stopped");
}

// Listener implementation
HTTPServer::Listener::Listener(net::io_context& ioc, tcp::endpoint endpoint, RelayHub& hub, const ApiRouter& router)
    : ioc_(ioc), acceptor_(ioc), hub_(hub), router_(router) {

    beast::error_code ec;

    // Open the acceptor
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        SecureLogger::instance().error("Failed to open acceptor: " + ec.message());
        throw std::runtime_error("Failed to open acceptor: " + ec.message());
    }

    // Allow address reuse
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        SecureLogger::instance().error("Failed to set reuse_address option: " + ec.message());
        throw std::runtime_error("Failed to set reuse_address option: " + ec.message());
    }

    // Bind to the server address
    acceptor_.bind(endpoint, ec);
    if (ec) {
        SecureLogger::instance().error("Failed to bind acceptor: " + ec.message());
        throw std::runtime_error("Failed to bind acceptor: " + ec.message());
    }

    // Start listening for connections
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        SecureLogger::instance().error("Failed to start listening: " + ec.message());
        throw std::runtime_error("Failed to start listening: " + ec.message());
    }
}

void HTTPServer::Listener::start() {
    do_accept();
}

void HTTPServer::Listener::do_accept() {
    // The new connection gets its own strand
    acceptor_.async_accept(
        net::make_strand(ioc_),
        beast::bind_front_handler(
            &Listener::on_accept,
            shared_from_this()));
}

void HTTPServer::Listener::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        SecureLogger::instance().error("Accept error: " + ec.message());
    } else {
        std::make_shared<HTTPSession>(std::move(socket), hub_, router_)->start();
    }

    // Accept another connection
    do_accept();
}

// HTTPSession implementation
HTTPServer::HTTPSession::HTTPSession(tcp::socket&& socket, RelayHub& hub, const ApiRouter& router)
    : stream_(std::move(socket)), hub_(hub), router_(router) {
}

void HTTPServer::HTTPSession::start() {
    // Start reading a request
    do_read();
}

void HTTPServer::HTTPSession::do_read() {
    // Make the request empty before reading
    req_ = {};

    // Set the timeout
    stream_.expires_after(sdk::constants::HTTP_READ_TIMEOUT);

    // Read a request
    http::async_read(stream_, buffer_, req_,
        [self = shared_from_this()](beast::error_code ec, std::size_t) {
            if (ec == http::error::end_of_stream) {
                beast::error_code shutdown_ec;
                self->stream_.socket().shutdown(tcp::socket::shutdown_send, shutdown_ec);
                return;
            }
            if (ec) {
                if (ec != beast::error::timeout) {
                    SecureLogger::instance().debug("HTTP read error: " + ec.message());
                }
                return;
            }

            // Process the request
            self->process_request();
        });
}

void HTTPServer::HTTPSession::process_request() {
    const std::string target(req_.target().data(), req_.target().size());

    // Bridge connections leave the HTTP session for a WebSocket session
    if (websocket::is_upgrade(req_) && ApiRouter::path_of(target) == sdk::constants::BRIDGE_WS_PATH) {
        if (auto bridge = ApiRouter::bridge_target(target)) {
            stream_.expires_never();
            std::make_shared<WebSocketSession>(stream_.release_socket(), hub_, std::move(*bridge))
                ->start(std::move(req_));
            return;
        }
    }

    // No read is outstanding while the router works, so nothing times out
    stream_.expires_never();

    auto self = shared_from_this();
    router_.handle(req_, [self](ApiRouter::Response res) {
        // Responses may come from an actor strand; hop back to ours
        net::post(self->stream_.get_executor(),
                  [self, res = std::move(res)]() mutable { self->do_write(std::move(res)); });
    });
}

void HTTPServer::HTTPSession::do_write(ApiRouter::Response res) {
    res_ = std::move(res);

    stream_.expires_after(sdk::constants::HTTP_READ_TIMEOUT);

    // Write the response
    http::async_write(stream_, res_,
        [self = shared_from_this()](beast::error_code ec, std::size_t) {
            if (ec) {
                SecureLogger::instance().error("HTTP write error: " + ec.message());
                return;
            }

            // If we aren't keeping the connection alive, close it
            if (!self->res_.keep_alive()) {
                beast::error_code shutdown_ec;
                self->stream_.socket().shutdown(tcp::socket::shutdown_send, shutdown_ec);
                return;
            }

            // Read another request
            self->do_read();
        });
}

// WebSocketSession implementation
HTTPServer::WebSocketSession::WebSocketSession(tcp::socket&& socket, RelayHub& hub, BridgeTarget target)
    : BridgeConnection(std::move(target.node_id), std::move(target.key_hash)),
      ws_(std::move(socket)),
      hub_(hub) {
    remote_ = endpoint_string(beast::get_lowest_layer(ws_).socket());
}

void HTTPServer::WebSocketSession::start(ApiRouter::Request req) {
    // Set suggested timeout settings for the websocket
    ws_.set_option(
        websocket::stream_base::timeout::suggested(
            beast::role_type::server));

    // Set a decorator to change the Server of the handshake
    ws_.set_option(websocket::stream_base::decorator(
        [](websocket::response_type& res) {
            res.set(http::field::server,
                sdk::constants::SERVER_NAME + "/" + Version::str);
        }));

    ws_.read_message_max(sdk::constants::MAX_MESSAGE_SIZE);

    // Accept the websocket handshake
    ws_.async_accept(
        req,
        beast::bind_front_handler(
            &WebSocketSession::on_accept,
            shared_from_this()));
}

void HTTPServer::WebSocketSession::on_accept(beast::error_code ec) {
    if (ec) {
        SecureLogger::instance().warning("WebSocket accept error from " + remote_ + ": " + ec.message());
        return;
    }

    open_ = true;
    actor_ = hub_.attach(shared_from_this());

    SecureLogger::instance().info("Bridge connection from " + remote_ + " for node " +
                                  SecureLogger::redact(node_id()));

    do_read();
}

void HTTPServer::WebSocketSession::do_read() {
    ws_.async_read(
        buffer_,
        [self = shared_from_this()](beast::error_code ec, std::size_t) {
            if (ec) {
                if (ec == websocket::error::closed) {
                    self->finish("closed by peer");
                } else {
                    self->finish(ec.message());
                }
                return;
            }

            std::string frame = beast::buffers_to_string(self->buffer_.data());
            self->buffer_.consume(self->buffer_.size());

            self->actor_->on_message(self, std::move(frame));

            // Read another message
            self->do_read();
        });
}

void HTTPServer::WebSocketSession::send(std::string frame) {
    net::post(ws_.get_executor(),
        [self = shared_from_this(), frame = std::move(frame)]() mutable {
            if (!self->is_open()) {
                return;
            }
            self->queue_.push_back(std::move(frame));
            if (self->queue_.size() == 1) {
                self->do_write();
            }
        });
}

void HTTPServer::WebSocketSession::do_write() {
    ws_.text(true);
    ws_.async_write(
        net::buffer(queue_.front()),
        [self = shared_from_this()](beast::error_code ec, std::size_t) {
            if (ec) {
                SecureLogger::instance().debug("WebSocket write error to " + self->remote_ + ": " + ec.message());
                self->queue_.clear();
                return;
            }

            self->queue_.pop_front();
            if (!self->queue_.empty()) {
                self->do_write();
            }
        });
}

void HTTPServer::WebSocketSession::close(std::uint16_t code, const std::string& reason) {
    net::post(ws_.get_executor(),
        [self = shared_from_this(), code, reason]() {
            if (!self->open_ || self->closing_) {
                return;
            }
            self->closing_ = true;

            SecureLogger::instance().info("Closing bridge connection " + self->remote_ + ": " + reason);

            self->ws_.async_close(
                websocket::close_reason(static_cast<websocket::close_code>(code), reason),
                [self](beast::error_code ec) {
                    if (ec) {
                        SecureLogger::instance().debug("WebSocket close error for " + self->remote_ + ": " +
                                                       ec.message());
                    }
                });
        });
}

void HTTPServer::WebSocketSession::finish(const std::string& why) {
    if (finished_) {
        return;
    }
    finished_ = true;
    open_ = false;

    SecureLogger::instance().info("Bridge connection " + remote_ + " ended: " + why);
    hub_.detach(shared_from_this());
}

} // namespace relay
} // namespace mcprelay
