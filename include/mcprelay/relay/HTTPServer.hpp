#pragma once

#include "mcprelay/relay/ApiRouter.hpp"
#include "mcprelay/relay/BridgeConnection.hpp"
#include "mcprelay/relay/RelayConfig.hpp"
#include "mcprelay/relay/RelayHub.hpp"
#include "mcprelay/sdk/HashService.hpp"
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <atomic>
#include <deque>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace mcprelay {
namespace relay {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = boost::asio::ip::tcp;

/**
 * @brief HTTP and WebSocket server of the relay
 *
 * Serves the HTTP API through an ApiRouter and upgrades bridge connection
 * requests to WebSocket sessions registered with the RelayHub.
 */
class HTTPServer {
public:
    // Constructor
    HTTPServer(const RelayConfig& config, std::shared_ptr<sdk::HashService> hasher);

    // Destructor
    ~HTTPServer();

    // Start the server
    void start();

    // Stop the server
    void stop();

    // Port actually bound (useful when configured with port 0)
    std::uint16_t bound_port() const { return bound_port_; }

    RelayHub& hub() { return *hub_; }

private:
    // Listener for incoming connections
    class Listener : public std::enable_shared_from_this<Listener> {
    public:
        Listener(net::io_context& ioc, tcp::endpoint endpoint, RelayHub& hub, const ApiRouter& router);

        // Start accepting connections
        void start();

        std::uint16_t port() const { return acceptor_.local_endpoint().port(); }

    private:
        // Accept a new connection
        void do_accept();

        // Handle a new accepted connection
        void on_accept(beast::error_code ec, tcp::socket socket);

        net::io_context& ioc_;
        tcp::acceptor acceptor_;
        RelayHub& hub_;
        const ApiRouter& router_;
    };

    // Session for handling HTTP requests
    class HTTPSession : public std::enable_shared_from_this<HTTPSession> {
    public:
        HTTPSession(tcp::socket&& socket, RelayHub& hub, const ApiRouter& router);

        // Start the session
        void start();

    private:
        // Read a request
        void do_read();

        // Process the request
        void process_request();

        // Send a response
        void do_write(ApiRouter::Response res);

        beast::tcp_stream stream_;
        beast::flat_buffer buffer_;
        ApiRouter::Request req_;
        ApiRouter::Response res_;
        RelayHub& hub_;
        const ApiRouter& router_;
    };

    // WebSocket session carrying one bridge connection
    class WebSocketSession : public BridgeConnection,
                             public std::enable_shared_from_this<WebSocketSession> {
    public:
        WebSocketSession(tcp::socket&& socket, RelayHub& hub, BridgeTarget target);

        // Start the session by accepting the upgrade request
        void start(ApiRouter::Request req);

        void send(std::string frame) override;
        void close(std::uint16_t code, const std::string& reason) override;
        bool is_open() const override { return open_ && !closing_; }
        std::string describe() const override { return remote_; }

    private:
        // Accept the WebSocket upgrade
        void on_accept(beast::error_code ec);

        // Read a message
        void do_read();

        // Write the next queued message
        void do_write();

        // Unregister once, after the connection is gone
        void finish(const std::string& why);

        websocket::stream<beast::tcp_stream> ws_;
        beast::flat_buffer buffer_;
        std::deque<std::string> queue_;
        RelayHub& hub_;
        std::shared_ptr<RelayActor> actor_;
        std::string remote_;
        std::atomic<bool> open_{false};
        std::atomic<bool> closing_{false};
        bool finished_ = false;
    };

    RelayConfig config_;
    std::shared_ptr<sdk::HashService> hasher_;
    std::unique_ptr<net::io_context> ioc_;
    std::unique_ptr<RelayHub> hub_;
    std::unique_ptr<ApiRouter> router_;
    std::vector<std::thread> threads_;
    std::shared_ptr<Listener> listener_;
    std::atomic<bool> running_{false};
    std::uint16_t bound_port_ = 0;
};

} // namespace relay
} // namespace mcprelay
