#pragma once

#include "mcprelay/bridge/BridgeConfig.hpp"
#include "mcprelay/bridge/ProtocolAdapter.hpp"
#include "mcprelay/sdk/ChannelMessage.hpp"
#include "mcprelay/sdk/HttpClient.hpp"
#include "mcprelay/sdk/ThreadPool.hpp"
#include "mcprelay/sdk/constants.hpp"
#include "mcprelay/sdk/types.hpp"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace mcprelay {
namespace bridge {

namespace beast = boost::beast;
namespace net = boost::asio;
namespace websocket = beast::websocket;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

/**
 * @brief Persistent connection from the bridge host to the relay
 *
 * Keeps one WebSocket (ws:// or TLS wss://, chosen by the relay URL scheme)
 * to the relay open, reconnecting after a fixed delay
 * whenever it drops, and serves relayed requests through the ProtocolAdapter
 * on a worker pool. All transport state lives on one I/O thread; public
 * members may be called from any other thread.
 *
 * DISCONNECTED -> CONNECTING -> CONNECTED -> DISCONNECTED -> ...
 * STOPPED is terminal and only reached through stop().
 */
class BridgeClient {
public:
    enum class State {
        DISCONNECTED,
        CONNECTING,
        CONNECTED,
        STOPPED
    };

    struct Options {
        std::chrono::milliseconds reconnect_delay = sdk::constants::RECONNECT_DELAY;
        std::chrono::milliseconds ping_interval = sdk::constants::PING_INTERVAL;
        std::size_t worker_threads = sdk::constants::DEFAULT_WORKER_THREADS;
    };

    // Called after a rotation was sent, with the new fingerprint
    using KeyChangeListener = std::function<void(const sdk::KeyHash&)>;

    BridgeClient(BridgeConfig config, std::shared_ptr<ProtocolAdapter> adapter);
    BridgeClient(BridgeConfig config, std::shared_ptr<ProtocolAdapter> adapter, Options options);

    // Stops the client if still running
    ~BridgeClient();

    BridgeClient(const BridgeClient&) = delete;
    BridgeClient& operator=(const BridgeClient&) = delete;

    /**
     * @brief Handshake with the downstream service, then connect to the relay
     *
     * A failed downstream handshake is logged and retried lazily on the first
     * request; it does not prevent connecting.
     * @return CONFIG_ERROR for an unparsable relay URL, INVALID_STATE if the
     *         client was already started or stopped
     */
    sdk::Result<void> start();

    /**
     * @brief Cancel timers, close the connection ("bridge stopped") and join
     *        the I/O thread. Idempotent.
     */
    void stop();

    /**
     * @brief Move the live registration to a new key fingerprint
     *
     * Sends rotate_key and adopts the new fingerprint locally; later
     * reconnects present it.
     * @return INVALID_STATE unless CONNECTED
     */
    sdk::Result<void> rotate_key(const sdk::KeyHash& new_key_hash);

    State state() const { return state_.load(); }

    // True once the relay acknowledged the current connection
    bool is_registered() const { return registered_.load(); }

    sdk::KeyHash key_hash() const;

    void set_key_change_listener(KeyChangeListener listener);

    static std::string state_to_string(State state);

private:
    // One WebSocket attempt; stale handlers compare against channel_
    struct Channel {
        using PlainStream = websocket::stream<beast::tcp_stream>;
        using SecureStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

        // A null tls context selects a plain TCP stream
        Channel(net::io_context& ioc, ssl::context* tls);

        beast::tcp_stream& tcp();

        // Apply fn to whichever stream this channel carries
        template<typename Function>
        void visit(Function&& fn) {
            if (secure) {
                fn(*secure);
            } else {
                fn(*plain);
            }
        }

        std::unique_ptr<PlainStream> plain;
        std::unique_ptr<SecureStream> secure;
        beast::flat_buffer buffer;
        std::deque<std::string> outbox;
    };
    using ChannelPtr = std::shared_ptr<Channel>;

    // I/O thread only
    void do_connect();
    void on_tcp_connected(const ChannelPtr& channel, const sdk::Url& target);
    void do_ws_handshake(const ChannelPtr& channel, const sdk::Url& target);
    void on_connected(const ChannelPtr& channel);
    void do_read(const ChannelPtr& channel);
    void handle_frame(const ChannelPtr& channel, const std::string& frame);
    void handle_request(sdk::ChannelMessage request);
    void write(const ChannelPtr& channel, std::string frame);
    void do_write(const ChannelPtr& channel);
    void on_disconnected(const ChannelPtr& channel, const std::string& why);
    void schedule_reconnect();
    void schedule_ping(const ChannelPtr& channel);
    void shutdown();

    net::io_context ioc_;
    ssl::context tls_context_;
    net::executor_work_guard<net::io_context::executor_type> work_;
    tcp::resolver resolver_;
    net::steady_timer reconnect_timer_;
    net::steady_timer ping_timer_;
    ChannelPtr channel_;

    std::atomic<State> state_{State::DISCONNECTED};
    std::atomic<bool> registered_{false};
    std::atomic<bool> started_{false};

    mutable std::mutex config_mutex_;
    BridgeConfig config_;
    KeyChangeListener key_listener_;

    std::shared_ptr<ProtocolAdapter> adapter_;
    Options options_;
    std::thread io_thread_;

    // Declared last: its tasks post back into ioc_
    std::unique_ptr<sdk::ThreadPool> workers_;
};

} // namespace bridge
} // namespace mcprelay
