#pragma once

#include "mcprelay/relay/BridgeConnection.hpp"
#include "mcprelay/sdk/types.hpp"
#include <boost/asio.hpp>
#include <boost/uuid/random_generator.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace mcprelay {
namespace relay {

namespace net = boost::asio;

/**
 * @brief Correlates outbound requests with inbound responses on one channel
 *
 * Every dispatched request gets a fresh correlation id and a deadline timer.
 * Whichever of resolve() or the deadline happens first removes the entry and
 * completes the request; the other finds nothing to do, so each completion
 * runs exactly once.
 *
 * All members must be called on the executor passed at construction. Create
 * through std::make_shared: deadline handlers hold a weak reference.
 */
class RequestMultiplexer : public std::enable_shared_from_this<RequestMultiplexer> {
public:
    using Executor = net::strand<net::io_context::executor_type>;
    using Completion = std::function<void(sdk::Result<sdk::Json>)>;

    explicit RequestMultiplexer(Executor executor);
    ~RequestMultiplexer();

    RequestMultiplexer(const RequestMultiplexer&) = delete;
    RequestMultiplexer& operator=(const RequestMultiplexer&) = delete;

    /**
     * @brief Send a request frame and wait for the matching response
     * @param connection Channel to send on
     * @param method Downstream operation name
     * @param params Operation parameters (null to omit)
     * @param timeout Deadline; on expiry completion receives REQUEST_TIMEOUT
     * @param completion Invoked once with the result or the error
     * @return The correlation id, empty if the request failed immediately
     */
    sdk::CorrelationId dispatch(BridgeConnection& connection,
                                const std::string& method,
                                const sdk::Json& params,
                                std::chrono::milliseconds timeout,
                                Completion completion);

    /**
     * @brief Complete the pending request with this id
     * @return false if no request with that id is pending (late or unknown)
     */
    bool resolve(const sdk::CorrelationId& id, const sdk::Json& result);

    std::size_t pending() const { return pending_.size(); }

    bool is_pending(const sdk::CorrelationId& id) const { return pending_.count(id) > 0; }

    /**
     * @brief "Request timeout (60s)" style message for a deadline
     */
    static std::string timeout_message(std::chrono::milliseconds timeout);

private:
    struct PendingRequest {
        Completion completion;
        std::unique_ptr<net::steady_timer> timer;
        std::chrono::milliseconds timeout;
    };

    void expire(const sdk::CorrelationId& id);

    Executor executor_;
    boost::uuids::random_generator uuid_generator_;
    std::unordered_map<sdk::CorrelationId, PendingRequest> pending_;
};

} // namespace relay
} // namespace mcprelay
