#include "mcprelay/relay/RequestMultiplexer.hpp"
#include "mcprelay/sdk/ChannelMessage.hpp"
#include "mcprelay/sdk/SecureLogger.hpp"
#include <boost/uuid/uuid_io.hpp>

namespace mcprelay {
namespace relay {

using sdk::SecureLogger;

RequestMultiplexer::RequestMultiplexer(Executor executor)
    : executor_(std::move(executor)) {
}

RequestMultiplexer::~RequestMultiplexer() {
    for (auto& entry : pending_) {
        entry.second.timer->cancel();
    }
}

sdk::CorrelationId RequestMultiplexer::dispatch(BridgeConnection& connection,
                                                const std::string& method,
                                                const sdk::Json& params,
                                                std::chrono::milliseconds timeout,
                                                Completion completion) {
    if (!connection.is_open()) {
        completion(sdk::Result<sdk::Json>(sdk::ErrorCode::NETWORK_ERROR, "Bridge connection is closed"));
        return {};
    }

    const sdk::CorrelationId id = boost::uuids::to_string(uuid_generator_());

    auto timer = std::make_unique<net::steady_timer>(executor_);
    timer->expires_after(timeout);

    std::weak_ptr<RequestMultiplexer> weak_self = shared_from_this();
    timer->async_wait([weak_self, id](const boost::system::error_code& ec) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        if (auto self = weak_self.lock()) {
            self->expire(id);
        }
    });

    pending_.emplace(id, PendingRequest{std::move(completion), std::move(timer), timeout});

    connection.send(sdk::ChannelMessage::request(id, method, params).encode());

    SecureLogger::instance().debug("Forwarded " + method + " as request " + id +
                                   " to " + connection.describe());
    return id;
}

bool RequestMultiplexer::resolve(const sdk::CorrelationId& id, const sdk::Json& result) {
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return false;
    }

    // Take the entry out before completing so a re-entrant resolve is a no-op
    PendingRequest request = std::move(it->second);
    pending_.erase(it);

    request.timer->cancel();
    request.completion(sdk::Result<sdk::Json>(result));
    return true;
}

std::string RequestMultiplexer::timeout_message(std::chrono::milliseconds timeout) {
    if (timeout.count() % 1000 == 0) {
        return "Request timeout (" + std::to_string(timeout.count() / 1000) + "s)";
    }
    return "Request timeout (" + std::to_string(timeout.count()) + "ms)";
}

void RequestMultiplexer::expire(const sdk::CorrelationId& id) {
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return;
    }

    PendingRequest request = std::move(it->second);
    pending_.erase(it);

    SecureLogger::instance().warning("Request " + id + " timed out");
    request.completion(sdk::Result<sdk::Json>(sdk::ErrorCode::REQUEST_TIMEOUT,
                                              timeout_message(request.timeout)));
}

} // namespace relay
} // namespace mcprelay
