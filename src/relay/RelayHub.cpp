#include "mcprelay/relay/RelayHub.hpp"
#include "mcprelay/sdk/SecureLogger.hpp"
#include <algorithm>

namespace mcprelay {
namespace relay {

using sdk::SecureLogger;

RelayHub::RelayHub(net::io_context& ioc) : ioc_(ioc) {
}

std::shared_ptr<RelayActor> RelayHub::actor_for(const sdk::NodeId& node_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return actor_for_locked(node_id);
}

std::shared_ptr<RelayActor> RelayHub::actor_for_locked(const sdk::NodeId& node_id) {
    auto it = actors_.find(node_id);
    if (it != actors_.end()) {
        return it->second;
    }

    auto actor = std::make_shared<RelayActor>(ioc_, node_id,
        [this, node_id]() { return live_connections(node_id); },
        [this](const RelayActor& idle) { release(idle); });
    actors_.emplace(node_id, actor);

    SecureLogger::instance().debug("Created relay actor for node " + SecureLogger::redact(node_id));
    return actor;
}

std::shared_ptr<RelayActor> RelayHub::find_actor(const sdk::NodeId& node_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = actors_.find(node_id);
    return it == actors_.end() ? nullptr : it->second;
}

std::shared_ptr<RelayActor> RelayHub::attach(const std::shared_ptr<BridgeConnection>& connection) {
    std::shared_ptr<RelayActor> actor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& entries = directory_[connection->node_id()];
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [](const std::weak_ptr<BridgeConnection>& entry) { return entry.expired(); }),
                      entries.end());
        entries.push_back(connection);
        actor = actor_for_locked(connection->node_id());
    }

    actor->connect(connection->key_tag(), connection);
    return actor;
}

void RelayHub::detach(const std::shared_ptr<BridgeConnection>& connection) {
    std::shared_ptr<RelayActor> actor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto dir = directory_.find(connection->node_id());
        if (dir != directory_.end()) {
            auto& entries = dir->second;
            entries.erase(std::remove_if(entries.begin(), entries.end(),
                                         [&connection](const std::weak_ptr<BridgeConnection>& entry) {
                                             auto live = entry.lock();
                                             return !live || live == connection;
                                         }),
                          entries.end());
            if (entries.empty()) {
                directory_.erase(dir);
            }
        }

        auto it = actors_.find(connection->node_id());
        if (it != actors_.end()) {
            actor = it->second;
        }
    }

    if (actor) {
        actor->on_closed(connection);
    }
}

void RelayHub::release(const RelayActor& actor) {
    std::lock_guard<std::mutex> lock(mutex_);

    // A transport attached since the actor went idle keeps it alive
    if (directory_.count(actor.node_id()) > 0) {
        return;
    }

    auto it = actors_.find(actor.node_id());
    if (it != actors_.end() && it->second.get() == &actor) {
        actors_.erase(it);
        SecureLogger::instance().debug("Released relay actor for node " + SecureLogger::redact(actor.node_id()));
    }
}

std::vector<std::shared_ptr<BridgeConnection>> RelayHub::live_connections(const sdk::NodeId& node_id) const {
    std::vector<std::shared_ptr<BridgeConnection>> live;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = directory_.find(node_id);
    if (it == directory_.end()) {
        return live;
    }

    for (const auto& entry : it->second) {
        auto connection = entry.lock();
        if (connection && connection->is_open()) {
            live.push_back(std::move(connection));
        }
    }
    return live;
}

std::size_t RelayHub::actor_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return actors_.size();
}

std::size_t RelayHub::connection_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& entry : directory_) {
        for (const auto& connection : entry.second) {
            if (!connection.expired()) {
                ++count;
            }
        }
    }
    return count;
}

} // namespace relay
} // namespace mcprelay
