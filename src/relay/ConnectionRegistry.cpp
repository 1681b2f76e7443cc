#include "mcprelay/relay/ConnectionRegistry.hpp"

namespace mcprelay {
namespace relay {

ConnectionRegistry::ConnectionPtr ConnectionRegistry::install(const sdk::KeyHash& key_hash,
                                                              const ConnectionPtr& connection) {
    ConnectionPtr displaced;

    auto existing = by_fingerprint_.find(key_hash);
    if (existing != by_fingerprint_.end() && existing->second != connection) {
        displaced = existing->second;
        by_connection_.erase(displaced.get());
    }

    // A connection occupies a single slot
    auto previous_slot = by_connection_.find(connection.get());
    if (previous_slot != by_connection_.end() && previous_slot->second != key_hash) {
        by_fingerprint_.erase(previous_slot->second);
    }

    by_fingerprint_[key_hash] = connection;
    by_connection_[connection.get()] = key_hash;
    connection->set_key_tag(key_hash);

    return displaced;
}

ConnectionRegistry::ConnectionPtr ConnectionRegistry::find(const sdk::KeyHash& key_hash) const {
    auto it = by_fingerprint_.find(key_hash);
    return it == by_fingerprint_.end() ? ConnectionPtr{} : it->second;
}

std::optional<sdk::KeyHash> ConnectionRegistry::fingerprint_of(const ConnectionPtr& connection) const {
    auto it = by_connection_.find(connection.get());
    if (it == by_connection_.end()) {
        return std::nullopt;
    }
    return it->second;
}

sdk::Result<ConnectionRegistry::ConnectionPtr> ConnectionRegistry::move(const ConnectionPtr& connection,
                                                                        const sdk::KeyHash& new_key_hash) {
    if (!fingerprint_of(connection)) {
        return {sdk::ErrorCode::INVALID_STATE, "connection is not registered"};
    }
    return install(new_key_hash, connection);
}

bool ConnectionRegistry::remove(const ConnectionPtr& connection) {
    auto reverse = by_connection_.find(connection.get());
    if (reverse == by_connection_.end()) {
        return false;
    }

    auto slot = by_fingerprint_.find(reverse->second);
    if (slot != by_fingerprint_.end() && slot->second == connection) {
        by_fingerprint_.erase(slot);
    }
    by_connection_.erase(reverse);
    return true;
}

std::size_t ConnectionRegistry::adopt(const std::vector<ConnectionPtr>& live) {
    std::size_t adopted = 0;

    for (const auto& connection : live) {
        if (!connection || !connection->is_open()) {
            continue;
        }

        const auto tag = connection->key_tag();
        if (tag.empty() || by_fingerprint_.count(tag) > 0 || by_connection_.count(connection.get()) > 0) {
            continue;
        }

        by_fingerprint_[tag] = connection;
        by_connection_[connection.get()] = tag;
        ++adopted;
    }

    return adopted;
}

std::vector<sdk::KeyHash> ConnectionRegistry::fingerprints() const {
    std::vector<sdk::KeyHash> keys;
    keys.reserve(by_fingerprint_.size());
    for (const auto& entry : by_fingerprint_) {
        keys.push_back(entry.first);
    }
    return keys;
}

void ConnectionRegistry::clear() {
    by_fingerprint_.clear();
    by_connection_.clear();
}

} // namespace relay
} // namespace mcprelay
