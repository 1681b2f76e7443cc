#pragma once

#include "mcprelay/relay/BridgeConnection.hpp"
#include "mcprelay/sdk/ChannelMessage.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mcprelay {
namespace testing {

// In-memory bridge connection that records what the relay sends
class FakeConnection : public relay::BridgeConnection {
public:
    FakeConnection(sdk::NodeId node_id, sdk::KeyHash key_tag, std::string name)
        : BridgeConnection(std::move(node_id), std::move(key_tag)), name_(std::move(name)) {}

    void send(std::string frame) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        frames_.push_back(std::move(frame));
        changed_.notify_all();
    }

    void close(std::uint16_t code, const std::string& reason) override {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        close_code_ = code;
        close_reason_ = reason;
        changed_.notify_all();
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return !closed_;
    }

    std::string describe() const override { return name_; }

    // Wait until at least count frames arrived; returns the decoded frame at index
    sdk::ChannelMessage wait_frame(std::size_t index,
                                   std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!changed_.wait_for(lock, timeout, [&] { return frames_.size() > index; })) {
            return sdk::ChannelMessage();
        }
        auto decoded = sdk::ChannelMessage::decode(frames_[index]);
        return decoded.is_ok() ? decoded.value() : sdk::ChannelMessage();
    }

    std::size_t frame_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_.size();
    }

    bool wait_closed(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return changed_.wait_for(lock, timeout, [&] { return closed_; });
    }

    std::string close_reason() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_reason_;
    }

    std::uint16_t close_code() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_code_;
    }

private:
    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable changed_;
    std::vector<std::string> frames_;
    bool closed_ = false;
    std::uint16_t close_code_ = 0;
    std::string close_reason_;
};

} // namespace testing
} // namespace mcprelay
