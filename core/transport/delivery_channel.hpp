#pragma once

/**
 * @file delivery_channel.hpp
 * @brief One-producer/one-consumer channel carrying messages for a single request
 *
 * The stdout reader thread owns the sending end (through the PendingRegistry),
 * the waiting caller owns the receiving end. Dropping the sender without a
 * terminal message makes the receiver observe DISCONNECTED once the queue is
 * drained; dropping the receiver makes later pushes no-ops.
 */

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

namespace mlld {
namespace transport {

// Non-terminal progress notification; zero or more per request
struct EventMessage {
    nlohmann::json payload;
};

// Terminal answer from the worker (success or embedded error)
struct ResultMessage {
    nlohmann::json payload;
};

// Terminal notice that the session can no longer answer
struct ClosedMessage {
    std::string reason;
};

using TransportMessage = std::variant<EventMessage, ResultMessage, ClosedMessage>;

inline bool is_terminal(const TransportMessage &message) { return !std::holds_alternative<EventMessage>(message); }

enum class RecvStatus { OK, TIMEOUT, DISCONNECTED };

// Shared state behind a sender/receiver pair
class DeliveryChannel {
public:
    DeliveryChannel() = default;

    DeliveryChannel(const DeliveryChannel &) = delete;
    DeliveryChannel &operator=(const DeliveryChannel &) = delete;

    // Returns false when the receiver is gone or the sender already closed
    bool push(TransportMessage message);

    // Blocks until a message arrives, the sender closes, or timeout expires.
    // nullopt timeout waits indefinitely.
    RecvStatus pop(TransportMessage &out, std::optional<std::chrono::milliseconds> timeout);

    void close_sender();
    void close_receiver();

    bool sender_closed() const;
    bool receiver_closed() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<TransportMessage> queue_;
    bool sender_closed_ = false;
    bool receiver_closed_ = false;
};

/**
 * @brief Producer end; closes the channel on destruction (RAII)
 */
class ChannelSender {
public:
    ChannelSender() = default;
    explicit ChannelSender(std::shared_ptr<DeliveryChannel> channel) : channel_(std::move(channel)) {}
    ~ChannelSender() { reset(); }

    ChannelSender(const ChannelSender &) = delete;
    ChannelSender &operator=(const ChannelSender &) = delete;

    ChannelSender(ChannelSender &&other) noexcept : channel_(std::move(other.channel_)) {}
    ChannelSender &operator=(ChannelSender &&other) noexcept {
        if (this != &other) {
            reset();
            channel_ = std::move(other.channel_);
        }
        return *this;
    }

    bool send(TransportMessage message) const {
        if (!channel_) return false;
        return channel_->push(std::move(message));
    }

    // Shared pointer to the channel so the router can push outside the registry lock
    std::shared_ptr<DeliveryChannel> channel() const { return channel_; }

    bool valid() const { return channel_ != nullptr; }

    void reset() {
        if (channel_) {
            channel_->close_sender();
            channel_.reset();
        }
    }

private:
    std::shared_ptr<DeliveryChannel> channel_;
};

/**
 * @brief Consumer end; closes the channel on destruction (RAII)
 */
class ChannelReceiver {
public:
    ChannelReceiver() = default;
    explicit ChannelReceiver(std::shared_ptr<DeliveryChannel> channel) : channel_(std::move(channel)) {}
    ~ChannelReceiver() { reset(); }

    ChannelReceiver(const ChannelReceiver &) = delete;
    ChannelReceiver &operator=(const ChannelReceiver &) = delete;

    ChannelReceiver(ChannelReceiver &&other) noexcept : channel_(std::move(other.channel_)) {}
    ChannelReceiver &operator=(ChannelReceiver &&other) noexcept {
        if (this != &other) {
            reset();
            channel_ = std::move(other.channel_);
        }
        return *this;
    }

    RecvStatus recv(TransportMessage &out) { return recv_timeout(out, std::nullopt); }

    RecvStatus recv_timeout(TransportMessage &out, std::optional<std::chrono::milliseconds> timeout) {
        if (!channel_) return RecvStatus::DISCONNECTED;
        return channel_->pop(out, timeout);
    }

    bool valid() const { return channel_ != nullptr; }

    void reset() {
        if (channel_) {
            channel_->close_receiver();
            channel_.reset();
        }
    }

private:
    std::shared_ptr<DeliveryChannel> channel_;
};

std::pair<ChannelSender, ChannelReceiver> make_channel();

}  // namespace transport
}  // namespace mlld
