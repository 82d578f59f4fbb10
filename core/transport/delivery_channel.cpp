#include "delivery_channel.hpp"

namespace mlld {
namespace transport {

bool DeliveryChannel::push(TransportMessage message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (receiver_closed_ || sender_closed_) {
            return false;
        }
        queue_.push_back(std::move(message));
    }
    cv_.notify_one();
    return true;
}

RecvStatus DeliveryChannel::pop(TransportMessage &out, std::optional<std::chrono::milliseconds> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto ready = [this] { return !queue_.empty() || sender_closed_; };
    if (timeout) {
        if (!cv_.wait_for(lock, *timeout, ready)) {
            return RecvStatus::TIMEOUT;
        }
    } else {
        cv_.wait(lock, ready);
    }

    // Queued messages are still delivered after the sender closes
    if (!queue_.empty()) {
        out = std::move(queue_.front());
        queue_.pop_front();
        return RecvStatus::OK;
    }
    return RecvStatus::DISCONNECTED;
}

void DeliveryChannel::close_sender() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sender_closed_ = true;
    }
    cv_.notify_all();
}

void DeliveryChannel::close_receiver() {
    std::lock_guard<std::mutex> lock(mutex_);
    receiver_closed_ = true;
    queue_.clear();
}

bool DeliveryChannel::sender_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sender_closed_;
}

bool DeliveryChannel::receiver_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return receiver_closed_;
}

size_t DeliveryChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::pair<ChannelSender, ChannelReceiver> make_channel() {
    auto channel = std::make_shared<DeliveryChannel>();
    return {ChannelSender(channel), ChannelReceiver(channel)};
}

}  // namespace transport
}  // namespace mlld
