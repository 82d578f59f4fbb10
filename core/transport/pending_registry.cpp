#include "pending_registry.hpp"

#include <algorithm>
#include <memory>
#include <utility>

namespace mlld {
namespace transport {

ChannelReceiver PendingRegistry::register_request(protocol::RequestId id) {
    auto [sender, receiver] = make_channel();
    ChannelSender replaced;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            sender.send(ClosedMessage{shutdown_reason_});
            return std::move(receiver);
        }
        auto &slot = pending_[id];
        replaced = std::move(slot);
        slot = std::move(sender);
    }
    // replaced (if any) disconnects here, outside the lock
    return std::move(receiver);
}

bool PendingRegistry::remove(protocol::RequestId id) {
    ChannelSender removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return false;
        }
        removed = std::move(it->second);
        pending_.erase(it);
    }
    return true;
}

bool PendingRegistry::route_event(protocol::RequestId id, nlohmann::json event) {
    std::shared_ptr<DeliveryChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return false;
        }
        channel = it->second.channel();
    }
    return channel->push(EventMessage{std::move(event)});
}

bool PendingRegistry::route_result(protocol::RequestId id, nlohmann::json result) {
    ChannelSender sender;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return false;
        }
        sender = std::move(it->second);
        pending_.erase(it);
    }
    return sender.send(ResultMessage{std::move(result)});
}

size_t PendingRegistry::close_all(const std::string &reason) { return drain_and_notify(reason, false); }

size_t PendingRegistry::shutdown(const std::string &reason) { return drain_and_notify(reason, true); }

size_t PendingRegistry::drain_and_notify(const std::string &reason, bool seal) {
    std::vector<ChannelSender> senders;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (seal && !shut_down_) {
            shut_down_ = true;
            shutdown_reason_ = reason;
        }
        senders.reserve(pending_.size());
        for (auto &[id, sender] : pending_) {
            senders.push_back(std::move(sender));
        }
        pending_.clear();
    }

    size_t notified = 0;
    for (auto &sender : senders) {
        if (sender.send(ClosedMessage{reason})) {
            ++notified;
        }
    }
    return notified;
}

bool PendingRegistry::is_shut_down() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shut_down_;
}

bool PendingRegistry::contains(protocol::RequestId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(id) > 0;
}

size_t PendingRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::vector<protocol::RequestId> PendingRegistry::pending_ids() const {
    std::vector<protocol::RequestId> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ids.reserve(pending_.size());
        for (const auto &entry : pending_) {
            ids.push_back(entry.first);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

}  // namespace transport
}  // namespace mlld
