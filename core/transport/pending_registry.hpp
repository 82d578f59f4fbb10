#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "delivery_channel.hpp"
#include "protocol/types.hpp"

namespace mlld {
namespace transport {

// PendingRegistry maps in-flight request ids to the sending end of their channel.
//
// An id is present from registration until exactly one terminal message has been
// delivered for it, or until the caller removes it after a timeout/cancel.
// The lock is held only while the map is touched, never while delivering.
class PendingRegistry {
public:
    PendingRegistry() = default;

    PendingRegistry(const PendingRegistry &) = delete;
    PendingRegistry &operator=(const PendingRegistry &) = delete;

    // Create a channel for id and return its consumer end.
    // Re-registering an id replaces (and disconnects) the previous channel.
    // After shutdown() the returned receiver already holds Closed(reason).
    ChannelReceiver register_request(protocol::RequestId id);

    // Drop the entry for id. Returns true if an entry was removed.
    bool remove(protocol::RequestId id);

    // Deliver a non-terminal event; the entry stays registered.
    // Returns true if a registered channel accepted it.
    bool route_event(protocol::RequestId id, nlohmann::json event);

    // Remove the entry and deliver the terminal result.
    // Returns true if a registered channel accepted it.
    bool route_result(protocol::RequestId id, nlohmann::json result);

    // Drain every entry and deliver Closed(reason) to each. Returns how many were notified.
    size_t close_all(const std::string &reason);

    // close_all() plus: later registrations are answered with Closed immediately
    size_t shutdown(const std::string &reason);

    bool is_shut_down() const;
    bool contains(protocol::RequestId id) const;
    size_t size() const;
    std::vector<protocol::RequestId> pending_ids() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<protocol::RequestId, ChannelSender> pending_;
    bool shut_down_ = false;
    std::string shutdown_reason_;

    size_t drain_and_notify(const std::string &reason, bool seal);
};

}  // namespace transport
}  // namespace mlld
