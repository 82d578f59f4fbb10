#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "client/errors.hpp"
#include "protocol/types.hpp"
#include "transport/delivery_channel.hpp"

namespace mlld {
namespace client {

// A request that has been written to the worker and not yet awaited
struct PendingRequest {
    protocol::RequestId id = 0;
    uint64_t session_generation = 0;    // session the request went out on
    transport::ChannelReceiver receiver;  // consumed by the first await
};

// Terminal success payload plus the state writes observed while waiting
struct RawResult {
    nlohmann::json payload;
    std::vector<protocol::StateWrite> state_writes;
};

// Interface for the request path to enable mocking handles
class IRequestIssuer {
public:
    virtual ~IRequestIssuer() = default;

    // Allocate an id, register it and send {method, id, params}
    virtual bool start_request(const std::string &method, const nlohmann::json &params, PendingRequest &pending,
                               Error &error) = 0;

    // Block until the terminal message for pending.id. Consumes pending.receiver.
    virtual bool await_request(PendingRequest &pending, std::optional<std::chrono::milliseconds> timeout,
                               RawResult &result, Error &error) = 0;

    // Fire-and-forget cancel; never blocks on an acknowledgment
    virtual void cancel_request(protocol::RequestId id, uint64_t session_generation) = 0;

    // state:update against a running request, absorbing the registration race
    virtual bool update_state_request(protocol::RequestId id, const std::string &path, const nlohmann::json &value,
                                      std::optional<std::chrono::milliseconds> timeout, Error &error) = 0;
};

}  // namespace client
}  // namespace mlld
