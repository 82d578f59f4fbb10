#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "client/errors.hpp"
#include "client/i_request_issuer.hpp"
#include "protocol/types.hpp"

namespace mlld {
namespace client {

/**
 * @brief Shared state behind ProcessHandle and ExecuteHandle
 *
 * Holds the receiver until the first wait, then the resolved payload and state
 * writes. Later waits return the cached copy without touching the channel.
 * Waiting concurrently from two threads is not supported.
 */
class RequestHandle {
public:
    RequestHandle() = default;
    RequestHandle(std::shared_ptr<IRequestIssuer> issuer, PendingRequest pending,
                  std::optional<std::chrono::milliseconds> timeout);

    RequestHandle(RequestHandle &&) = default;
    RequestHandle &operator=(RequestHandle &&) = default;

    protocol::RequestId request_id() const { return pending_.id; }
    std::optional<std::chrono::milliseconds> timeout() const { return timeout_; }
    bool is_bound() const { return issuer_ != nullptr; }
    bool is_resolved() const { return cached_.has_value(); }

    // Advisory; harmless after the request finished
    void cancel() const;

    bool update_state(const std::string &path, const nlohmann::json &value, Error &error) const;

    bool wait_raw(RawResult &result, Error &error);

private:
    std::shared_ptr<IRequestIssuer> issuer_;
    PendingRequest pending_;
    std::optional<std::chrono::milliseconds> timeout_;
    std::optional<RawResult> cached_;
};

// In-flight process request
class ProcessHandle {
public:
    ProcessHandle() = default;
    explicit ProcessHandle(RequestHandle request) : request_(std::move(request)) {}

    protocol::RequestId request_id() const { return request_.request_id(); }
    void cancel() const { request_.cancel(); }
    bool update_state(const std::string &path, const nlohmann::json &value, Error &error) const {
        return request_.update_state(path, value, error);
    }

    // Block for the rendered output
    bool wait(std::string &output, Error &error) { return result(output, error); }
    bool result(std::string &output, Error &error);

private:
    RequestHandle request_;
};

// In-flight execute request
class ExecuteHandle {
public:
    ExecuteHandle() = default;
    explicit ExecuteHandle(RequestHandle request) : request_(std::move(request)) {}

    protocol::RequestId request_id() const { return request_.request_id(); }
    void cancel() const { request_.cancel(); }
    bool update_state(const std::string &path, const nlohmann::json &value, Error &error) const {
        return request_.update_state(path, value, error);
    }

    // Block for the structured result
    bool wait(protocol::ExecuteResult &result, Error &error) { return this->result(result, error); }
    bool result(protocol::ExecuteResult &result, Error &error);

private:
    RequestHandle request_;
};

// Text of a process result: "output", else "value" (non-strings serialized), else empty
std::string extract_process_output(const nlohmann::json &payload);

// Typed execute result; falls back to the serialized payload as output when the
// shape does not match. State writes from the payload come before event writes.
protocol::ExecuteResult decode_execute_result(nlohmann::json payload,
                                              std::vector<protocol::StateWrite> event_writes);

}  // namespace client
}  // namespace mlld
