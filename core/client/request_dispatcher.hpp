#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "client/i_request_issuer.hpp"
#include "client/session_manager.hpp"
#include "runtime/config.hpp"

namespace mlld {
namespace client {

/**
 * @brief Issues requests over the managed live session and waits for their replies
 *
 * Owns the session slot and the id counter. Ids start at 1, are allocated
 * before any I/O and are never reused, including across session restarts.
 * Safe to use from any number of threads; only the spawn/register/send step
 * is serialized.
 */
class RequestDispatcher : public IRequestIssuer {
public:
    explicit RequestDispatcher(const runtime::ClientConfig &config);
    ~RequestDispatcher() override;

    RequestDispatcher(const RequestDispatcher &) = delete;
    RequestDispatcher &operator=(const RequestDispatcher &) = delete;

    bool start_request(const std::string &method, const nlohmann::json &params, PendingRequest &pending,
                       Error &error) override;
    bool await_request(PendingRequest &pending, std::optional<std::chrono::milliseconds> timeout, RawResult &result,
                       Error &error) override;
    void cancel_request(protocol::RequestId id, uint64_t session_generation) override;
    bool update_state_request(protocol::RequestId id, const std::string &path, const nlohmann::json &value,
                              std::optional<std::chrono::milliseconds> timeout, Error &error) override;

    // start_request + await_request
    bool request(const std::string &method, const nlohmann::json &params,
                 std::optional<std::chrono::milliseconds> timeout, RawResult &result, Error &error);

    // Applies launch settings to the next spawn and retry settings immediately
    void configure(const runtime::ClientConfig &config);

    // Tear down the current session; the next request spawns a fresh one
    void close();

    // Id the next request will receive
    protocol::RequestId next_request_id() const { return next_id_.load(); }

    SessionManager &sessions() { return sessions_; }

private:
    bool fail_timeout(const PendingRequest &pending, std::chrono::milliseconds limit, Error &error);

    SessionManager sessions_;
    std::atomic<protocol::RequestId> next_id_{1};
    std::atomic<int> retry_interval_ms_;
    std::atomic<int> default_wait_ms_;
};

// Launch parameters for a worker session derived from client configuration
transport::LaunchSpec make_launch_spec(const runtime::ClientConfig &config);

}  // namespace client
}  // namespace mlld
