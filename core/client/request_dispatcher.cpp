#include "request_dispatcher.hpp"

#include <algorithm>
#include <cctype>
#include <thread>
#include <utility>
#include <variant>

#include "logging/logger.hpp"
#include "protocol/wire_codec.hpp"

namespace mlld {
namespace client {

using std::chrono::milliseconds;

transport::LaunchSpec make_launch_spec(const runtime::ClientConfig &config) {
    transport::LaunchSpec spec;
    spec.command = config.command;
    spec.command_args = config.command_args;
    spec.live_args = config.live_args;
    spec.working_dir = config.working_dir;
    spec.graceful_timeout_ms = config.shutdown.graceful_timeout_ms;
    spec.kill_wait_ms = config.shutdown.kill_wait_ms;
    return spec;
}

RequestDispatcher::RequestDispatcher(const runtime::ClientConfig &config)
    : sessions_(make_launch_spec(config)),
      retry_interval_ms_(config.state_update.retry_interval_ms),
      default_wait_ms_(config.state_update.default_wait_ms) {}

RequestDispatcher::~RequestDispatcher() { close(); }

void RequestDispatcher::configure(const runtime::ClientConfig &config) {
    sessions_.set_launch_spec(make_launch_spec(config));
    retry_interval_ms_ = config.state_update.retry_interval_ms;
    default_wait_ms_ = config.state_update.default_wait_ms;
}

void RequestDispatcher::close() { sessions_.close(); }

bool RequestDispatcher::start_request(const std::string &method, const nlohmann::json &params,
                                      PendingRequest &pending, Error &error) {
    const protocol::RequestId id = next_id_.fetch_add(1);
    const std::string line = protocol::encode_request(method, id, params);

    transport::ChannelReceiver receiver;
    uint64_t generation = 0;
    std::string transport_error;
    if (!sessions_.start_request(id, line, receiver, generation, transport_error)) {
        error = Error::transport(transport_error);
        return false;
    }

    pending.id = id;
    pending.session_generation = generation;
    pending.receiver = std::move(receiver);
    LOG_DEBUG("[Dispatcher] Sent " << method << " request " << id);
    return true;
}

bool RequestDispatcher::fail_timeout(const PendingRequest &pending, milliseconds limit, Error &error) {
    LOG_WARN("[Dispatcher] Request " << pending.id << " timed out after " << limit.count() << "ms, cancelling");
    cancel_request(pending.id, pending.session_generation);
    sessions_.remove(pending.session_generation, pending.id);
    error = Error::timed_out(limit);
    return false;
}

bool RequestDispatcher::await_request(PendingRequest &pending, std::optional<milliseconds> timeout,
                                      RawResult &result, Error &error) {
    transport::ChannelReceiver receiver = std::move(pending.receiver);
    if (!receiver.valid()) {
        error = Error::usage("request handle already awaited");
        return false;
    }

    const auto start = std::chrono::steady_clock::now();
    std::vector<protocol::StateWrite> state_writes;

    while (true) {
        std::optional<milliseconds> remaining;
        if (timeout) {
            auto elapsed = std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - start);
            if (elapsed >= *timeout) {
                return fail_timeout(pending, *timeout, error);
            }
            remaining = *timeout - elapsed;
        }

        transport::TransportMessage message;
        transport::RecvStatus status = receiver.recv_timeout(message, remaining);
        if (status == transport::RecvStatus::TIMEOUT) {
            return fail_timeout(pending, *timeout, error);
        }
        if (status == transport::RecvStatus::DISCONNECTED) {
            sessions_.invalidate(pending.session_generation);
            error = Error::transport("live transport disconnected");
            return false;
        }

        if (auto *event = std::get_if<transport::EventMessage>(&message)) {
            if (auto write = protocol::parse_state_write_event(event->payload)) {
                state_writes.push_back(std::move(*write));
            }
            continue;
        }

        if (auto *reply = std::get_if<transport::ResultMessage>(&message)) {
            if (protocol::result_has_error(reply->payload)) {
                auto info = protocol::decode_worker_error(reply->payload["error"]);
                error = Error::worker(std::move(info.message), std::move(info.code));
                return false;
            }
            result.payload = std::move(reply->payload);
            result.state_writes = std::move(state_writes);
            return true;
        }

        const auto &closed = std::get<transport::ClosedMessage>(message);
        LOG_WARN("[Dispatcher] Request " << pending.id << " lost its session: " << closed.reason);
        sessions_.invalidate(pending.session_generation);
        error = Error::transport(closed.reason);
        return false;
    }
}

void RequestDispatcher::cancel_request(protocol::RequestId id, uint64_t session_generation) {
    std::string send_error;
    if (!sessions_.send_to(session_generation, protocol::encode_cancel(id), send_error)) {
        LOG_DEBUG("[Dispatcher] Cancel for request " << id << " not delivered: " << send_error);
    }
}

bool RequestDispatcher::request(const std::string &method, const nlohmann::json &params,
                                std::optional<milliseconds> timeout, RawResult &result, Error &error) {
    PendingRequest pending;
    if (!start_request(method, params, pending, error)) {
        return false;
    }
    return await_request(pending, timeout, result, error);
}

bool RequestDispatcher::update_state_request(protocol::RequestId id, const std::string &path,
                                             const nlohmann::json &value, std::optional<milliseconds> timeout,
                                             Error &error) {
    bool blank = std::all_of(path.begin(), path.end(), [](unsigned char c) { return std::isspace(c); });
    if (blank) {
        error = Error::validation("state update path is required");
        return false;
    }

    const milliseconds max_wait = timeout ? *timeout : milliseconds(default_wait_ms_.load());
    const auto deadline = std::chrono::steady_clock::now() + max_wait;
    const nlohmann::json params = {{"requestId", id}, {"path", path}, {"value", value}};

    int attempts = 0;
    while (true) {
        ++attempts;
        RawResult ignored;
        Error attempt_error;
        if (request(protocol::methods::kStateUpdate, params, timeout, ignored, attempt_error)) {
            if (attempts > 1) {
                LOG_DEBUG("[Dispatcher] state:update for request " << id << " accepted after " << attempts
                                                                   << " attempts");
            }
            return true;
        }

        if (attempt_error.kind != ErrorKind::WORKER || !attempt_error.has_code(protocol::error_codes::kRequestNotFound)) {
            error = std::move(attempt_error);
            return false;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            LOG_WARN("[Dispatcher] state:update gave up on request " << id << " after " << attempts << " attempts");
            error = Error::worker("No active request for id " + std::to_string(id), attempt_error.code);
            return false;
        }
        std::this_thread::sleep_for(milliseconds(retry_interval_ms_.load()));
    }
}

}  // namespace client
}  // namespace mlld
