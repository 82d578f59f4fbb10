#include "request_handle.hpp"

#include <utility>

#include "logging/logger.hpp"

namespace mlld {
namespace client {

RequestHandle::RequestHandle(std::shared_ptr<IRequestIssuer> issuer, PendingRequest pending,
                             std::optional<std::chrono::milliseconds> timeout)
    : issuer_(std::move(issuer)), pending_(std::move(pending)), timeout_(timeout) {}

void RequestHandle::cancel() const {
    if (!issuer_) {
        return;
    }
    issuer_->cancel_request(pending_.id, pending_.session_generation);
}

bool RequestHandle::update_state(const std::string &path, const nlohmann::json &value, Error &error) const {
    if (!issuer_) {
        error = Error::usage("request handle is not bound to a request");
        return false;
    }
    return issuer_->update_state_request(pending_.id, path, value, timeout_, error);
}

bool RequestHandle::wait_raw(RawResult &result, Error &error) {
    // Cache first: a resolved handle never looks at the receiver again
    if (cached_) {
        result = *cached_;
        return true;
    }

    if (!issuer_) {
        error = Error::usage("request handle is not bound to a request");
        return false;
    }
    if (!pending_.receiver.valid()) {
        error = Error::usage("request handle already awaited");
        return false;
    }

    RawResult raw;
    bool ok = issuer_->await_request(pending_, timeout_, raw, error);
    pending_.receiver.reset();
    if (!ok) {
        return false;
    }

    cached_ = raw;
    result = std::move(raw);
    return true;
}

std::string extract_process_output(const nlohmann::json &payload) {
    if (!payload.is_object()) {
        return "";
    }

    auto it = payload.find("output");
    if (it == payload.end()) {
        it = payload.find("value");
    }
    if (it == payload.end()) {
        return "";
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

protocol::ExecuteResult decode_execute_result(nlohmann::json payload,
                                              std::vector<protocol::StateWrite> event_writes) {
    if (payload.is_object()) {
        payload.erase("id");
    }

    protocol::ExecuteResult result;
    try {
        result = payload.get<protocol::ExecuteResult>();
    } catch (const nlohmann::json::exception &e) {
        LOG_DEBUG("[ExecuteHandle] Unexpected execute result shape, returning raw payload: " << e.what());
        result = protocol::ExecuteResult{};
        result.output = payload.dump();
    }

    result.state_writes = protocol::merge_state_writes(std::move(result.state_writes), std::move(event_writes));
    return result;
}

bool ProcessHandle::result(std::string &output, Error &error) {
    RawResult raw;
    if (!request_.wait_raw(raw, error)) {
        return false;
    }
    output = extract_process_output(raw.payload);
    return true;
}

bool ExecuteHandle::result(protocol::ExecuteResult &result, Error &error) {
    RawResult raw;
    if (!request_.wait_raw(raw, error)) {
        return false;
    }
    result = decode_execute_result(std::move(raw.payload), std::move(raw.state_writes));
    return true;
}

}  // namespace client
}  // namespace mlld
