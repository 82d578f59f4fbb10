#include "client.hpp"

#include <algorithm>
#include <limits>
#include <utility>

#include "logging/logger.hpp"
#include "protocol/wire_codec.hpp"

namespace mlld {
namespace client {

using std::chrono::milliseconds;

Client::Client() : Client(runtime::ClientConfig{}) {}

Client::Client(runtime::ClientConfig config)
    : config_(std::move(config)), dispatcher_(std::make_shared<RequestDispatcher>(config_)) {}

Client::~Client() { close(); }

Client &Client::with_command(std::string command) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_.command = std::move(command);
    dispatcher_->configure(config_);
    return *this;
}

Client &Client::with_command_args(std::vector<std::string> args) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_.command_args = std::move(args);
    dispatcher_->configure(config_);
    return *this;
}

Client &Client::with_timeout(milliseconds timeout) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    // timeout_ms is an int; saturate instead of wrapping
    const auto max_ms = static_cast<milliseconds::rep>(std::numeric_limits<int>::max());
    config_.timeout_ms = static_cast<int>(std::clamp<milliseconds::rep>(timeout.count(), 0, max_ms));
    return *this;
}

Client &Client::with_working_dir(std::string dir) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_.working_dir = std::move(dir);
    dispatcher_->configure(config_);
    return *this;
}

runtime::ClientConfig Client::config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

std::optional<milliseconds> Client::resolve_timeout(const std::optional<milliseconds> &override_timeout) const {
    if (override_timeout) {
        return override_timeout;
    }
    std::lock_guard<std::mutex> lock(config_mutex_);
    if (config_.timeout_ms <= 0) {
        return std::nullopt;
    }
    return milliseconds(config_.timeout_ms);
}

bool Client::process(const std::string &script, const ProcessOptions &opts, std::string &output, Error &error) {
    ProcessHandle handle;
    if (!process_async(script, opts, handle, error)) {
        return false;
    }
    return handle.result(output, error);
}

bool Client::process_async(const std::string &script, const ProcessOptions &opts, ProcessHandle &handle,
                           Error &error) {
    auto timeout = resolve_timeout(opts.timeout);
    PendingRequest pending;
    if (!dispatcher_->start_request(protocol::methods::kProcess, build_process_params(script, opts), pending,
                                    error)) {
        return false;
    }
    handle = ProcessHandle(RequestHandle(dispatcher_, std::move(pending), timeout));
    return true;
}

bool Client::execute(const std::string &filepath, const std::optional<nlohmann::json> &payload,
                     const ExecuteOptions &opts, protocol::ExecuteResult &result, Error &error) {
    ExecuteHandle handle;
    if (!execute_async(filepath, payload, opts, handle, error)) {
        return false;
    }
    return handle.result(result, error);
}

bool Client::execute_async(const std::string &filepath, const std::optional<nlohmann::json> &payload,
                           const ExecuteOptions &opts, ExecuteHandle &handle, Error &error) {
    auto timeout = resolve_timeout(opts.timeout);
    PendingRequest pending;
    if (!dispatcher_->start_request(protocol::methods::kExecute, build_execute_params(filepath, payload, opts),
                                    pending, error)) {
        return false;
    }
    handle = ExecuteHandle(RequestHandle(dispatcher_, std::move(pending), timeout));
    return true;
}

bool Client::analyze(const std::string &filepath, protocol::AnalyzeResult &result, Error &error) {
    RawResult raw;
    if (!dispatcher_->request(protocol::methods::kAnalyze, {{"filepath", filepath}}, resolve_timeout(std::nullopt),
                              raw, error)) {
        return false;
    }

    if (raw.payload.is_object()) {
        raw.payload.erase("id");
    }

    try {
        result = raw.payload.get<protocol::AnalyzeResult>();
    } catch (const nlohmann::json::exception &e) {
        error = Error::transport("invalid analyze result: " + std::string(e.what()));
        return false;
    }
    return true;
}

void Client::close() { dispatcher_->close(); }

Client &default_client() {
    static Client instance;
    return instance;
}

}  // namespace client

bool process(const std::string &script, const client::ProcessOptions &opts, std::string &output,
             client::Error &error) {
    return client::default_client().process(script, opts, output, error);
}

bool execute(const std::string &filepath, const std::optional<nlohmann::json> &payload,
             const client::ExecuteOptions &opts, protocol::ExecuteResult &result, client::Error &error) {
    return client::default_client().execute(filepath, payload, opts, result, error);
}

bool analyze(const std::string &filepath, protocol::AnalyzeResult &result, client::Error &error) {
    return client::default_client().analyze(filepath, result, error);
}

}  // namespace mlld
