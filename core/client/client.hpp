#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "client/errors.hpp"
#include "client/options.hpp"
#include "client/request_dispatcher.hpp"
#include "client/request_handle.hpp"
#include "protocol/types.hpp"
#include "runtime/config.hpp"

namespace mlld {
namespace client {

/**
 * @brief Public entry point for talking to a persistent mlld worker
 *
 * The worker is started on first use with `<command> <command_args...> live --stdio`
 * and reused for every later request until it dies or close() is called.
 * All operations report failure through the Error out-parameter.
 *
 * Handles returned by the *_async variants keep the underlying dispatcher
 * alive, so they remain usable after the Client is destroyed.
 */
class Client {
public:
    Client();
    explicit Client(runtime::ClientConfig config);
    ~Client();

    Client(const Client &) = delete;
    Client &operator=(const Client &) = delete;

    // Settings apply to the next worker spawn
    Client &with_command(std::string command);
    Client &with_command_args(std::vector<std::string> args);
    Client &with_timeout(std::chrono::milliseconds timeout);  // 0 disables the default timeout
    Client &with_working_dir(std::string dir);

    runtime::ClientConfig config() const;

    // Run a script and return its rendered output
    bool process(const std::string &script, const ProcessOptions &opts, std::string &output, Error &error);
    bool process_async(const std::string &script, const ProcessOptions &opts, ProcessHandle &handle, Error &error);

    // Run a file with an optional payload and return the structured result
    bool execute(const std::string &filepath, const std::optional<nlohmann::json> &payload,
                 const ExecuteOptions &opts, protocol::ExecuteResult &result, Error &error);
    bool execute_async(const std::string &filepath, const std::optional<nlohmann::json> &payload,
                       const ExecuteOptions &opts, ExecuteHandle &handle, Error &error);

    // Static analysis of a module without running it
    bool analyze(const std::string &filepath, protocol::AnalyzeResult &result, Error &error);

    // Stop the worker; the next request starts a new one
    void close();

    protocol::RequestId next_request_id() const { return dispatcher_->next_request_id(); }
    std::optional<pid_t> worker_pid() const { return dispatcher_->sessions().current_pid(); }

private:
    std::optional<std::chrono::milliseconds> resolve_timeout(
        const std::optional<std::chrono::milliseconds> &override_timeout) const;

    mutable std::mutex config_mutex_;
    runtime::ClientConfig config_;
    std::shared_ptr<RequestDispatcher> dispatcher_;
};

// Process-wide client created on first use with default settings
Client &default_client();

}  // namespace client

// Convenience wrappers over client::default_client()
bool process(const std::string &script, const client::ProcessOptions &opts, std::string &output,
             client::Error &error);
bool execute(const std::string &filepath, const std::optional<nlohmann::json> &payload,
             const client::ExecuteOptions &opts, protocol::ExecuteResult &result, client::Error &error);
bool analyze(const std::string &filepath, protocol::AnalyzeResult &result, client::Error &error);

}  // namespace mlld
