#pragma once

#include <sys/types.h>

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "delivery_channel.hpp"
#include "pending_registry.hpp"
#include "protocol/types.hpp"
#include "worker_process.hpp"

namespace mlld {
namespace transport {

// How to start a worker: <command> <command_args...> <live_args...>
struct LaunchSpec {
    std::string command = "mlld";
    std::vector<std::string> command_args;                  // e.g. {"./dist/cli.cjs"} with command "node"
    std::vector<std::string> live_args{"live", "--stdio"};  // selects the persistent multiplexing mode
    std::optional<std::string> working_dir;
    int graceful_timeout_ms = 0;  // 0 = kill immediately on teardown
    int kill_wait_ms = 2000;

    std::vector<std::string> full_args() const;
};

constexpr const char *kTransportClosedReason = "live transport closed";

/**
 * @brief One live worker process multiplexing all request traffic
 *
 * Owns the child, its three pipes, the pending registry and two reader threads:
 * - stdout reader: decodes envelopes and routes them to registered requests;
 *   on end of stream it delivers Closed to every id still pending
 * - stderr reader: accumulates diagnostic text used as the Closed reason
 *
 * register_request/send/remove may be called from any thread.
 * Destruction kills the worker and joins both readers.
 */
class WorkerSession {
public:
    // Spawn the worker and start the readers. Returns nullptr and sets error on failure.
    static std::unique_ptr<WorkerSession> spawn(const LaunchSpec &spec, std::string &error);

    ~WorkerSession();

    WorkerSession(const WorkerSession &) = delete;
    WorkerSession &operator=(const WorkerSession &) = delete;

    // Must happen before send() for the same id
    ChannelReceiver register_request(protocol::RequestId id);

    // Write one line plus '\n'. Errors are reported here, not through the reader.
    bool send(const std::string &line, std::string &error);

    // Drop the registry entry for id (timeout/cancel cleanup)
    void remove(protocol::RequestId id);

    // Non-blocking: child alive and stdout still open
    bool is_running();

    // Kill the worker, join the readers. Idempotent.
    void close();

    pid_t pid() const { return process_.pid(); }
    size_t pending_count() const { return registry_.size(); }
    bool has_pending(protocol::RequestId id) const { return registry_.contains(id); }

    // Accumulated stderr text (newline-joined)
    std::string stderr_text() const;

private:
    explicit WorkerSession(const LaunchSpec &spec);

    void stdout_loop();
    void stderr_loop();
    void dispatch_line(const std::string &line);
    std::string closing_reason() const;

    LaunchSpec spec_;
    WorkerProcess process_;
    PendingRegistry registry_;

    std::mutex write_mutex_;

    mutable std::mutex stderr_mutex_;
    std::condition_variable stderr_cv_;
    std::string stderr_buffer_;
    bool stderr_finished_ = false;

    std::thread stdout_thread_;
    std::thread stderr_thread_;
    std::atomic<bool> stdout_finished_{false};
    bool closed_ = false;
};

}  // namespace transport
}  // namespace mlld
