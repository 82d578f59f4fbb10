#pragma once

#include <sys/types.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "protocol/types.hpp"
#include "transport/delivery_channel.hpp"
#include "transport/worker_session.hpp"

namespace mlld {
namespace client {

// SessionManager guarantees at most one live WorkerSession per client.
//
// A dead or missing session is replaced on the next request. Every spawned
// session gets a new generation number; callers remember the generation their
// request went out on so that late cleanup (cancel, remove, invalidate) never
// touches a replacement session.
//
// The slot lock covers only liveness check + spawn + register + send. Session
// teardown runs after the lock is released.
class SessionManager {
public:
    explicit SessionManager(transport::LaunchSpec spec);
    ~SessionManager();

    SessionManager(const SessionManager &) = delete;
    SessionManager &operator=(const SessionManager &) = delete;

    // Takes effect on the next spawn
    void set_launch_spec(transport::LaunchSpec spec);
    transport::LaunchSpec launch_spec() const;

    // Ensure a live session, register id, then send line, all under the slot lock.
    // On send failure the registration is undone.
    bool start_request(protocol::RequestId id, const std::string &line, transport::ChannelReceiver &receiver,
                       uint64_t &generation, std::string &error);

    // Best-effort write to the session of the given generation; false if it is gone
    bool send_to(uint64_t generation, const std::string &line, std::string &error);

    // Drop id from the registry of the given generation (no-op if replaced)
    void remove(uint64_t generation, protocol::RequestId id);

    // Clear the slot if it still holds the given generation
    void invalidate(uint64_t generation);

    // Clear the slot unconditionally
    void close();

    bool has_session() const;
    uint64_t current_generation() const;  // 0 before the first spawn
    std::optional<pid_t> current_pid() const;

private:
    bool ensure_session_locked(std::unique_ptr<transport::WorkerSession> &stale, std::string &error);

    mutable std::mutex mutex_;
    transport::LaunchSpec spec_;
    std::unique_ptr<transport::WorkerSession> session_;
    uint64_t generation_ = 0;
};

}  // namespace client
}  // namespace mlld
