#include "session_manager.hpp"

#include <utility>

#include "logging/logger.hpp"

namespace mlld {
namespace client {

SessionManager::SessionManager(transport::LaunchSpec spec) : spec_(std::move(spec)) {}

SessionManager::~SessionManager() { close(); }

void SessionManager::set_launch_spec(transport::LaunchSpec spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    spec_ = std::move(spec);
}

transport::LaunchSpec SessionManager::launch_spec() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spec_;
}

bool SessionManager::ensure_session_locked(std::unique_ptr<transport::WorkerSession> &stale, std::string &error) {
    if (session_ && session_->is_running()) {
        return true;
    }

    if (session_) {
        LOG_WARN("[SessionManager] Live transport (generation " << generation_ << ") is dead, restarting");
        stale = std::move(session_);
    }

    auto session = transport::WorkerSession::spawn(spec_, error);
    if (!session) {
        LOG_ERROR("[SessionManager] Failed to start live transport: " << error);
        return false;
    }

    session_ = std::move(session);
    ++generation_;
    LOG_DEBUG("[SessionManager] Session generation " << generation_ << " ready");
    return true;
}

bool SessionManager::start_request(protocol::RequestId id, const std::string &line,
                                   transport::ChannelReceiver &receiver, uint64_t &generation, std::string &error) {
    // Declared before the lock so a replaced session is torn down after unlocking
    std::unique_ptr<transport::WorkerSession> stale;
    std::lock_guard<std::mutex> lock(mutex_);

    if (!ensure_session_locked(stale, error)) {
        return false;
    }

    // Register before sending: a fast reply must find its channel
    auto pending = session_->register_request(id);
    if (!session_->send(line, error)) {
        session_->remove(id);
        return false;
    }

    receiver = std::move(pending);
    generation = generation_;
    return true;
}

bool SessionManager::send_to(uint64_t generation, const std::string &line, std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_ || generation != generation_) {
        error = "session is no longer active";
        return false;
    }
    return session_->send(line, error);
}

void SessionManager::remove(uint64_t generation, protocol::RequestId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_ && generation == generation_) {
        session_->remove(id);
    }
}

void SessionManager::invalidate(uint64_t generation) {
    std::unique_ptr<transport::WorkerSession> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_ || generation != generation_) {
            return;
        }
        LOG_INFO("[SessionManager] Invalidating live transport (generation " << generation_ << ")");
        stale = std::move(session_);
    }
}

void SessionManager::close() {
    std::unique_ptr<transport::WorkerSession> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stale = std::move(session_);
    }
    if (stale) {
        LOG_DEBUG("[SessionManager] Closing live transport (PID=" << stale->pid() << ")");
    }
}

bool SessionManager::has_session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_ != nullptr;
}

uint64_t SessionManager::current_generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

std::optional<pid_t> SessionManager::current_pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_) {
        return std::nullopt;
    }
    return session_->pid();
}

}  // namespace client
}  // namespace mlld
