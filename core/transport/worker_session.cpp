#include "worker_session.hpp"

#include <chrono>
#include <system_error>
#include <utility>

#include "logging/logger.hpp"
#include "protocol/wire_codec.hpp"

namespace mlld {
namespace transport {

namespace {

constexpr std::chrono::milliseconds kStderrDrainWait{200};

std::string trim(const std::string &text) {
    const char *whitespace = " \t\r\n\f\v";
    auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return std::string();
    }
    auto end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

}  // namespace

std::vector<std::string> LaunchSpec::full_args() const {
    std::vector<std::string> args = command_args;
    args.insert(args.end(), live_args.begin(), live_args.end());
    return args;
}

WorkerSession::WorkerSession(const LaunchSpec &spec)
    : spec_(spec), process_(spec.command, spec.full_args(), spec.working_dir) {}

std::unique_ptr<WorkerSession> WorkerSession::spawn(const LaunchSpec &spec, std::string &error) {
    std::unique_ptr<WorkerSession> session(new WorkerSession(spec));

    if (!session->process_.spawn()) {
        error = session->process_.last_error();
        return nullptr;
    }

    try {
        session->stderr_thread_ = std::thread(&WorkerSession::stderr_loop, session.get());
        session->stdout_thread_ = std::thread(&WorkerSession::stdout_loop, session.get());
    } catch (const std::system_error &e) {
        error = "Failed to start live transport reader: " + std::string(e.what());
        session->close();
        return nullptr;
    }

    LOG_INFO("[Session] Live transport started (PID=" << session->pid() << ")");
    return session;
}

WorkerSession::~WorkerSession() { close(); }

ChannelReceiver WorkerSession::register_request(protocol::RequestId id) { return registry_.register_request(id); }

bool WorkerSession::send(const std::string &line, std::string &error) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!process_.stdin_writer().write_line(line)) {
        error = "Failed to write request: " + process_.stdin_writer().last_error();
        return false;
    }
    return true;
}

void WorkerSession::remove(protocol::RequestId id) { registry_.remove(id); }

bool WorkerSession::is_running() {
    if (closed_ || stdout_finished_.load(std::memory_order_acquire)) {
        return false;
    }
    return process_.is_running();
}

void WorkerSession::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    {
        // No writer may be mid-line while stdin closes
        std::lock_guard<std::mutex> lock(write_mutex_);
        process_.shutdown(spec_.graceful_timeout_ms, spec_.kill_wait_ms);
    }

    // Process termination closes stdout/stderr, which ends both read loops
    if (stdout_thread_.joinable()) {
        stdout_thread_.join();
    }
    if (stderr_thread_.joinable()) {
        stderr_thread_.join();
    }

    // Covers a reader that never started; a no-op after a normal stdout drain
    registry_.shutdown(kTransportClosedReason);

    LOG_DEBUG("[Session] Live transport closed");
}

std::string WorkerSession::stderr_text() const {
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    return stderr_buffer_;
}

void WorkerSession::stdout_loop() {
    auto &reader = process_.stdout_reader();
    std::string line;

    while (reader.read_line(line)) {
        dispatch_line(line);
    }

    std::string reason;
    if (!reader.last_error().empty()) {
        reason = "live transport read error: " + reader.last_error();
    } else {
        // stderr closes with the process; give its reader a moment to catch the last lines
        {
            std::unique_lock<std::mutex> lock(stderr_mutex_);
            stderr_cv_.wait_for(lock, kStderrDrainWait, [this] { return stderr_finished_; });
        }
        reason = closing_reason();
    }

    stdout_finished_.store(true, std::memory_order_release);
    size_t notified = registry_.shutdown(reason);
    if (notified > 0) {
        LOG_WARN("[Session] Live transport ended with " << notified << " pending request(s): " << reason);
    } else {
        LOG_DEBUG("[Session] Live transport stdout closed");
    }
}

void WorkerSession::dispatch_line(const std::string &raw_line) {
    std::string line = trim(raw_line);
    if (line.empty()) {
        return;
    }

    protocol::Envelope envelope;
    std::string parse_error;
    if (!protocol::decode_envelope(line, envelope, parse_error)) {
        // Correlation is impossible without an envelope; fail whoever is waiting, keep reading
        size_t notified = registry_.close_all("invalid live response: " + parse_error);
        LOG_WARN("[Session] Malformed line from worker (" << parse_error << "), notified " << notified
                                                          << " pending request(s)");
        return;
    }

    if (envelope.event) {
        auto id = protocol::payload_request_id(*envelope.event);
        if (id) {
            registry_.route_event(*id, std::move(*envelope.event));
        } else {
            LOG_DEBUG("[Session] Dropping event without a usable id");
        }
    }

    if (envelope.result) {
        auto id = protocol::payload_request_id(*envelope.result);
        if (!id) {
            LOG_DEBUG("[Session] Dropping result without a usable id: " << envelope.result->dump());
        } else if (!registry_.route_result(*id, std::move(*envelope.result))) {
            LOG_DEBUG("[Session] Result for request " << *id << " has no waiter");
        }
    }
}

void WorkerSession::stderr_loop() {
    auto &reader = process_.stderr_reader();
    std::string line;

    while (reader.read_line(line)) {
        LOG_DEBUG("[Worker stderr] " << line);
        std::lock_guard<std::mutex> lock(stderr_mutex_);
        if (!stderr_buffer_.empty()) {
            stderr_buffer_.push_back('\n');
        }
        stderr_buffer_.append(line);
    }

    {
        std::lock_guard<std::mutex> lock(stderr_mutex_);
        stderr_finished_ = true;
    }
    stderr_cv_.notify_all();
}

std::string WorkerSession::closing_reason() const {
    std::string text = trim(stderr_text());
    if (text.empty()) {
        return kTransportClosedReason;
    }
    return text;
}

}  // namespace transport
}  // namespace mlld
