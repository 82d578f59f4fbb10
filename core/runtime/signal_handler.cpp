#include "signal_handler.hpp"

#include <signal.h>

#include <cerrno>
#include <cstring>

#include "../logging/logger.hpp"

namespace mlld {
namespace runtime {

std::atomic<bool> SignalHandler::shutdown_requested_{false};
std::atomic<int> SignalHandler::last_signal_{0};

void SignalHandler::install() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);

    for (int signo : {SIGINT, SIGTERM}) {
        if (sigaction(signo, &sa, nullptr) < 0) {
            LOG_WARN("[Signal] Failed to install handler for signal " << signo << ": " << std::strerror(errno));
        }
    }
}

bool SignalHandler::is_shutdown_requested() { return shutdown_requested_.load(); }

int SignalHandler::last_signal() { return last_signal_.load(); }

void SignalHandler::reset() {
    shutdown_requested_.store(false);
    last_signal_.store(0);
}

void SignalHandler::handle_signal(int signal) {
    // Async-signal-safe: atomics only
    last_signal_.store(signal);
    shutdown_requested_.store(true);
}

}  // namespace runtime
}  // namespace mlld
