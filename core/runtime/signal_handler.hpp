#pragma once

#include <atomic>

namespace mlld {
namespace runtime {

/**
 * @brief SIGINT/SIGTERM latch for the CLI
 *
 * The handler only stores into atomics. A watcher thread polls
 * is_shutdown_requested() and closes the client, which kills the worker
 * and fails in-flight requests with a transport error.
 */
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

    // Signal number that triggered shutdown, 0 if none
    static int last_signal();

    // Clears the latch (tests, repeated runs in one process)
    static void reset();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
    static std::atomic<int> last_signal_;
};

}  // namespace runtime
}  // namespace mlld
