#pragma once

#include <sys/types.h>

#include <optional>
#include <string>
#include <vector>

#include "line_stdio.hpp"

namespace mlld {
namespace transport {

// WorkerProcess manages the lifecycle of the live worker child process
// Responsibilities:
// - Spawn process with stdin/stdout/stderr captured as pipes
// - Non-blocking liveness probe
// - Clean/forced shutdown of the worker and its process group
class WorkerProcess {
public:
    WorkerProcess(const std::string &command, const std::vector<std::string> &args = {},
                  const std::optional<std::string> &working_dir = std::nullopt);
    ~WorkerProcess();

    // Delete copy/move
    WorkerProcess(const WorkerProcess &) = delete;
    WorkerProcess &operator=(const WorkerProcess &) = delete;

    // Spawn the worker process (PATH lookup applies to command)
    // Returns true on success, false on failure (sets error_)
    bool spawn();

    // Check if process is still running. Reaps and records the exit status
    // when the child has exited; never blocks.
    bool is_running();

    // Shutdown sequence: EOF -> optional graceful wait -> SIGKILL -> reap
    void shutdown(int graceful_timeout_ms = 0, int kill_wait_ms = 2000);

    // Pipes (parent side)
    LineWriter &stdin_writer() { return stdin_; }
    LineReader &stdout_reader() { return stdout_; }
    LineReader &stderr_reader() { return stderr_; }

    const std::string &command() const { return command_; }
    pid_t pid() const { return pid_; }

    // Raw waitpid status once the child has been reaped
    std::optional<int> exit_status() const { return exit_status_; }

    // Get last error
    const std::string &last_error() const { return error_; }

private:
    std::string command_;
    std::vector<std::string> args_;
    std::optional<std::string> working_dir_;
    std::string error_;

    pid_t pid_ = -1;
    bool reaped_ = false;
    std::optional<int> exit_status_;

    LineWriter stdin_;
    LineReader stdout_;
    LineReader stderr_;

    bool wait_for_exit(int timeout_ms);
    void force_terminate();
    void record_exit(int status);
};

}  // namespace transport
}  // namespace mlld
