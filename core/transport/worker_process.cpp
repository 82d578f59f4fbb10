#include "worker_process.hpp"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <mutex>
#include <thread>

#include "logging/logger.hpp"

namespace mlld {
namespace transport {

namespace {

// A write to a dead worker must surface as EPIPE, not terminate the client
void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, [] {
        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = SIG_IGN;
        sigemptyset(&sa.sa_mask);
        sigaction(SIGPIPE, &sa, nullptr);
    });
}

void close_pair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = -1;
    fds[1] = -1;
}

// Child side only: async-signal-safe report of errno, then exit
[[noreturn]] void child_fail(int report_fd) {
    int err = errno;
    ssize_t ignored = write(report_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

}  // namespace

WorkerProcess::WorkerProcess(const std::string &command, const std::vector<std::string> &args,
                             const std::optional<std::string> &working_dir)
    : command_(command), args_(args), working_dir_(working_dir) {}

WorkerProcess::~WorkerProcess() { shutdown(); }

bool WorkerProcess::spawn() {
    error_.clear();

    if (command_.empty()) {
        error_ = "Worker command is empty";
        return false;
    }
    if (pid_ > 0 && !reaped_) {
        error_ = "Worker already spawned (PID=" + std::to_string(pid_) + ")";
        return false;
    }

    LOG_INFO("[Worker] Spawning: " << command_);

    ignore_sigpipe_once();

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};

    // O_CLOEXEC keeps these out of any other child the client spawns; dup2 in
    // the child clears the flag on the standard descriptors.
    if (pipe2(stdin_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create stdin pipe: " + std::string(strerror(errno));
        return false;
    }
    if (pipe2(stdout_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create stdout pipe: " + std::string(strerror(errno));
        close_pair(stdin_pipe);
        return false;
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create stderr pipe: " + std::string(strerror(errno));
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        return false;
    }
    if (pipe2(exec_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create exec status pipe: " + std::string(strerror(errno));
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return false;
    }

    // Construct argv before fork; the child may only make async-signal-safe calls
    std::vector<char *> argv;
    argv.reserve(args_.size() + 2);
    argv.push_back(const_cast<char *>(command_.c_str()));
    for (const auto &arg : args_) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const char *cwd = working_dir_ ? working_dir_->c_str() : nullptr;

    pid_t child = fork();
    if (child < 0) {
        error_ = "Fork failed: " + std::string(strerror(errno));
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
        return false;
    }

    if (child == 0) {
        // Own process group so teardown can take down anything the worker started
        setpgid(0, 0);

        if (dup2(stdin_pipe[0], STDIN_FILENO) < 0) child_fail(exec_pipe[1]);
        if (dup2(stdout_pipe[1], STDOUT_FILENO) < 0) child_fail(exec_pipe[1]);
        if (dup2(stderr_pipe[1], STDERR_FILENO) < 0) child_fail(exec_pipe[1]);

        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = SIG_DFL;
        sigaction(SIGPIPE, &sa, nullptr);

        if (cwd != nullptr && chdir(cwd) < 0) {
            child_fail(exec_pipe[1]);
        }

        execvp(argv[0], argv.data());
        child_fail(exec_pipe[1]);
    }

    // Parent process
    close(stdin_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    close(exec_pipe[1]);

    // exec_pipe closes on successful exec (CLOEXEC); a child failure sends errno first
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (n > 0) {
        int status = 0;
        while (waitpid(child, &status, 0) < 0 && errno == EINTR) {
        }
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        error_ = "Failed to start worker '" + command_ + "'";
        if (cwd != nullptr) {
            error_ += " in '" + *working_dir_ + "'";
        }
        error_ += ": " + std::string(strerror(child_errno));
        LOG_ERROR("[Worker] " << error_);
        return false;
    }

    pid_ = child;
    reaped_ = false;
    exit_status_.reset();

    stdin_.set_fd(stdin_pipe[1]);
    stdout_.set_fd(stdout_pipe[0]);
    stderr_.set_fd(stderr_pipe[0]);

    LOG_INFO("[Worker] Process spawned successfully (PID=" << pid_ << ")");
    return true;
}

bool WorkerProcess::is_running() {
    if (pid_ <= 0 || reaped_) {
        return false;
    }

    int status = 0;
    pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == 0) {
        return true;
    }
    if (result == pid_) {
        record_exit(status);
        return false;
    }
    if (result < 0 && errno == ECHILD) {
        // Reaped elsewhere (e.g. SIGCHLD ignored by the host application)
        reaped_ = true;
        return false;
    }
    // EINTR or unexpected error: report the last known state
    return true;
}

void WorkerProcess::shutdown(int graceful_timeout_ms, int kill_wait_ms) {
    stdin_.close();

    if (pid_ <= 0) {
        return;
    }
    if (reaped_) {
        // The group id stays reserved while any member lives, so this only reaches our stragglers
        force_terminate();
        return;
    }

    LOG_DEBUG("[Worker] Initiating shutdown (PID=" << pid_ << ")");

    bool exited = false;
    if (graceful_timeout_ms > 0) {
        exited = wait_for_exit(graceful_timeout_ms);
        if (exited) {
            LOG_INFO("[Worker] Clean shutdown");
        }
    }

    // Kill the group even after a clean exit: stragglers would keep stdout open
    force_terminate();

    if (!exited) {
        exited = wait_for_exit(kill_wait_ms);
        if (exited) {
            LOG_INFO("[Worker] Terminated (PID=" << pid_ << ")");
        } else {
            LOG_ERROR("[Worker] Process " << pid_ << " did not exit within " << kill_wait_ms << "ms of SIGKILL");
        }
    }
}

bool WorkerProcess::wait_for_exit(int timeout_ms) {
    if (pid_ <= 0 || reaped_) {
        return true;
    }

    auto start = std::chrono::steady_clock::now();
    while (true) {
        int status = 0;
        pid_t result = waitpid(pid_, &status, WNOHANG);
        if (result == pid_) {
            record_exit(status);
            return true;
        }
        if (result == -1) {
            if (errno == ECHILD) {
                reaped_ = true;
                return true;
            }
            if (errno != EINTR) {
                return false;
            }
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= timeout_ms) {
            return false;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

void WorkerProcess::force_terminate() {
    if (pid_ <= 0) {
        return;
    }
    // Group first; fall back to the pid if setpgid never took effect
    if (kill(-pid_, SIGKILL) < 0 && !reaped_) {
        kill(pid_, SIGKILL);
    }
}

void WorkerProcess::record_exit(int status) {
    reaped_ = true;
    exit_status_ = status;
    if (WIFEXITED(status)) {
        LOG_DEBUG("[Worker] Process " << pid_ << " exited with code " << WEXITSTATUS(status));
    } else if (WIFSIGNALED(status)) {
        LOG_DEBUG("[Worker] Process " << pid_ << " killed by signal " << WTERMSIG(status));
    }
}

}  // namespace transport
}  // namespace mlld
