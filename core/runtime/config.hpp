#pragma once

#include <optional>
#include <string>
#include <vector>

namespace mlld {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

// Retry policy for state:update against a request the worker has not registered yet
struct StateUpdateConfig {
    int retry_interval_ms = 25;   // Sleep between REQUEST_NOT_FOUND retries
    int default_wait_ms = 2000;   // Retry deadline when the caller gives no timeout
};

// Worker teardown
struct ShutdownConfig {
    int graceful_timeout_ms = 0;  // Wait after stdin EOF before SIGKILL (0 = kill immediately)
    int kill_wait_ms = 2000;      // Wait for the killed worker to be reaped
};

struct ClientConfig {
    std::string command = "mlld";                           // Worker executable (PATH lookup)
    std::vector<std::string> command_args;                  // Args placed before live_args
    std::vector<std::string> live_args{"live", "--stdio"};  // Selects the persistent mode
    std::optional<std::string> working_dir;                 // Worker cwd (default: inherit)
    int timeout_ms = 30000;                                 // Default per-request timeout (0 = none)
    StateUpdateConfig state_update;
    ShutdownConfig shutdown;
    LoggingConfig logging;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, ClientConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const ClientConfig &config, std::string &error);

}  // namespace runtime
}  // namespace mlld
