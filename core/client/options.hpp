#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mlld {
namespace client {

// Per-call settings for process(). Unset fields are left out of the request.
struct ProcessOptions {
    std::optional<std::string> file_path;  // file context for relative imports
    std::optional<nlohmann::json> payload;
    std::optional<nlohmann::json> state;
    std::optional<std::map<std::string, nlohmann::json>> dynamic_modules;
    std::optional<std::string> dynamic_module_source;
    std::optional<std::string> mode;  // "strict" | "markdown"
    std::optional<bool> allow_absolute_paths;
    std::optional<std::chrono::milliseconds> timeout;  // overrides the client default
};

// Per-call settings for execute(); the payload is passed separately
struct ExecuteOptions {
    std::optional<nlohmann::json> state;
    std::optional<std::map<std::string, nlohmann::json>> dynamic_modules;
    std::optional<std::string> dynamic_module_source;
    std::optional<std::string> mode;
    std::optional<bool> allow_absolute_paths;
    std::optional<std::chrono::milliseconds> timeout;
};

// Build the params object for a process request
nlohmann::json build_process_params(const std::string &script, const ProcessOptions &opts);

// Build the params object for an execute request
nlohmann::json build_execute_params(const std::string &filepath, const std::optional<nlohmann::json> &payload,
                                    const ExecuteOptions &opts);

}  // namespace client
}  // namespace mlld
