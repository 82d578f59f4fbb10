#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>

#include "../logging/logger.hpp"

namespace mlld {
namespace runtime {

namespace {

void load_string_list(const YAML::Node &node, std::vector<std::string> &out) {
    out.clear();
    if (node.IsSequence()) {
        for (const auto &item : node) {
            out.push_back(item.as<std::string>());
        }
    } else if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
    }
}

}  // namespace

bool validate_config(const ClientConfig &config, std::string &error) {
    if (config.command.empty()) {
        error = "Worker 'command' must not be empty";
        return false;
    }

    if (config.timeout_ms < 0) {
        error = "timeout_ms must be >= 0 (0 disables the default timeout)";
        return false;
    }

    if (config.working_dir && config.working_dir->empty()) {
        error = "working_dir must not be an empty string";
        return false;
    }

    // Validate state update retry settings
    if (config.state_update.retry_interval_ms < 1) {
        error = "state_update.retry_interval_ms must be >= 1";
        return false;
    }
    if (config.state_update.default_wait_ms < 0) {
        error = "state_update.default_wait_ms must be >= 0";
        return false;
    }

    // Validate shutdown settings
    if (config.shutdown.graceful_timeout_ms < 0) {
        error = "shutdown.graceful_timeout_ms must be >= 0";
        return false;
    }
    if (config.shutdown.kill_wait_ms < 1) {
        error = "shutdown.kill_wait_ms must be >= 1";
        return false;
    }

    // Validate Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, ClientConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"worker", "timeout_ms", "state_update", "shutdown", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        // Load worker launch config
        if (yaml["worker"]) {
            const auto &worker = yaml["worker"];
            if (worker["command"]) {
                config.command = worker["command"].as<std::string>();
            }
            if (worker["args"]) {
                load_string_list(worker["args"], config.command_args);
            }
            if (worker["live_args"]) {
                load_string_list(worker["live_args"], config.live_args);
            }
            if (worker["working_dir"]) {
                config.working_dir = worker["working_dir"].as<std::string>();
            }
        }

        if (yaml["timeout_ms"]) {
            config.timeout_ms = yaml["timeout_ms"].as<int>();
        }

        // Load state update retry config
        if (yaml["state_update"]) {
            if (yaml["state_update"]["retry_interval_ms"]) {
                config.state_update.retry_interval_ms = yaml["state_update"]["retry_interval_ms"].as<int>();
            }
            if (yaml["state_update"]["default_wait_ms"]) {
                config.state_update.default_wait_ms = yaml["state_update"]["default_wait_ms"].as<int>();
            }
        }

        // Load shutdown config
        if (yaml["shutdown"]) {
            if (yaml["shutdown"]["graceful_timeout_ms"]) {
                config.shutdown.graceful_timeout_ms = yaml["shutdown"]["graceful_timeout_ms"].as<int>();
            }
            if (yaml["shutdown"]["kill_wait_ms"]) {
                config.shutdown.kill_wait_ms = yaml["shutdown"]["kill_wait_ms"].as<int>();
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        return validate_config(config, error);
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace mlld
