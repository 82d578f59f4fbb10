// mlld-live
// Runs one process/execute/analyze request against a persistent mlld worker

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "client/client.hpp"
#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/signal_handler.hpp"

namespace {

void print_usage() {
    std::cerr << "Usage: mlld-live [OPTIONS] <process|execute|analyze> <file>\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config=PATH      Path to YAML config file\n";
    std::cerr << "  --payload=JSON     Payload injected as @payload\n";
    std::cerr << "  --state=JSON       Initial state injected as @state\n";
    std::cerr << "  --timeout=MS       Per-request timeout (overrides config)\n";
    std::cerr << "  --help, -h         Show this help\n";
}

bool parse_json_arg(const std::string &name, const std::string &text, nlohmann::json &out) {
    try {
        out = nlohmann::json::parse(text);
        return true;
    } catch (const nlohmann::json::parse_error &e) {
        std::cerr << "ERROR: Invalid JSON for " << name << ": " << e.what() << "\n";
        return false;
    }
}

nlohmann::json analyze_to_json(const mlld::protocol::AnalyzeResult &result) {
    nlohmann::json out = {{"filepath", result.filepath}, {"valid", result.valid}};

    nlohmann::json errors = nlohmann::json::array();
    for (const auto &error : result.errors) {
        nlohmann::json item = {{"message", error.message}};
        if (error.line) item["line"] = *error.line;
        if (error.column) item["column"] = *error.column;
        errors.push_back(item);
    }
    out["errors"] = errors;

    nlohmann::json executables = nlohmann::json::array();
    for (const auto &exe : result.executables) {
        executables.push_back({{"name", exe.name}, {"params", exe.params}, {"labels", exe.labels}});
    }
    out["executables"] = executables;
    out["exports"] = result.exports;

    nlohmann::json imports = nlohmann::json::array();
    for (const auto &import : result.imports) {
        imports.push_back({{"from", import.from}, {"names", import.names}});
    }
    out["imports"] = imports;

    nlohmann::json guards = nlohmann::json::array();
    for (const auto &guard : result.guards) {
        nlohmann::json item = {{"name", guard.name}, {"timing", guard.timing}};
        if (guard.label) item["label"] = *guard.label;
        guards.push_back(item);
    }
    out["guards"] = guards;

    if (result.needs) {
        out["needs"] = {{"cmd", result.needs->cmd}, {"node", result.needs->node}, {"py", result.needs->py}};
    }
    return out;
}

// Closes the client when SIGINT/SIGTERM arrives so a blocked wait returns
class ShutdownWatcher {
public:
    explicit ShutdownWatcher(mlld::client::Client &client) : client_(client) {
        thread_ = std::thread([this]() {
            while (!done_.load()) {
                if (mlld::runtime::SignalHandler::is_shutdown_requested()) {
                    LOG_INFO("Signal received, stopping worker...");
                    client_.close();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        });
    }

    ~ShutdownWatcher() {
        done_.store(true);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    mlld::client::Client &client_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

}  // namespace

int main(int argc, char **argv) {
    std::string config_path;
    std::string command;
    std::string file;
    std::optional<nlohmann::json> payload;
    std::optional<nlohmann::json> state;
    std::optional<int> timeout_ms;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(9);
        } else if (arg.rfind("--payload=", 0) == 0) {
            nlohmann::json value;
            if (!parse_json_arg("--payload", arg.substr(10), value)) {
                return 1;
            }
            payload = value;
        } else if (arg.rfind("--state=", 0) == 0) {
            nlohmann::json value;
            if (!parse_json_arg("--state", arg.substr(8), value)) {
                return 1;
            }
            state = value;
        } else if (arg.rfind("--timeout=", 0) == 0) {
            try {
                timeout_ms = std::stoi(arg.substr(10));
            } catch (const std::exception &) {
                std::cerr << "ERROR: Invalid --timeout value: " << arg.substr(10) << "\n";
                return 1;
            }
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        } else if (command.empty()) {
            command = arg;
        } else if (file.empty()) {
            file = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return 1;
        }
    }

    if (command != "process" && command != "execute" && command != "analyze") {
        print_usage();
        return 1;
    }
    if (file.empty()) {
        std::cerr << "ERROR: Missing <file> argument\n";
        return 1;
    }

    mlld::runtime::ClientConfig config;
    std::string error;
    if (!config_path.empty()) {
        if (!std::filesystem::exists(config_path)) {
            // Using cerr here as logger might not be configured yet
            std::cerr << "ERROR: Config file not found: " << config_path << "\n";
            return 1;
        }
        if (!mlld::runtime::load_config(config_path, config, error)) {
            LOG_ERROR("Failed to load config: " << error);
            return 1;
        }
    }
    if (timeout_ms) {
        config.timeout_ms = *timeout_ms;
    }
    if (!mlld::runtime::validate_config(config, error)) {
        LOG_ERROR("Invalid configuration: " << error);
        return 1;
    }

    // Environment wins over the config file
    mlld::logging::Logger::set_level(mlld::logging::string_to_level(config.logging.level));
    mlld::logging::Logger::init_from_env();

    mlld::runtime::SignalHandler::install();

    mlld::client::Client client(config);
    mlld::client::Error request_error;
    bool ok = false;
    {
        ShutdownWatcher watcher(client);

        if (command == "process") {
            std::ifstream in(file);
            if (!in) {
                LOG_ERROR("Cannot read script file: " << file);
                return 1;
            }
            std::stringstream script;
            script << in.rdbuf();

            mlld::client::ProcessOptions opts;
            opts.file_path = file;
            opts.payload = payload;
            opts.state = state;
            std::string output;
            ok = client.process(script.str(), opts, output, request_error);
            if (ok) {
                std::cout << output;
            }
        } else if (command == "execute") {
            mlld::client::ExecuteOptions opts;
            opts.state = state;
            mlld::protocol::ExecuteResult result;
            ok = client.execute(file, payload, opts, result, request_error);
            if (ok) {
                std::cout << result.output;
                for (const auto &write : result.state_writes) {
                    LOG_INFO("state write: " << write.path << " = " << write.value.dump());
                }
            }
        } else {
            mlld::protocol::AnalyzeResult result;
            ok = client.analyze(file, result, request_error);
            if (ok) {
                std::cout << analyze_to_json(result).dump(2) << "\n";
            }
        }
    }

    client.close();

    if (mlld::runtime::SignalHandler::is_shutdown_requested()) {
        LOG_INFO("Interrupted by signal " << mlld::runtime::SignalHandler::last_signal());
        return 128 + mlld::runtime::SignalHandler::last_signal();
    }
    if (!ok) {
        LOG_ERROR(request_error.to_string());
        return 1;
    }
    return 0;
}
