#pragma once

/**
 * @file types.hpp
 * @brief Result shapes returned by the live worker
 *
 * The worker answers execute/analyze requests with camelCase JSON objects.
 * These structs are the typed view the client hands back to callers; the
 * nlohmann::json adapters below do the key mapping.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mlld {
namespace protocol {

// Client-assigned, strictly increasing per Client instance
using RequestId = uint64_t;

/**
 * @brief A write to the state:// protocol made by the worker during a request
 */
struct StateWrite {
    std::string path;
    nlohmann::json value;                  // null when the worker omitted it
    std::optional<std::string> timestamp;  // ISO-8601 as sent by the worker

    bool operator==(const StateWrite &other) const {
        return path == other.path && value == other.value && timestamp == other.timestamp;
    }
};

struct Effect {
    std::string type;
    std::optional<std::string> content;
    std::optional<nlohmann::json> security;
};

struct Metrics {
    double total_ms = 0.0;
    double parse_ms = 0.0;
    double evaluate_ms = 0.0;
};

// Structured output of an execute request
struct ExecuteResult {
    std::string output;
    std::vector<StateWrite> state_writes;
    nlohmann::json exports;  // null when absent
    std::vector<Effect> effects;
    std::optional<Metrics> metrics;
};

struct AnalysisError {
    std::string message;
    std::optional<uint32_t> line;
    std::optional<uint32_t> column;
};

struct Executable {
    std::string name;
    std::vector<std::string> params;
    std::vector<std::string> labels;
};

struct Import {
    std::string from;
    std::vector<std::string> names;
};

struct Guard {
    std::string name;
    std::string timing;
    std::optional<std::string> label;
};

// Capability requirements declared by a module
struct Needs {
    std::vector<std::string> cmd;
    std::vector<std::string> node;
    std::vector<std::string> py;
};

// Static analysis of a module
struct AnalyzeResult {
    std::string filepath;
    bool valid = false;
    std::vector<AnalysisError> errors;
    std::vector<Executable> executables;
    std::vector<std::string> exports;
    std::vector<Import> imports;
    std::vector<Guard> guards;
    std::optional<Needs> needs;
};

// JSON adapters. from_json throws nlohmann::json::exception when a required
// field is missing or has the wrong type.
void to_json(nlohmann::json &j, const StateWrite &write);
void from_json(const nlohmann::json &j, StateWrite &write);
void from_json(const nlohmann::json &j, Effect &effect);
void from_json(const nlohmann::json &j, Metrics &metrics);
void from_json(const nlohmann::json &j, ExecuteResult &result);
void from_json(const nlohmann::json &j, AnalysisError &error);
void from_json(const nlohmann::json &j, Executable &executable);
void from_json(const nlohmann::json &j, Import &import);
void from_json(const nlohmann::json &j, Guard &guard);
void from_json(const nlohmann::json &j, Needs &needs);
void from_json(const nlohmann::json &j, AnalyzeResult &result);

// Dedup key: "<path>|<serialized value>"
std::string state_write_key(const StateWrite &write);

// Concatenates primary then secondary, keeping the first occurrence of each key
std::vector<StateWrite> merge_state_writes(std::vector<StateWrite> primary, std::vector<StateWrite> secondary);

}  // namespace protocol
}  // namespace mlld
