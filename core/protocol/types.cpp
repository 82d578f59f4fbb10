#include "types.hpp"

#include <unordered_set>
#include <utility>

namespace mlld {
namespace protocol {

namespace {

template <typename T>
void read_optional(const nlohmann::json &j, const char *key, std::optional<T> &out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
        return;
    }
    out = it->get<T>();
}

template <typename T>
void read_defaulted(const nlohmann::json &j, const char *key, T &out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out = T{};
        return;
    }
    out = it->get<T>();
}

}  // namespace

void to_json(nlohmann::json &j, const StateWrite &write) {
    j = nlohmann::json{{"path", write.path}, {"value", write.value}};
    if (write.timestamp) {
        j["timestamp"] = *write.timestamp;
    }
}

void from_json(const nlohmann::json &j, StateWrite &write) {
    j.at("path").get_to(write.path);
    auto it = j.find("value");
    write.value = (it == j.end()) ? nlohmann::json() : *it;
    read_optional(j, "timestamp", write.timestamp);
}

void from_json(const nlohmann::json &j, Effect &effect) {
    j.at("type").get_to(effect.type);
    read_optional(j, "content", effect.content);
    read_optional(j, "security", effect.security);
}

void from_json(const nlohmann::json &j, Metrics &metrics) {
    j.at("totalMs").get_to(metrics.total_ms);
    j.at("parseMs").get_to(metrics.parse_ms);
    j.at("evaluateMs").get_to(metrics.evaluate_ms);
}

void from_json(const nlohmann::json &j, ExecuteResult &result) {
    j.at("output").get_to(result.output);
    read_defaulted(j, "stateWrites", result.state_writes);
    auto exports = j.find("exports");
    result.exports = (exports == j.end()) ? nlohmann::json() : *exports;
    read_defaulted(j, "effects", result.effects);
    read_optional(j, "metrics", result.metrics);
}

void from_json(const nlohmann::json &j, AnalysisError &error) {
    j.at("message").get_to(error.message);
    read_optional(j, "line", error.line);
    read_optional(j, "column", error.column);
}

void from_json(const nlohmann::json &j, Executable &executable) {
    j.at("name").get_to(executable.name);
    read_defaulted(j, "params", executable.params);
    read_defaulted(j, "labels", executable.labels);
}

void from_json(const nlohmann::json &j, Import &import) {
    j.at("from").get_to(import.from);
    read_defaulted(j, "names", import.names);
}

void from_json(const nlohmann::json &j, Guard &guard) {
    j.at("name").get_to(guard.name);
    j.at("timing").get_to(guard.timing);
    read_optional(j, "label", guard.label);
}

void from_json(const nlohmann::json &j, Needs &needs) {
    read_defaulted(j, "cmd", needs.cmd);
    read_defaulted(j, "node", needs.node);
    read_defaulted(j, "py", needs.py);
}

void from_json(const nlohmann::json &j, AnalyzeResult &result) {
    j.at("filepath").get_to(result.filepath);
    j.at("valid").get_to(result.valid);
    read_defaulted(j, "errors", result.errors);
    read_defaulted(j, "executables", result.executables);
    read_defaulted(j, "exports", result.exports);
    read_defaulted(j, "imports", result.imports);
    read_defaulted(j, "guards", result.guards);
    read_optional(j, "needs", result.needs);
}

std::string state_write_key(const StateWrite &write) { return write.path + "|" + write.value.dump(); }

std::vector<StateWrite> merge_state_writes(std::vector<StateWrite> primary, std::vector<StateWrite> secondary) {
    if (secondary.empty()) {
        return primary;
    }
    if (primary.empty()) {
        return secondary;
    }

    std::vector<StateWrite> merged;
    merged.reserve(primary.size() + secondary.size());
    std::unordered_set<std::string> seen;

    for (auto *source : {&primary, &secondary}) {
        for (auto &write : *source) {
            if (seen.insert(state_write_key(write)).second) {
                merged.push_back(std::move(write));
            }
        }
    }

    return merged;
}

}  // namespace protocol
}  // namespace mlld
