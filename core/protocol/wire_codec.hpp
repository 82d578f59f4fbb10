#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace mlld {
namespace protocol {

// Line protocol spoken over the worker's stdin/stdout.
//
//   client -> worker: {"method": <string>, "id": <integer>, "params": <object>}
//   worker -> client: {"event":  {"id": <id>, "type": <string>, ...}}
//                     {"result": {"id": <id>, "error"?: {"message", "code"?}, ...}}
//
// One JSON object per line, newline-terminated, UTF-8.

namespace methods {
constexpr const char *kProcess = "process";
constexpr const char *kExecute = "execute";
constexpr const char *kAnalyze = "analyze";
constexpr const char *kCancel = "cancel";
constexpr const char *kStateUpdate = "state:update";
}  // namespace methods

// Error codes the worker puts in result.error.code
namespace error_codes {
constexpr const char *kRequestNotFound = "REQUEST_NOT_FOUND";
constexpr const char *kRequestInProgress = "REQUEST_IN_PROGRESS";
constexpr const char *kInvalidJson = "INVALID_JSON";
constexpr const char *kInvalidRequest = "INVALID_REQUEST";
constexpr const char *kMethodNotFound = "METHOD_NOT_FOUND";
constexpr const char *kAborted = "ABORTED";
constexpr const char *kTimeout = "TIMEOUT";
constexpr const char *kRuntimeError = "RUNTIME_ERROR";
}  // namespace error_codes

constexpr const char *kStateWriteEventType = "state:write";
constexpr const char *kDefaultWorkerErrorMessage = "mlld request failed";

// A decoded worker line. Either member may be present; the worker only ever
// sends one of them per line.
struct Envelope {
    std::optional<nlohmann::json> event;
    std::optional<nlohmann::json> result;
};

struct WorkerErrorInfo {
    std::string message;
    std::optional<std::string> code;
};

// Serialize a request line (no trailing newline)
std::string encode_request(const std::string &method, RequestId id, const nlohmann::json &params);

// Serialize a cancel line; cancel carries no params
std::string encode_cancel(RequestId id);

// Parse one non-blank line from the worker.
// Returns false and sets error when the line is not valid JSON.
bool decode_envelope(const std::string &line, Envelope &envelope, std::string &error);

// Accepts a non-negative integer or a string holding one
std::optional<RequestId> parse_request_id(const nlohmann::json &value);

// Reads the id embedded in an event or result payload
std::optional<RequestId> payload_request_id(const nlohmann::json &payload);

// True when a result payload reports failure
bool result_has_error(const nlohmann::json &result);

WorkerErrorInfo decode_worker_error(const nlohmann::json &error_payload);

// Returns the write carried by a {"type": "state:write", "write": {...}} event
std::optional<StateWrite> parse_state_write_event(const nlohmann::json &event);

}  // namespace protocol
}  // namespace mlld
