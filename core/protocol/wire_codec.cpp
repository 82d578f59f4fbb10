#include "wire_codec.hpp"

#include <cctype>
#include <limits>

namespace mlld {
namespace protocol {

std::string encode_request(const std::string &method, RequestId id, const nlohmann::json &params) {
    nlohmann::json request = {{"method", method}, {"id", id}, {"params", params}};
    // dump() escapes embedded newlines, so the line stays a single line
    return request.dump();
}

std::string encode_cancel(RequestId id) {
    nlohmann::json request = {{"method", methods::kCancel}, {"id", id}};
    return request.dump();
}

bool decode_envelope(const std::string &line, Envelope &envelope, std::string &error) {
    envelope = Envelope{};

    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error &e) {
        error = e.what();
        return false;
    }

    if (!parsed.is_object()) {
        // Valid JSON without an envelope shape carries nothing routable
        return true;
    }

    auto event = parsed.find("event");
    if (event != parsed.end()) {
        envelope.event = *event;
    }
    auto result = parsed.find("result");
    if (result != parsed.end()) {
        envelope.result = *result;
    }
    return true;
}

std::optional<RequestId> parse_request_id(const nlohmann::json &value) {
    if (value.is_number_unsigned()) {
        return value.get<RequestId>();
    }
    if (value.is_number_integer()) {
        auto signed_id = value.get<int64_t>();
        if (signed_id < 0) {
            return std::nullopt;
        }
        return static_cast<RequestId>(signed_id);
    }
    if (value.is_string()) {
        const auto &text = value.get_ref<const std::string &>();
        if (text.empty() || text.size() > 20) {
            return std::nullopt;
        }
        RequestId id = 0;
        for (char c : text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
            RequestId digit = static_cast<RequestId>(c - '0');
            if (id > (std::numeric_limits<RequestId>::max() - digit) / 10) {
                return std::nullopt;
            }
            id = id * 10 + digit;
        }
        return id;
    }
    return std::nullopt;
}

std::optional<RequestId> payload_request_id(const nlohmann::json &payload) {
    if (!payload.is_object()) {
        return std::nullopt;
    }
    auto it = payload.find("id");
    if (it == payload.end()) {
        return std::nullopt;
    }
    return parse_request_id(*it);
}

bool result_has_error(const nlohmann::json &result) {
    if (!result.is_object()) {
        return false;
    }
    auto it = result.find("error");
    return it != result.end() && !it->is_null();
}

WorkerErrorInfo decode_worker_error(const nlohmann::json &error_payload) {
    WorkerErrorInfo info;
    info.message = kDefaultWorkerErrorMessage;

    if (!error_payload.is_object()) {
        return info;
    }

    auto message = error_payload.find("message");
    if (message != error_payload.end() && message->is_string()) {
        info.message = message->get<std::string>();
    }
    auto code = error_payload.find("code");
    if (code != error_payload.end() && code->is_string()) {
        info.code = code->get<std::string>();
    }
    return info;
}

std::optional<StateWrite> parse_state_write_event(const nlohmann::json &event) {
    if (!event.is_object()) {
        return std::nullopt;
    }

    auto type = event.find("type");
    if (type == event.end() || !type->is_string() || type->get_ref<const std::string &>() != kStateWriteEventType) {
        return std::nullopt;
    }

    auto write = event.find("write");
    if (write == event.end() || !write->is_object()) {
        return std::nullopt;
    }

    auto path = write->find("path");
    if (path == write->end() || !path->is_string()) {
        return std::nullopt;
    }

    StateWrite state_write;
    state_write.path = path->get<std::string>();

    auto value = write->find("value");
    if (value != write->end()) {
        state_write.value = *value;
    }

    auto timestamp = write->find("timestamp");
    if (timestamp != write->end() && timestamp->is_string()) {
        state_write.timestamp = timestamp->get<std::string>();
    }

    return state_write;
}

}  // namespace protocol
}  // namespace mlld
