#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace mlld {
namespace client {

/**
 * @brief Failure categories surfaced to callers
 *
 * - WORKER: the worker ran and reported a structured failure (message + optional code)
 * - TRANSPORT: spawn/pipe failure, unexpected disconnect, malformed reply stream
 * - TIMEOUT: no terminal reply within the configured duration
 * - VALIDATION: rejected before any round trip (e.g. blank state path)
 * - USAGE: programming error such as waiting on a handle whose receiver was consumed
 */
enum class ErrorKind { NONE, WORKER, TRANSPORT, TIMEOUT, VALIDATION, USAGE };

inline const char *error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:
            return "NONE";
        case ErrorKind::WORKER:
            return "WORKER";
        case ErrorKind::TRANSPORT:
            return "TRANSPORT";
        case ErrorKind::TIMEOUT:
            return "TIMEOUT";
        case ErrorKind::VALIDATION:
            return "VALIDATION";
        case ErrorKind::USAGE:
            return "USAGE";
        default:
            return "TRANSPORT";
    }
}

struct Error {
    ErrorKind kind = ErrorKind::NONE;
    std::string message;
    std::optional<std::string> code;        // worker error code, e.g. "REQUEST_NOT_FOUND"
    std::chrono::milliseconds timeout{0};  // set for TIMEOUT

    bool ok() const { return kind == ErrorKind::NONE; }
    bool has_code(const std::string &expected) const { return code && *code == expected; }

    void clear() { *this = Error{}; }

    std::string to_string() const {
        switch (kind) {
            case ErrorKind::NONE:
                return "ok";
            case ErrorKind::WORKER:
                return "mlld error: " + message + (code ? " (" + *code + ")" : "");
            case ErrorKind::TRANSPORT:
                return "transport error: " + message;
            case ErrorKind::TIMEOUT:
                return "timeout after " + std::to_string(timeout.count()) + "ms";
            case ErrorKind::VALIDATION:
                return "validation error: " + message;
            case ErrorKind::USAGE:
                return "usage error: " + message;
            default:
                return message;
        }
    }

    static Error worker(std::string message, std::optional<std::string> code = std::nullopt) {
        Error e;
        e.kind = ErrorKind::WORKER;
        e.message = std::move(message);
        e.code = std::move(code);
        return e;
    }

    static Error transport(std::string message) {
        Error e;
        e.kind = ErrorKind::TRANSPORT;
        e.message = std::move(message);
        return e;
    }

    static Error timed_out(std::chrono::milliseconds limit) {
        Error e;
        e.kind = ErrorKind::TIMEOUT;
        e.timeout = limit;
        e.message = "timeout after " + std::to_string(limit.count()) + "ms";
        return e;
    }

    static Error validation(std::string message) {
        Error e;
        e.kind = ErrorKind::VALIDATION;
        e.message = std::move(message);
        return e;
    }

    static Error usage(std::string message) {
        Error e;
        e.kind = ErrorKind::USAGE;
        e.message = std::move(message);
        return e;
    }
};

}  // namespace client
}  // namespace mlld
