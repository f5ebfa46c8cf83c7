#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace scrambler {

/**
 * @brief Error kinds surfaced by the scrambler
 *
 * Validation kinds are reported before any record is read. Runtime kinds
 * carry the 0-based index of the record being processed when they occurred.
 */
enum class ErrorKind {
    NONE,
    INVALID_RANGE,
    UNSUPPORTED_COMBINATION,
    MISSING_CONFIGURATION,
    UNKNOWN_VARIANT,
    PROCESSING_FAILURE,
    IO_FAILURE,
    CANCELLED
};

[[nodiscard]] inline std::string_view error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                    return "none";
        case ErrorKind::INVALID_RANGE:           return "invalid_range";
        case ErrorKind::UNSUPPORTED_COMBINATION: return "unsupported_combination";
        case ErrorKind::MISSING_CONFIGURATION:   return "missing_configuration";
        case ErrorKind::UNKNOWN_VARIANT:         return "unknown_variant";
        case ErrorKind::PROCESSING_FAILURE:      return "processing_failure";
        case ErrorKind::IO_FAILURE:              return "io_failure";
        case ErrorKind::CANCELLED:               return "cancelled";
    }
    return "unknown";
}

struct ScrambleError {
    ErrorKind kind = ErrorKind::NONE;
    std::string message;
    std::optional<size_t> record_index;

    ScrambleError() = default;
    ScrambleError(ErrorKind k, std::string msg,
                  std::optional<size_t> index = std::nullopt)
        : kind(k), message(std::move(msg)), record_index(index) {}
};

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ScrambleError err) {
        Result r;
        r.success_ = false;
        r.error_ = std::move(err);
        return r;
    }

    static Result error(ErrorKind kind, std::string message,
                        std::optional<size_t> record_index = std::nullopt) {
        return error(ScrambleError(kind, std::move(message), record_index));
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    const ScrambleError& error() const { return error_; }
    ErrorKind error_kind() const { return error_.kind; }
    const std::string& error_message() const { return error_.message; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ScrambleError error_;
};

} // namespace scrambler
