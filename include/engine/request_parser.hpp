#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace scrambler {

namespace keys {
    inline constexpr std::string_view LINE = "line";
    inline constexpr std::string_view TXT = "txt";
    inline constexpr std::string_view TEXT = "text";
    inline constexpr std::string_view DELIMITED = "delimited";
    inline constexpr std::string_view CSV = "csv";

    inline constexpr std::string_view STRING = "string";
    inline constexpr std::string_view NUMBER = "number";
    inline constexpr std::string_view BOTH = "both";

    inline constexpr std::string_view SIMPLE = "simple";
    inline constexpr std::string_view RANDOM = "random";
    inline constexpr std::string_view INCREMENTAL = "incremental";
}

// ============================================================================
// Enum <-> name (lookups are case-insensitive)
// ============================================================================

[[nodiscard]] std::string_view format_to_string(RecordFormat format);
[[nodiscard]] std::string_view data_type_to_string(DataType type);
[[nodiscard]] std::string_view method_to_string(ScrambleMethod method);

/// File extension used for outputs of a format ("txt" or "csv")
[[nodiscard]] std::string_view format_extension(RecordFormat format);

[[nodiscard]] std::optional<RecordFormat> parse_record_format(std::string_view name);
[[nodiscard]] std::optional<DataType> parse_data_type(std::string_view name);
[[nodiscard]] std::optional<ScrambleMethod> parse_method(std::string_view name);

// ============================================================================
// Textual request
// ============================================================================

/**
 * @brief A scramble request as the caller spells it (flags, config keys)
 *
 * Empty optional strings are treated as absent.
 */
struct RequestFields {
    std::string format;
    std::string start_pos;
    std::optional<std::string> end_pos;
    std::string data_type;
    std::string method;
    std::optional<std::string> has_header;
    std::optional<std::string> letter_replacement;
    std::optional<std::string> digit_replacement;
};

/**
 * @brief Convert textual fields into a typed request
 *
 * Reports UNKNOWN_VARIANT for unrecognised format/data type/method names,
 * INVALID_RANGE for non-integer positions and MISSING_CONFIGURATION for
 * replacements that are not a single character. Semantic checks are left to
 * ScrambleEngine::validate.
 */
[[nodiscard]] Result<ScrambleRequest> parse_request(const RequestFields& fields);

} // namespace scrambler
