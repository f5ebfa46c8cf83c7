#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace scrambler {

// ============================================================================
// Basic Enums
// ============================================================================

enum class RecordFormat {
    LINE,           // Free text, one record per line, positions are characters
    DELIMITED_ROW   // Delimited rows, position selects a column
};

enum class DataType {
    STRING,
    NUMBER,
    BOTH
};

enum class ScrambleMethod {
    SIMPLE,
    RANDOM,
    INCREMENTAL
};

enum class CharClass {
    LETTER,
    DIGIT,
    HYPHEN,
    OTHER
};

// Data type filter as a bitmask over the replaceable classes
namespace class_mask {
    inline constexpr uint8_t kLetter = 1u << 0;
    inline constexpr uint8_t kDigit  = 1u << 1;

    [[nodiscard]] inline constexpr uint8_t of(DataType t) noexcept {
        switch (t) {
            case DataType::STRING: return kLetter;
            case DataType::NUMBER: return kDigit;
            case DataType::BOTH:   return kLetter | kDigit;
        }
        return 0;
    }
    [[nodiscard]] inline constexpr bool letters(DataType t) noexcept {
        return (of(t) & kLetter) != 0;
    }
    [[nodiscard]] inline constexpr bool digits(DataType t) noexcept {
        return (of(t) & kDigit) != 0;
    }
}

// ============================================================================
// Scramble Request
// ============================================================================

/**
 * @brief One scramble invocation: where to look and how to transform
 *
 * start_pos is 1-indexed and inclusive. For LINE it is a character position,
 * for DELIMITED_ROW it is the column number. end_pos applies to LINE only and
 * defaults to the end of each record.
 */
struct ScrambleRequest {
    RecordFormat format = RecordFormat::LINE;
    int64_t start_pos = 1;
    std::optional<int64_t> end_pos;
    DataType data_type = DataType::BOTH;
    ScrambleMethod method = ScrambleMethod::SIMPLE;
    bool has_header = false;
    std::optional<char> letter_replacement;
    std::optional<char> digit_replacement;
};

// ============================================================================
// Run Statistics
// ============================================================================

struct RunStats {
    size_t records_read = 0;
    size_t records_scrambled = 0;
    size_t records_passthrough = 0;     // Header + records outside the selection
};

} // namespace scrambler
