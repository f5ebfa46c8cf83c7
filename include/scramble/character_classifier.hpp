#pragma once

#include "core/types.hpp"

namespace scrambler {

/**
 * @brief ASCII-only character classification
 *
 * Bytes outside ASCII (including every byte of a multi-byte UTF-8 sequence)
 * are OTHER, so non-ASCII letters and digits are never treated as
 * LETTER/DIGIT.
 */
[[nodiscard]] inline constexpr CharClass classify(char c) noexcept {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) return CharClass::LETTER;
    if (c >= '0' && c <= '9') return CharClass::DIGIT;
    if (c == '-') return CharClass::HYPHEN;
    return CharClass::OTHER;
}

} // namespace scrambler
