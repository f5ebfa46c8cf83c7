#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace scrambler::utf8 {

/**
 * @brief Byte length of the UTF-8 sequence introduced by a lead byte
 * @return 1-4, or 0 if the byte cannot start a sequence
 */
[[nodiscard]] inline constexpr size_t sequence_length(unsigned char lead) noexcept {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return lead >= 0xC2 ? 2 : 0;   // C0/C1 are overlong
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return lead <= 0xF4 ? 4 : 0;
    return 0;
}

/**
 * @brief Find the first byte offset where text stops being valid UTF-8
 * @return std::nullopt when the whole input is valid
 */
[[nodiscard]] std::optional<size_t> find_invalid(std::string_view text) noexcept;

// Number of code points in valid UTF-8 text
[[nodiscard]] size_t length(std::string_view text) noexcept;

/**
 * @brief Byte offset of the code point at char_index
 *
 * Returns text.size() when char_index is at or past the end.
 */
[[nodiscard]] size_t byte_offset(std::string_view text, size_t char_index) noexcept;

} // namespace scrambler::utf8
