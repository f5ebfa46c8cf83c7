#include "core/utf8.hpp"

namespace scrambler::utf8 {

std::optional<size_t> find_invalid(std::string_view text) noexcept {
    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        const size_t len = sequence_length(lead);
        if (len == 0 || i + len > text.size()) return i;

        // Continuation bytes must be 10xxxxxx
        for (size_t k = 1; k < len; ++k) {
            if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80) return i;
        }

        // Reject overlong 3/4-byte forms, surrogates and values above U+10FFFF
        if (len == 3) {
            const auto b1 = static_cast<unsigned char>(text[i + 1]);
            if (lead == 0xE0 && b1 < 0xA0) return i;
            if (lead == 0xED && b1 >= 0xA0) return i;
        } else if (len == 4) {
            const auto b1 = static_cast<unsigned char>(text[i + 1]);
            if (lead == 0xF0 && b1 < 0x90) return i;
            if (lead == 0xF4 && b1 >= 0x90) return i;
        }
        i += len;
    }
    return std::nullopt;
}

size_t length(std::string_view text) noexcept {
    size_t count = 0;
    for (const char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++count;
    }
    return count;
}

size_t byte_offset(std::string_view text, size_t char_index) noexcept {
    size_t seen = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) == 0x80) continue;
        if (seen == char_index) return i;
        ++seen;
    }
    return text.size();
}

} // namespace scrambler::utf8
