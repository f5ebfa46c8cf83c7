#pragma once

#include "core/types.hpp"
#include "scramble/random_source.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace scrambler {

/**
 * @brief Per-character substitution
 *
 * Methods:
 * - SIMPLE:      letters -> configured letter, digits -> configured digit
 * - RANDOM:      letters -> random ASCII letter (either case), digits -> random digit
 * - INCREMENTAL: digits -> (d + r) mod 10 with r in [1, 9], never the input digit
 *
 * For every method a hyphen is kept and any other character becomes a space.
 * Letters and digits outside the data type filter are kept.
 */
class ScrambleStrategy {
public:
    /**
     * @throws std::invalid_argument if SIMPLE lacks a replacement the
     *         data type filter can reach
     */
    ScrambleStrategy(ScrambleMethod method,
                     DataType data_type,
                     IRandomSource& rng,
                     std::optional<char> letter_replacement = std::nullopt,
                     std::optional<char> digit_replacement = std::nullopt);

    [[nodiscard]] static ScrambleStrategy from_request(
        const ScrambleRequest& request, IRandomSource& rng);

    /// Transform a single byte
    [[nodiscard]] char apply(char c);

    /**
     * @brief Transform every character of a UTF-8 span
     *
     * Output has the same number of characters as the input. A multi-byte
     * character is OTHER and collapses to one space byte.
     */
    [[nodiscard]] std::string apply_span(std::string_view span);

private:
    [[nodiscard]] char replace_letter(char letter);
    [[nodiscard]] char replace_digit(char digit);

    ScrambleMethod method_;
    DataType data_type_;
    IRandomSource& rng_;
    std::optional<char> letter_replacement_;
    std::optional<char> digit_replacement_;
};

} // namespace scrambler
