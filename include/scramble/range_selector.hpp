#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace scrambler {

/**
 * @brief Character span [begin, end) of a line record, in characters
 */
struct LineSelection {
    size_t begin = 0;
    size_t end = 0;
};

/**
 * @brief Resolves the part of each record a strategy applies to
 *
 * Positions are 1-indexed and inclusive, as the caller sees them.
 */
class RangeSelector {
public:
    RangeSelector(int64_t start_pos, std::optional<int64_t> end_pos)
        : start_pos_(start_pos), end_pos_(end_pos) {}

    /**
     * @brief Span of a line with record_length characters
     * @return std::nullopt when the line is shorter than start_pos (passthrough)
     */
    [[nodiscard]] std::optional<LineSelection> select_line(size_t record_length) const;

    /**
     * @brief Column index for a row with field_count fields
     * @return std::nullopt when the row has no such column (passthrough)
     */
    [[nodiscard]] std::optional<size_t> select_column(size_t field_count) const;

private:
    int64_t start_pos_;
    std::optional<int64_t> end_pos_;
};

} // namespace scrambler
