#include "scramble/range_selector.hpp"

#include <algorithm>

namespace scrambler {

std::optional<LineSelection> RangeSelector::select_line(size_t record_length) const {
    if (start_pos_ < 1) return std::nullopt;

    const auto start = static_cast<size_t>(start_pos_);
    if (record_length < start) return std::nullopt;

    size_t actual_end = record_length;
    if (end_pos_) {
        // An end before the start leaves an empty span rather than a negative one
        const auto end = static_cast<size_t>(std::max<int64_t>(*end_pos_, start_pos_ - 1));
        actual_end = std::min(end, record_length);
    }
    return LineSelection{start - 1, actual_end};
}

std::optional<size_t> RangeSelector::select_column(size_t field_count) const {
    if (start_pos_ < 1) return std::nullopt;

    const auto column_index = static_cast<size_t>(start_pos_ - 1);
    if (field_count <= column_index) return std::nullopt;
    return column_index;
}

} // namespace scrambler
