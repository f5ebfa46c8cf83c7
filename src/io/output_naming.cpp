#include "io/output_naming.hpp"
#include "engine/request_parser.hpp"
#include "core/utils.hpp"

#include <format>

namespace scrambler {

static constexpr std::string_view kProcessedMarker = "PROCESSED";

std::string processed_filename(const std::filesystem::path& input,
                               RecordFormat format,
                               std::chrono::system_clock::time_point when) {
    return std::format("{}_{}_{}.{}",
        input.stem().string(),
        utils::format_compact_timestamp(when),
        kProcessedMarker,
        format_extension(format));
}

std::filesystem::path processed_output_path(
    const std::filesystem::path& output_dir,
    const std::filesystem::path& input,
    RecordFormat format,
    std::chrono::system_clock::time_point when) {
    return output_dir / processed_filename(input, format, when);
}

} // namespace scrambler
