#pragma once

#include "core/types.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace scrambler {

/**
 * @brief Name of a processed file: <stem>_<YYYYMMDD_HHMMSS>_PROCESSED.<ext>
 *
 * The extension follows the record format ("txt" or "csv"), not the input.
 */
[[nodiscard]] std::string processed_filename(const std::filesystem::path& input,
                                             RecordFormat format,
                                             std::chrono::system_clock::time_point when);

[[nodiscard]] std::filesystem::path processed_output_path(
    const std::filesystem::path& output_dir,
    const std::filesystem::path& input,
    RecordFormat format,
    std::chrono::system_clock::time_point when);

} // namespace scrambler
