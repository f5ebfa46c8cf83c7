#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace scrambler {

/**
 * @brief Outcome of one CLI invocation, printed as a single JSON object
 */
struct RunReport {
    std::string status;                     // "ok" | "error"
    std::string input;
    std::string output;
    size_t records_read = 0;
    size_t records_scrambled = 0;
    size_t records_passthrough = 0;
    int64_t elapsed_ms = 0;
    std::optional<std::string> error_kind;
    std::optional<std::string> error;
    std::optional<size_t> record_index;

    [[nodiscard]] static RunReport success(std::string input, std::string output,
                                           const RunStats& stats, int64_t elapsed_ms);
    [[nodiscard]] static RunReport failure(std::string input, const ScrambleError& err);
};

/// @throws std::runtime_error if serialisation fails
[[nodiscard]] std::string to_json(const RunReport& report);

} // namespace scrambler
