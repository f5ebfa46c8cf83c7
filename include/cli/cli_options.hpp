#pragma once

#include "engine/request_parser.hpp"

#include <optional>
#include <string>

namespace scrambler {

/**
 * @brief Command line of one scrambler invocation
 *
 * Request flags land in overrides and are layered over the config file's
 * [request] section by merge_request_fields().
 */
struct CliOptions {
    std::string input;
    std::optional<std::string> config_file;
    RequestFields overrides;
    std::optional<std::string> seed;
    std::optional<std::string> output_dir;
    std::optional<std::string> output;
    bool help = false;
};

/**
 * @brief Parse argv into opts
 * @return Usage error message, or std::nullopt on success
 */
[[nodiscard]] std::optional<std::string> parse_cli_args(int argc, const char* const argv[],
                                                        CliOptions& opts);

// Flags that were given win over the config file's defaults
[[nodiscard]] RequestFields merge_request_fields(RequestFields base,
                                                 const RequestFields& overrides);

} // namespace scrambler
