#include "cli/cli_options.hpp"

#include <format>
#include <string_view>
#include <utility>

namespace scrambler {

std::optional<std::string> parse_cli_args(int argc, const char* const argv[],
                                          CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        auto take_value = [&](std::string& out) -> bool {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };
        auto take_optional = [&](std::optional<std::string>& out) -> bool {
            std::string value;
            if (!take_value(value)) return false;
            out = std::move(value);
            return true;
        };

        bool ok = true;
        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--config") {
            ok = take_optional(opts.config_file);
        } else if (arg == "--format") {
            ok = take_value(opts.overrides.format);
        } else if (arg == "--start") {
            ok = take_value(opts.overrides.start_pos);
        } else if (arg == "--end") {
            ok = take_optional(opts.overrides.end_pos);
        } else if (arg == "--data-type") {
            ok = take_value(opts.overrides.data_type);
        } else if (arg == "--method") {
            ok = take_value(opts.overrides.method);
        } else if (arg == "--header") {
            opts.overrides.has_header = "true";
        } else if (arg == "--letter") {
            ok = take_optional(opts.overrides.letter_replacement);
        } else if (arg == "--digit") {
            ok = take_optional(opts.overrides.digit_replacement);
        } else if (arg == "--seed") {
            ok = take_optional(opts.seed);
        } else if (arg == "--output-dir") {
            ok = take_optional(opts.output_dir);
        } else if (arg == "--output") {
            ok = take_optional(opts.output);
        } else if (arg.starts_with("--")) {
            return std::format("Unknown option: {}", arg);
        } else if (opts.input.empty()) {
            opts.input = std::string(arg);
        } else {
            return std::format("Unexpected argument: {}", arg);
        }

        if (!ok) return std::format("Missing value for {}", arg);
    }

    if (!opts.help && opts.input.empty()) return "Missing input file";
    return std::nullopt;
}

RequestFields merge_request_fields(RequestFields base, const RequestFields& overrides) {
    if (!overrides.format.empty()) base.format = overrides.format;
    if (!overrides.start_pos.empty()) base.start_pos = overrides.start_pos;
    if (overrides.end_pos) base.end_pos = overrides.end_pos;
    if (!overrides.data_type.empty()) base.data_type = overrides.data_type;
    if (!overrides.method.empty()) base.method = overrides.method;
    if (overrides.has_header) base.has_header = overrides.has_header;
    if (overrides.letter_replacement) base.letter_replacement = overrides.letter_replacement;
    if (overrides.digit_replacement) base.digit_replacement = overrides.digit_replacement;
    return base;
}

} // namespace scrambler
