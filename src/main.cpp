#include "cli/cli_options.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "engine/request_parser.hpp"
#include "engine/run_report.hpp"
#include "engine/scramble_engine.hpp"
#include "io/output_naming.hpp"
#include "scramble/random_source.hpp"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

using namespace scrambler;

namespace {

std::atomic<bool> g_cancel{false};

void signal_handler(int /*signal*/) {
    g_cancel.store(true, std::memory_order_relaxed);
}

constexpr std::string_view kUsage =
    "Usage: scrambler <input-file> [options]\n"
    "\n"
    "Options:\n"
    "  --config FILE        TOML config (logging, engine, delimited, request defaults)\n"
    "  --format NAME        line | csv\n"
    "  --start N            1-indexed start position (line) or column (csv)\n"
    "  --end N              1-indexed inclusive end position (line only)\n"
    "  --data-type NAME     String | Number | Both\n"
    "  --method NAME        simple | random | incremental\n"
    "  --header             first record is a header and is left untouched\n"
    "  --letter C           simple method: letter replacement\n"
    "  --digit C            simple method: digit replacement\n"
    "  --seed N             seed for random and incremental methods\n"
    "  --output-dir DIR     directory for the derived output name\n"
    "  --output FILE        explicit output path\n"
    "  --help               show this message\n";

int fail(const std::string& input, const ScrambleError& err) {
    utils::log::error(std::format("{}: {}", error_kind_to_string(err.kind), err.message));
    std::cout << to_json(RunReport::failure(input, err)) << '\n';
    return 1;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        CliOptions opts;
        if (const auto usage_err = parse_cli_args(argc, argv, opts)) {
            std::cerr << *usage_err << "\n\n" << kUsage;
            return 1;
        }
        if (opts.help) {
            std::cout << kUsage;
            return 0;
        }

        ScramblerConfig config;
        if (opts.config_file) {
            auto loaded = ConfigLoader::load_from_file(*opts.config_file);
            if (!loaded.success) {
                return fail(opts.input,
                    ScrambleError(ErrorKind::MISSING_CONFIGURATION, loaded.error_message));
            }
            config = std::move(loaded.config);
        }
        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        auto parsed = parse_request(merge_request_fields(config.request, opts.overrides));
        if (parsed.is_error()) {
            return fail(opts.input, parsed.error());
        }
        const ScrambleRequest request = parsed.value();

        // Reject before seeding or touching the filesystem
        if (const auto invalid = ScrambleEngine::validate(request)) {
            return fail(opts.input, *invalid);
        }

        std::optional<int64_t> seed = config.engine.seed;
        if (opts.seed) {
            seed = utils::try_parse_int<int64_t>(*opts.seed);
            if (!seed || *seed < 0) {
                return fail(opts.input, ScrambleError(ErrorKind::MISSING_CONFIGURATION,
                    std::format("--seed must be a non-negative integer, got '{}'", *opts.seed)));
            }
        }

        std::unique_ptr<MersenneRandomSource> rng;
        if (seed) {
            rng = std::make_unique<MersenneRandomSource>(static_cast<uint64_t>(*seed));
            utils::log::debug(std::format("Random source seeded with {}", *seed));
        } else {
            rng = std::make_unique<MersenneRandomSource>();
        }

        namespace fs = std::filesystem;
        std::string output_path;
        if (opts.output) {
            output_path = *opts.output;
        } else {
            const fs::path output_dir = opts.output_dir.value_or(config.engine.output_dir);
            std::error_code ec;
            fs::create_directories(output_dir, ec);
            if (ec) {
                return fail(opts.input, ScrambleError(ErrorKind::IO_FAILURE,
                    std::format("Cannot create output directory {}: {}",
                                output_dir.string(), ec.message())));
            }
            output_path = processed_output_path(output_dir, opts.input,
                                                request.format, utils::now()).string();
        }

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        ScrambleEngine::Options engine_opts;
        engine_opts.dialect = config.delimited.to_dialect();
        engine_opts.cancel_flag = &g_cancel;
        ScrambleEngine engine(*rng, engine_opts);

        utils::log::info(std::format("Scrambling {} -> {} ({}, {}, {})",
            opts.input, output_path, format_to_string(request.format),
            method_to_string(request.method), data_type_to_string(request.data_type)));

        utils::Timer timer;
        auto result = engine.run_file(request, opts.input, output_path);
        if (result.is_error()) {
            return fail(opts.input, result.error());
        }

        std::cout << to_json(RunReport::success(opts.input, output_path, result.value(),
                                                timer.elapsed_ms().count())) << '\n';

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
