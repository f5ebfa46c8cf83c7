#include "engine/scramble_engine.hpp"
#include "engine/request_parser.hpp"
#include "io/staged_output.hpp"
#include "record/record_processor.hpp"
#include "scramble/scramble_strategy.hpp"
#include "core/utils.hpp"

#include <format>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace scrambler {

ScrambleEngine::ScrambleEngine(IRandomSource& rng)
    : ScrambleEngine(rng, Options{}) {}

ScrambleEngine::ScrambleEngine(IRandomSource& rng, Options options)
    : rng_(rng), options_(std::move(options)) {}

std::optional<ScrambleError> ScrambleEngine::validate(const ScrambleRequest& request) {
    if (request.start_pos < 1) {
        return ScrambleError(ErrorKind::INVALID_RANGE,
            request.format == RecordFormat::DELIMITED_ROW
                ? "Column number must be at least 1."
                : "Start position must be at least 1.");
    }

    if (request.format == RecordFormat::LINE && request.end_pos &&
        request.start_pos > *request.end_pos) {
        return ScrambleError(ErrorKind::INVALID_RANGE,
            "Start position must be less than or equal to end position.");
    }

    switch (request.method) {
        case ScrambleMethod::INCREMENTAL:
            if (request.data_type != DataType::NUMBER) {
                return ScrambleError(ErrorKind::UNSUPPORTED_COMBINATION,
                    "Incremental scramble supports only Number data type.");
            }
            break;

        case ScrambleMethod::SIMPLE:
            if (class_mask::letters(request.data_type) && !request.letter_replacement) {
                return ScrambleError(ErrorKind::MISSING_CONFIGURATION,
                    std::format("Simple scramble of {} data requires a letter replacement.",
                                data_type_to_string(request.data_type)));
            }
            if (class_mask::digits(request.data_type) && !request.digit_replacement) {
                return ScrambleError(ErrorKind::MISSING_CONFIGURATION,
                    std::format("Simple scramble of {} data requires a digit replacement.",
                                data_type_to_string(request.data_type)));
            }
            break;

        case ScrambleMethod::RANDOM:
            break;
    }

    return std::nullopt;
}

Result<RunStats> ScrambleEngine::run(const ScrambleRequest& request,
                                     std::istream& in,
                                     std::ostream& out) {
    if (auto err = validate(request)) {
        return Result<RunStats>::error(std::move(*err));
    }

    auto strategy = ScrambleStrategy::from_request(request, rng_);
    auto processor = make_record_processor(request, strategy, options_.dialect,
                                           options_.cancel_flag);

    utils::log::debug(std::format("Scrambling {} records: method={}, data_type={}, start={}, header={}",
        processor->name(), method_to_string(request.method),
        data_type_to_string(request.data_type), request.start_pos,
        utils::booltostr(request.has_header)));

    auto result = processor->process(in, out);
    if (result.is_ok()) {
        out.flush();
        if (!out) {
            return Result<RunStats>::error(ErrorKind::IO_FAILURE, "Failed to flush output");
        }
    }
    return result;
}

Result<RunStats> ScrambleEngine::run_file(const ScrambleRequest& request,
                                          const std::string& input_path,
                                          const std::string& output_path) {
    if (auto err = validate(request)) {
        return Result<RunStats>::error(std::move(*err));
    }

    std::ifstream in(input_path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        return Result<RunStats>::error(ErrorKind::IO_FAILURE,
            std::format("Failed to open input file: {}", input_path));
    }

    try {
        StagedOutput staged(output_path);

        utils::Timer timer;
        auto result = run(request, in, staged.stream());
        if (result.is_error()) {
            staged.discard();
            return result;
        }

        if (!staged.commit()) {
            return Result<RunStats>::error(ErrorKind::IO_FAILURE,
                std::format("Failed to commit output file: {}", output_path));
        }

        const auto& stats = result.value();
        utils::log::info(std::format("Wrote {} ({} records, {} scrambled, {} passed through) in {}ms",
            output_path, stats.records_read, stats.records_scrambled,
            stats.records_passthrough, timer.elapsed_ms().count()));
        return result;
    } catch (const std::runtime_error& e) {
        return Result<RunStats>::error(ErrorKind::IO_FAILURE, e.what());
    }
}

} // namespace scrambler
