#include "record/record_processor.hpp"
#include "record/line_reader.hpp"
#include "core/utf8.hpp"

#include <format>

namespace scrambler {

namespace {

Result<RunStats> cancelled_at(size_t index) {
    return Result<RunStats>::error(ErrorKind::CANCELLED,
        std::format("Cancelled before record {}", index), index);
}

Result<RunStats> write_failed_at(size_t index) {
    return Result<RunStats>::error(ErrorKind::IO_FAILURE,
        std::format("Failed to write record {}", index), index);
}

Result<RunStats> read_failed_at(size_t index) {
    return Result<RunStats>::error(ErrorKind::IO_FAILURE,
        std::format("Failed to read record {}", index), index);
}

std::optional<ScrambleError> check_encoding(std::string_view text, size_t index) {
    if (const auto bad = utf8::find_invalid(text)) {
        return ScrambleError(ErrorKind::PROCESSING_FAILURE,
            std::format("Record {} is not valid UTF-8 (byte offset {})", index, *bad),
            index);
    }
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// LineProcessor
// ============================================================================

std::string LineProcessor::scramble_line(std::string_view line, bool& scrambled) {
    const auto selection = selector_.select_line(utf8::length(line));
    if (!selection) {
        scrambled = false;
        return std::string(line);
    }

    const size_t begin = utf8::byte_offset(line, selection->begin);
    const size_t end = utf8::byte_offset(line, selection->end);

    std::string result;
    result.reserve(line.size());
    result.append(line.substr(0, begin));
    result.append(strategy_.apply_span(line.substr(begin, end - begin)));
    result.append(line.substr(end));
    scrambled = true;
    return result;
}

Result<RunStats> LineProcessor::process(std::istream& in, std::ostream& out) {
    RunStats stats;
    LineReader reader(in);
    std::string line;
    size_t index = 0;

    while (true) {
        if (cancelled()) return cancelled_at(index);
        if (!reader.read_line(line)) break;

        if (auto err = check_encoding(line, index)) {
            return Result<RunStats>::error(std::move(*err));
        }
        ++stats.records_read;

        if (is_header(index)) {
            out << line << '\n';
            ++stats.records_passthrough;
        } else {
            bool scrambled = false;
            out << scramble_line(line, scrambled) << '\n';
            if (scrambled) {
                ++stats.records_scrambled;
            } else {
                ++stats.records_passthrough;
            }
        }

        if (!out) return write_failed_at(index);
        ++index;
    }

    if (in.bad()) return read_failed_at(index);
    return Result<RunStats>::ok(stats);
}

// ============================================================================
// DelimitedProcessor
// ============================================================================

bool DelimitedProcessor::scramble_row(std::vector<std::string>& fields) {
    const auto column = selector_.select_column(fields.size());
    if (!column) return false;

    fields[*column] = strategy_.apply_span(fields[*column]);
    return true;
}

Result<RunStats> DelimitedProcessor::process(std::istream& in, std::ostream& out) {
    RunStats stats;
    DelimitedReader reader(in, dialect_);
    DelimitedWriter writer(out, dialect_);
    std::vector<std::string> fields;
    size_t index = 0;

    while (true) {
        if (cancelled()) return cancelled_at(index);

        const auto status = reader.read_row(fields);
        if (status == DelimitedReader::Status::END_OF_INPUT) break;
        if (status == DelimitedReader::Status::MALFORMED) {
            if (in.bad()) return read_failed_at(index);
            return Result<RunStats>::error(ErrorKind::PROCESSING_FAILURE,
                std::format("Malformed row {} ending on line {}: {}",
                            index, reader.line_number(), reader.last_error()), index);
        }

        for (const auto& field : fields) {
            if (auto err = check_encoding(field, index)) {
                return Result<RunStats>::error(std::move(*err));
            }
        }
        ++stats.records_read;

        if (!is_header(index) && scramble_row(fields)) {
            ++stats.records_scrambled;
        } else {
            ++stats.records_passthrough;
        }
        writer.write_row(fields);

        if (!out) return write_failed_at(index);
        ++index;
    }

    if (in.bad()) return read_failed_at(index);
    return Result<RunStats>::ok(stats);
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<RecordProcessor> make_record_processor(
    const ScrambleRequest& request,
    ScrambleStrategy& strategy,
    const DelimitedDialect& dialect,
    const std::atomic<bool>* cancel_flag) {

    switch (request.format) {
        case RecordFormat::LINE:
            return std::make_unique<LineProcessor>(request, strategy, cancel_flag);
        case RecordFormat::DELIMITED_ROW:
            return std::make_unique<DelimitedProcessor>(request, strategy, cancel_flag, dialect);
    }
    return nullptr;
}

} // namespace scrambler
