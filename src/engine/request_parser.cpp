#include "engine/request_parser.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <unordered_map>

namespace scrambler {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
        std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) ==
                   std::tolower(static_cast<unsigned char>(y));
        });
}

template<typename E>
std::optional<E> lookup(const std::unordered_map<std::string_view, E>& table,
                        std::string_view name) {
    // Direct hit first, case-insensitive scan only on a miss
    if (const auto it = table.find(name); it != table.end()) {
        return it->second;
    }
    for (const auto& [key, value] : table) {
        if (iequals(key, name)) return value;
    }
    return std::nullopt;
}

bool present(const std::optional<std::string>& field) {
    return field && !utils::trim(*field).empty();
}

} // anonymous namespace

std::string_view format_to_string(RecordFormat format) {
    switch (format) {
        case RecordFormat::LINE:          return keys::LINE;
        case RecordFormat::DELIMITED_ROW: return keys::DELIMITED;
    }
    return "unknown";
}

std::string_view data_type_to_string(DataType type) {
    switch (type) {
        case DataType::STRING: return "String";
        case DataType::NUMBER: return "Number";
        case DataType::BOTH:   return "Both";
    }
    return "unknown";
}

std::string_view method_to_string(ScrambleMethod method) {
    switch (method) {
        case ScrambleMethod::SIMPLE:      return keys::SIMPLE;
        case ScrambleMethod::RANDOM:      return keys::RANDOM;
        case ScrambleMethod::INCREMENTAL: return keys::INCREMENTAL;
    }
    return "unknown";
}

std::string_view format_extension(RecordFormat format) {
    switch (format) {
        case RecordFormat::LINE:          return keys::TXT;
        case RecordFormat::DELIMITED_ROW: return keys::CSV;
    }
    return "out";
}

std::optional<RecordFormat> parse_record_format(std::string_view name) {
    static const std::unordered_map<std::string_view, RecordFormat> table = {
        {keys::LINE,      RecordFormat::LINE},
        {keys::TXT,       RecordFormat::LINE},
        {keys::TEXT,      RecordFormat::LINE},
        {keys::DELIMITED, RecordFormat::DELIMITED_ROW},
        {keys::CSV,       RecordFormat::DELIMITED_ROW},
    };
    return lookup(table, name);
}

std::optional<DataType> parse_data_type(std::string_view name) {
    static const std::unordered_map<std::string_view, DataType> table = {
        {keys::STRING, DataType::STRING},
        {keys::NUMBER, DataType::NUMBER},
        {keys::BOTH,   DataType::BOTH},
    };
    return lookup(table, name);
}

std::optional<ScrambleMethod> parse_method(std::string_view name) {
    static const std::unordered_map<std::string_view, ScrambleMethod> table = {
        {keys::SIMPLE,      ScrambleMethod::SIMPLE},
        {keys::RANDOM,      ScrambleMethod::RANDOM},
        {keys::INCREMENTAL, ScrambleMethod::INCREMENTAL},
    };
    return lookup(table, name);
}

Result<ScrambleRequest> parse_request(const RequestFields& fields) {
    using R = Result<ScrambleRequest>;
    ScrambleRequest request;

    const auto format = parse_record_format(utils::trim(fields.format));
    if (!format) {
        return R::error(ErrorKind::UNKNOWN_VARIANT,
            std::format("Unknown file format: '{}'", fields.format));
    }
    request.format = *format;

    const auto method = parse_method(utils::trim(fields.method));
    if (!method) {
        return R::error(ErrorKind::UNKNOWN_VARIANT,
            std::format("Unknown scramble method: '{}'", fields.method));
    }
    request.method = *method;

    const auto data_type = parse_data_type(utils::trim(fields.data_type));
    if (!data_type) {
        return R::error(ErrorKind::UNKNOWN_VARIANT,
            std::format("Unknown data type: '{}'", fields.data_type));
    }
    request.data_type = *data_type;

    const auto start = utils::try_parse_int<int64_t>(utils::trim(fields.start_pos));
    if (!start) {
        return R::error(ErrorKind::INVALID_RANGE,
            std::format("Start position must be an integer, got '{}'", fields.start_pos));
    }
    request.start_pos = *start;

    // End position only means something for line records
    if (request.format != RecordFormat::LINE && present(fields.end_pos)) {
        utils::log::warn(std::format("End position '{}' ignored for {} records",
                                     *fields.end_pos, format_to_string(request.format)));
    } else if (present(fields.end_pos)) {
        const auto end = utils::try_parse_int<int64_t>(utils::trim(*fields.end_pos));
        if (!end) {
            return R::error(ErrorKind::INVALID_RANGE,
                std::format("End position must be an integer, got '{}'", *fields.end_pos));
        }
        request.end_pos = *end;
    }

    request.has_header = fields.has_header && iequals(utils::trim(*fields.has_header), "true");

    auto single_char = [](const std::optional<std::string>& field,
                          std::string_view what) -> std::optional<ScrambleError> {
        if (field && !field->empty() && field->size() != 1) {
            return ScrambleError(ErrorKind::MISSING_CONFIGURATION,
                std::format("{} replacement must be a single character, got '{}'", what, *field));
        }
        return std::nullopt;
    };
    if (auto err = single_char(fields.letter_replacement, "Letter")) return R::error(std::move(*err));
    if (auto err = single_char(fields.digit_replacement, "Digit")) return R::error(std::move(*err));

    if (fields.letter_replacement && fields.letter_replacement->size() == 1) {
        request.letter_replacement = (*fields.letter_replacement)[0];
    }
    if (fields.digit_replacement && fields.digit_replacement->size() == 1) {
        request.digit_replacement = (*fields.digit_replacement)[0];
    }

    return R::ok(request);
}

} // namespace scrambler
