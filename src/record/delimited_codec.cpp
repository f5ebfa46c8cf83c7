#include "record/delimited_codec.hpp"

#include <format>
#include <utility>

namespace scrambler {

// ============================================================================
// DelimitedReader
// ============================================================================

DelimitedReader::DelimitedReader(std::istream& in, DelimitedDialect dialect)
    : in_(in), dialect_(std::move(dialect)) {}

bool DelimitedReader::next(char& c) {
    return static_cast<bool>(in_.get(c));
}

void DelimitedReader::consume_lf_after_cr() {
    if (in_.peek() == '\n') {
        in_.get();
    }
}

DelimitedReader::Status DelimitedReader::read_row(std::vector<std::string>& fields) {
    enum class State { FIELD_START, UNQUOTED, QUOTED, QUOTE_IN_QUOTED };

    fields.clear();
    last_error_.clear();

    State state = State::FIELD_START;
    std::string field;
    bool row_started = false;
    char c;

    while (next(c)) {
        const bool is_eol = (c == '\n' || c == '\r');

        switch (state) {
            case State::FIELD_START:
                if (is_eol) {
                    if (c == '\r') consume_lf_after_cr();
                    ++line_number_;
                    // Blank line: zero fields. Otherwise a trailing empty field.
                    if (row_started) fields.emplace_back();
                    return Status::ROW;
                }
                row_started = true;
                if (c == dialect_.quote) {
                    state = State::QUOTED;
                } else if (c == dialect_.delimiter) {
                    fields.emplace_back();
                } else {
                    field += c;
                    state = State::UNQUOTED;
                }
                break;

            case State::UNQUOTED:
                if (is_eol) {
                    if (c == '\r') consume_lf_after_cr();
                    ++line_number_;
                    fields.emplace_back(std::move(field));
                    return Status::ROW;
                }
                if (c == dialect_.delimiter) {
                    fields.emplace_back(std::move(field));
                    field.clear();
                    state = State::FIELD_START;
                } else {
                    field += c;
                }
                break;

            case State::QUOTED:
                if (c == dialect_.quote) {
                    state = State::QUOTE_IN_QUOTED;
                } else {
                    if (c == '\n') ++line_number_;
                    field += c;
                }
                break;

            case State::QUOTE_IN_QUOTED:
                if (c == dialect_.quote) {
                    field += c;
                    state = State::QUOTED;
                } else if (c == dialect_.delimiter) {
                    fields.emplace_back(std::move(field));
                    field.clear();
                    state = State::FIELD_START;
                } else if (is_eol) {
                    if (c == '\r') consume_lf_after_cr();
                    ++line_number_;
                    fields.emplace_back(std::move(field));
                    return Status::ROW;
                } else {
                    // Text after a closing quote joins the field unquoted
                    field += c;
                    state = State::UNQUOTED;
                }
                break;
        }

        if (field.size() > dialect_.field_size_limit) {
            last_error_ = std::format("field larger than field limit ({}) on line {}",
                                      dialect_.field_size_limit, line_number_);
            return Status::MALFORMED;
        }
    }

    // End of input without a row terminator
    switch (state) {
        case State::FIELD_START:
            if (!row_started) return Status::END_OF_INPUT;
            fields.emplace_back();
            return Status::ROW;

        case State::UNQUOTED:
        case State::QUOTED:
        case State::QUOTE_IN_QUOTED:
            // An unterminated quoted field keeps what was read
            fields.emplace_back(std::move(field));
            return Status::ROW;
    }
    return Status::END_OF_INPUT;
}

// ============================================================================
// DelimitedWriter
// ============================================================================

DelimitedWriter::DelimitedWriter(std::ostream& out, DelimitedDialect dialect)
    : out_(out), dialect_(std::move(dialect)) {}

bool DelimitedWriter::needs_quoting(const std::string& field) const {
    for (const char c : field) {
        if (c == dialect_.delimiter || c == dialect_.quote || c == '\r' || c == '\n') {
            return true;
        }
    }
    return false;
}

std::string DelimitedWriter::format_row(const std::vector<std::string>& fields) const {
    std::string row;

    if (fields.size() == 1 && fields[0].empty()) {
        row += dialect_.quote;
        row += dialect_.quote;
    } else {
        for (size_t i = 0; i < fields.size(); ++i) {
            if (i > 0) row += dialect_.delimiter;
            const auto& field = fields[i];
            if (!needs_quoting(field)) {
                row += field;
                continue;
            }
            row += dialect_.quote;
            for (const char c : field) {
                if (c == dialect_.quote) row += dialect_.quote;
                row += c;
            }
            row += dialect_.quote;
        }
    }

    row += dialect_.line_terminator;
    return row;
}

void DelimitedWriter::write_row(const std::vector<std::string>& fields) {
    out_ << format_row(fields);
}

} // namespace scrambler
