#pragma once

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace scrambler {

/**
 * @brief Delimited format parameters
 */
struct DelimitedDialect {
    char delimiter = ',';
    char quote = '"';
    std::string line_terminator = "\r\n";
    size_t field_size_limit = 131072;   // Bytes per field before a row is malformed
};

/**
 * @brief Reads delimited rows one at a time (RFC 4180 quoting)
 *
 * Quoted fields may contain delimiters, doubled quotes and line breaks.
 * Outside quotes "\n", "\r\n" and "\r" end a row. A blank line is a row
 * with zero fields. A quote inside an unquoted field is kept literally.
 * Parsing is lenient: text after a closing quote is appended to the field,
 * and a quoted field still open at end of input ends the last row.
 */
class DelimitedReader {
public:
    enum class Status { ROW, END_OF_INPUT, MALFORMED };

    DelimitedReader(std::istream& in, DelimitedDialect dialect);

    /**
     * @brief Read the next row into fields (cleared first)
     *
     * MALFORMED is returned when a field grows past the dialect's
     * field_size_limit; the reason is available from last_error().
     */
    [[nodiscard]] Status read_row(std::vector<std::string>& fields);

    [[nodiscard]] const std::string& last_error() const { return last_error_; }

    /// Physical line the reader is on (1-based)
    [[nodiscard]] size_t line_number() const { return line_number_; }

private:
    [[nodiscard]] bool next(char& c);
    void consume_lf_after_cr();

    std::istream& in_;
    DelimitedDialect dialect_;
    std::string last_error_;
    size_t line_number_ = 1;
};

/**
 * @brief Writes delimited rows with minimal quoting
 *
 * A field is quoted when it contains the delimiter, the quote character,
 * '\r' or '\n'. A row holding one empty field is written as "" so it is
 * not read back as a blank row.
 */
class DelimitedWriter {
public:
    DelimitedWriter(std::ostream& out, DelimitedDialect dialect);

    void write_row(const std::vector<std::string>& fields);

    [[nodiscard]] std::string format_row(const std::vector<std::string>& fields) const;

private:
    [[nodiscard]] bool needs_quoting(const std::string& field) const;

    std::ostream& out_;
    DelimitedDialect dialect_;
};

} // namespace scrambler
