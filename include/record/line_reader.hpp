#pragma once

#include <istream>
#include <string>

namespace scrambler {

/**
 * @brief Reads text lines without their terminators
 *
 * "\n", "\r\n" and a lone "\r" all end a line. A final line without a
 * terminator is still returned; an empty input yields no lines.
 */
class LineReader {
public:
    explicit LineReader(std::istream& in) : in_(in) {}

    [[nodiscard]] bool read_line(std::string& line);

private:
    std::istream& in_;
};

} // namespace scrambler
