#include "record/line_reader.hpp"

namespace scrambler {

bool LineReader::read_line(std::string& line) {
    line.clear();

    char c;
    bool any = false;
    while (in_.get(c)) {
        any = true;
        if (c == '\n') return true;
        if (c == '\r') {
            if (in_.peek() == '\n') in_.get();
            return true;
        }
        line += c;
    }
    return any;
}

} // namespace scrambler
