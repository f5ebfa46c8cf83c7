#include <catch2/catch_test_macros.hpp>
#include "record/record_processor.hpp"
#include "record/line_reader.hpp"
#include "mocks/mock_random_source.hpp"

#include <atomic>
#include <sstream>
#include <string>

using namespace scrambler;
using scrambler::testing::ScriptedRandomSource;

namespace {

ScrambleRequest simple_line_request(int64_t start, std::optional<int64_t> end = std::nullopt) {
    ScrambleRequest req;
    req.format = RecordFormat::LINE;
    req.start_pos = start;
    req.end_pos = end;
    req.data_type = DataType::BOTH;
    req.method = ScrambleMethod::SIMPLE;
    req.letter_replacement = 'X';
    req.digit_replacement = '9';
    return req;
}

struct Run {
    Result<RunStats> result;
    std::string output;
};

Run process(const ScrambleRequest& req, const std::string& input, IRandomSource& rng,
            const std::atomic<bool>* cancel = nullptr) {
    auto strategy = ScrambleStrategy::from_request(req, rng);
    LineProcessor processor(req, strategy, cancel);
    std::istringstream in(input);
    std::ostringstream out;
    auto result = processor.process(in, out);
    return {std::move(result), out.str()};
}

} // anonymous namespace

// ============================================================================
// LineReader
// ============================================================================

TEST_CASE("LineReader: every terminator style ends a line", "[line][reader]") {
    std::istringstream in("a\nb\r\nc\rd");
    LineReader reader(in);
    std::string line;
    REQUIRE(reader.read_line(line)); CHECK(line == "a");
    REQUIRE(reader.read_line(line)); CHECK(line == "b");
    REQUIRE(reader.read_line(line)); CHECK(line == "c");
    REQUIRE(reader.read_line(line)); CHECK(line == "d");
    CHECK_FALSE(reader.read_line(line));
}

TEST_CASE("LineReader: empty lines are lines, empty input has none", "[line][reader]") {
    std::istringstream in("\n\n");
    LineReader reader(in);
    std::string line;
    CHECK(reader.read_line(line));
    CHECK(line.empty());
    CHECK(reader.read_line(line));
    CHECK_FALSE(reader.read_line(line));

    std::istringstream empty("");
    LineReader none(empty);
    CHECK_FALSE(none.read_line(line));
}

// ============================================================================
// LineProcessor
// ============================================================================

TEST_CASE("LineProcessor: whole-line simple scramble", "[line][processor]") {
    ScriptedRandomSource rng({});
    const auto run = process(simple_line_request(1), "abc-123!\n", rng);
    REQUIRE(run.result.is_ok());
    CHECK(run.output == "XXX-999 \n");
    CHECK(run.result.value().records_scrambled == 1);
}

TEST_CASE("LineProcessor: prefix and suffix are copied verbatim", "[line][processor]") {
    ScriptedRandomSource rng({});
    const auto run = process(simple_line_request(4, 6), "ID:abc123;tail\n", rng);
    REQUIRE(run.result.is_ok());
    CHECK(run.output == "ID:XXX123;tail\n");
}

TEST_CASE("LineProcessor: short line passes through", "[line][processor]") {
    ScriptedRandomSource rng({});
    const auto run = process(simple_line_request(10), "short!\nlong enough line\n", rng);
    REQUIRE(run.result.is_ok());
    CHECK(run.output == "short!\nlong enouXX XXXX\n");
    CHECK(run.result.value().records_passthrough == 1);
    CHECK(run.result.value().records_scrambled == 1);
}

TEST_CASE("LineProcessor: header line is left untouched", "[line][processor]") {
    ScriptedRandomSource rng({});
    auto req = simple_line_request(1);
    req.has_header = true;
    const auto run = process(req, "HEADER-1 !\nbody 2\n", rng);
    REQUIRE(run.result.is_ok());
    CHECK(run.output == "HEADER-1 !\nXXXX 9\n");
    CHECK(run.result.value().records_read == 2);
    CHECK(run.result.value().records_passthrough == 1);
}

TEST_CASE("LineProcessor: terminators normalised to one newline per line", "[line][processor]") {
    ScriptedRandomSource rng({});
    const auto run = process(simple_line_request(1), "ab\r\ncd\ref", rng);
    REQUIRE(run.result.is_ok());
    CHECK(run.output == "XX\nXX\nXX\n");
    CHECK(run.result.value().records_read == 3);
}

TEST_CASE("LineProcessor: empty input produces empty output", "[line][processor]") {
    ScriptedRandomSource rng({});
    const auto run = process(simple_line_request(1), "", rng);
    REQUIRE(run.result.is_ok());
    CHECK(run.output.empty());
    CHECK(run.result.value().records_read == 0);
}

TEST_CASE("LineProcessor: positions count characters, not bytes", "[line][processor]") {
    ScriptedRandomSource rng({});
    // "né 42": é is one character, so position 4 is '4'
    const auto run = process(simple_line_request(4), "n\xC3\xA9 42\n", rng);
    REQUIRE(run.result.is_ok());
    CHECK(run.output == "n\xC3\xA9 99\n");

    // é inside the span becomes one space
    const auto inside = process(simple_line_request(1, 3), "n\xC3\xA9x9\n", rng);
    REQUIRE(inside.result.is_ok());
    CHECK(inside.output == "X X9\n");
}

TEST_CASE("LineProcessor: random method changes only the span", "[line][processor]") {
    MersenneRandomSource rng(99);
    ScrambleRequest req;
    req.format = RecordFormat::LINE;
    req.start_pos = 5;
    req.end_pos = 8;
    req.data_type = DataType::BOTH;
    req.method = ScrambleMethod::RANDOM;

    const std::string line = "KEEPabcdKEEP";
    const auto run = process(req, line + "\n", rng);
    REQUIRE(run.result.is_ok());
    REQUIRE(run.output.size() == line.size() + 1);
    CHECK(run.output.substr(0, 4) == "KEEP");
    CHECK(run.output.substr(8, 4) == "KEEP");
}

TEST_CASE("LineProcessor: invalid UTF-8 stops with the record index", "[line][processor]") {
    ScriptedRandomSource rng({});
    const auto run = process(simple_line_request(1), "ok\nbad \xFF byte\nnever\n", rng);
    REQUIRE(run.result.is_error());
    CHECK(run.result.error_kind() == ErrorKind::PROCESSING_FAILURE);
    REQUIRE(run.result.error().record_index.has_value());
    CHECK(*run.result.error().record_index == 1);
    CHECK(run.output == "XX\n");
}

TEST_CASE("LineProcessor: raised cancel flag stops before the next record", "[line][processor]") {
    ScriptedRandomSource rng({});
    std::atomic<bool> cancel{true};
    const auto run = process(simple_line_request(1), "a\nb\n", rng, &cancel);
    REQUIRE(run.result.is_error());
    CHECK(run.result.error_kind() == ErrorKind::CANCELLED);
    CHECK(run.output.empty());
}
