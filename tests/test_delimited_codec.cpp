#include <catch2/catch_test_macros.hpp>
#include "record/delimited_codec.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace scrambler;

namespace {

using Row = std::vector<std::string>;

std::vector<Row> read_all(const std::string& text, DelimitedDialect dialect = {}) {
    std::istringstream in(text);
    DelimitedReader reader(in, dialect);
    std::vector<Row> rows;
    Row fields;
    while (true) {
        const auto status = reader.read_row(fields);
        if (status != DelimitedReader::Status::ROW) {
            REQUIRE(status == DelimitedReader::Status::END_OF_INPUT);
            break;
        }
        rows.push_back(fields);
    }
    return rows;
}

} // anonymous namespace

// ============================================================================
// Reader
// ============================================================================

TEST_CASE("Codec: plain rows", "[codec][reader]") {
    const auto rows = read_all("name,id\nalice,42\n");
    REQUIRE(rows.size() == 2);
    CHECK(rows[0] == Row{"name", "id"});
    CHECK(rows[1] == Row{"alice", "42"});
}

TEST_CASE("Codec: CRLF, CR and missing final terminator", "[codec][reader]") {
    const auto rows = read_all("a,b\r\nc,d\re,f");
    REQUIRE(rows.size() == 3);
    CHECK(rows[0] == Row{"a", "b"});
    CHECK(rows[1] == Row{"c", "d"});
    CHECK(rows[2] == Row{"e", "f"});
}

TEST_CASE("Codec: empty fields are kept", "[codec][reader]") {
    const auto rows = read_all(",a,,\n");
    REQUIRE(rows.size() == 1);
    CHECK(rows[0] == Row{"", "a", "", ""});
}

TEST_CASE("Codec: blank line is a row with no fields", "[codec][reader]") {
    const auto rows = read_all("a\n\nb\n");
    REQUIRE(rows.size() == 3);
    CHECK(rows[1].empty());
}

TEST_CASE("Codec: quoted fields with delimiters, quotes and newlines", "[codec][reader]") {
    const auto rows = read_all("\"Smith, John\",\"say \"\"hi\"\"\",\"two\nlines\"\nnext,row\n");
    REQUIRE(rows.size() == 2);
    CHECK(rows[0] == Row{"Smith, John", "say \"hi\"", "two\nlines"});
    CHECK(rows[1] == Row{"next", "row"});
}

TEST_CASE("Codec: quote inside unquoted field is literal", "[codec][reader]") {
    const auto rows = read_all("5\" pipe,x\n");
    REQUIRE(rows.size() == 1);
    CHECK(rows[0] == Row{"5\" pipe", "x"});
}

TEST_CASE("Codec: empty input has no rows", "[codec][reader]") {
    CHECK(read_all("").empty());
}

TEST_CASE("Codec: custom delimiter", "[codec][reader]") {
    DelimitedDialect dialect;
    dialect.delimiter = ';';
    const auto rows = read_all("a;b,c\n", dialect);
    REQUIRE(rows.size() == 1);
    CHECK(rows[0] == Row{"a", "b,c"});
}

TEST_CASE("Codec: text after a closing quote joins the field", "[codec][reader]") {
    const auto rows = read_all("\"a\"b,c\r\n\"x\" y\"z,w\n");
    REQUIRE(rows.size() == 2);
    CHECK(rows[0] == Row{"ab", "c"});
    CHECK(rows[1] == Row{"x y\"z", "w"});
}

TEST_CASE("Codec: quoted field open at end of input ends the last row", "[codec][reader]") {
    const auto rows = read_all("ok,row\nx,\"abc\n");
    REQUIRE(rows.size() == 2);
    CHECK(rows[0] == Row{"ok", "row"});
    CHECK(rows[1] == Row{"x", "abc\n"});
}

TEST_CASE("Codec: field over the size limit is malformed", "[codec][reader]") {
    DelimitedDialect dialect;
    dialect.field_size_limit = 8;
    std::istringstream in("short,row\n\"123456789\",x\n");
    DelimitedReader reader(in, dialect);
    Row fields;
    CHECK(reader.read_row(fields) == DelimitedReader::Status::ROW);
    CHECK(reader.read_row(fields) == DelimitedReader::Status::MALFORMED);
    CHECK(reader.last_error().find("field limit (8)") != std::string::npos);
    CHECK(reader.line_number() == 2);
}

TEST_CASE("Codec: default field limit accepts large fields", "[codec][reader]") {
    const std::string big(100000, 'a');
    const auto rows = read_all(big + ",x\n");
    REQUIRE(rows.size() == 1);
    CHECK(rows[0][0].size() == big.size());
}

// ============================================================================
// Writer
// ============================================================================

TEST_CASE("Codec: writer quotes only when needed", "[codec][writer]") {
    std::ostringstream out;
    DelimitedWriter writer(out, {});
    writer.write_row({"plain", "with,comma", "with \"quote\"", "multi\nline", ""});
    CHECK(out.str() == "plain,\"with,comma\",\"with \"\"quote\"\"\",\"multi\nline\",\r\n");
}

TEST_CASE("Codec: single empty field is written as a quoted empty string", "[codec][writer]") {
    std::ostringstream out;
    DelimitedWriter writer(out, {});
    writer.write_row({""});
    writer.write_row({});
    CHECK(out.str() == "\"\"\r\n\r\n");
}

TEST_CASE("Codec: configurable line terminator", "[codec][writer]") {
    DelimitedDialect dialect;
    dialect.line_terminator = "\n";
    std::ostringstream out;
    DelimitedWriter writer(out, dialect);
    writer.write_row({"a", "b"});
    CHECK(out.str() == "a,b\n");
}

TEST_CASE("Codec: written rows read back unchanged", "[codec]") {
    const std::vector<Row> rows = {
        {"id", "note"},
        {"1", "Smith, \"JJ\"\nline two"},
        {""},
        {"", "", "x"},
    };

    std::ostringstream out;
    DelimitedWriter writer(out, {});
    for (const auto& r : rows) writer.write_row(r);

    CHECK(read_all(out.str()) == rows);
}
