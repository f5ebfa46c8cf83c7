#include <catch2/catch_test_macros.hpp>
#include "scramble/scramble_strategy.hpp"
#include "scramble/character_classifier.hpp"
#include "mocks/mock_random_source.hpp"

#include <stdexcept>
#include <string>

using namespace scrambler;
using scrambler::testing::ScriptedRandomSource;

// ============================================================================
// SIMPLE
// ============================================================================

TEST_CASE("Strategy SIMPLE Both replaces letters and digits", "[strategy][simple]") {
    ScriptedRandomSource rng({});
    ScrambleStrategy s(ScrambleMethod::SIMPLE, DataType::BOTH, rng, 'X', '9');

    CHECK(s.apply_span("abc-123!") == "XXX-999 ");
    CHECK(rng.call_count() == 0);
}

TEST_CASE("Strategy SIMPLE String leaves digits alone", "[strategy][simple]") {
    ScriptedRandomSource rng({});
    ScrambleStrategy s(ScrambleMethod::SIMPLE, DataType::STRING, rng, 'Z', std::nullopt);

    CHECK(s.apply_span("alice42") == "ZZZZZ42");
    CHECK(s.apply_span("42") == "42");
}

TEST_CASE("Strategy SIMPLE Number leaves letters alone", "[strategy][simple]") {
    ScriptedRandomSource rng({});
    ScrambleStrategy s(ScrambleMethod::SIMPLE, DataType::NUMBER, rng, std::nullopt, '0');

    CHECK(s.apply_span("ab12-cd34") == "ab00-cd00");
}

TEST_CASE("Strategy SIMPLE is deterministic", "[strategy][simple]") {
    ScriptedRandomSource rng1({});
    ScriptedRandomSource rng2({});
    ScrambleStrategy a(ScrambleMethod::SIMPLE, DataType::BOTH, rng1, 'Q', '1');
    ScrambleStrategy b(ScrambleMethod::SIMPLE, DataType::BOTH, rng2, 'Q', '1');

    const std::string input = "John Smith, 555-0100 (home)";
    const auto first = a.apply_span(input);
    CHECK(first == b.apply_span(input));
    CHECK(first == a.apply_span(input));
    CHECK(first == "QQQQ QQQQQ  111-1111  QQQQ ");
}

TEST_CASE("Strategy SIMPLE without a reachable replacement throws", "[strategy][simple]") {
    ScriptedRandomSource rng({});
    CHECK_THROWS_AS(ScrambleStrategy(ScrambleMethod::SIMPLE, DataType::BOTH, rng, 'X', std::nullopt),
                    std::invalid_argument);
    CHECK_THROWS_AS(ScrambleStrategy(ScrambleMethod::SIMPLE, DataType::STRING, rng, std::nullopt, '9'),
                    std::invalid_argument);
    // Digit replacement is unreachable under String
    CHECK_NOTHROW(ScrambleStrategy(ScrambleMethod::SIMPLE, DataType::STRING, rng, 'X', std::nullopt));
}

// ============================================================================
// Class rules shared by every method
// ============================================================================

TEST_CASE("Strategy keeps hyphens and blanks other characters for every method", "[strategy]") {
    ScriptedRandomSource rng({3});
    for (const auto method : {ScrambleMethod::SIMPLE, ScrambleMethod::RANDOM,
                              ScrambleMethod::INCREMENTAL}) {
        ScrambleStrategy s(method, DataType::NUMBER, rng, 'X', '9');
        CHECK(s.apply('-') == '-');
        CHECK(s.apply('!') == ' ');
        CHECK(s.apply('.') == ' ');
        CHECK(s.apply(' ') == ' ');
        CHECK(s.apply('\t') == ' ');
    }
}

TEST_CASE("Strategy collapses a multi-byte character to one space", "[strategy]") {
    ScriptedRandomSource rng({});
    ScrambleStrategy s(ScrambleMethod::SIMPLE, DataType::BOTH, rng, 'X', '9');

    // "café-9" : 'é' is two bytes, one character
    CHECK(s.apply_span("caf\xC3\xA9-9") == "XXX -9");
    // 3-byte euro sign and 4-byte emoji
    CHECK(s.apply_span("\xE2\x82\xAC" "1") == " 9");
    CHECK(s.apply_span("\xF0\x9F\x98\x80") == " ");
}

// ============================================================================
// RANDOM
// ============================================================================

TEST_CASE("Strategy RANDOM draws letters from a-z then A-Z", "[strategy][random]") {
    ScriptedRandomSource rng({0, 25, 26, 51});
    ScrambleStrategy s(ScrambleMethod::RANDOM, DataType::STRING, rng);

    CHECK(s.apply('q') == 'a');
    CHECK(s.apply('q') == 'z');
    CHECK(s.apply('q') == 'A');
    CHECK(s.apply('q') == 'Z');
    CHECK(rng.last_lo() == 0);
    CHECK(rng.last_hi() == 51);
}

TEST_CASE("Strategy RANDOM draws digits from 0-9", "[strategy][random]") {
    ScriptedRandomSource rng({7, 0});
    ScrambleStrategy s(ScrambleMethod::RANDOM, DataType::NUMBER, rng);

    CHECK(s.apply('1') == '7');
    CHECK(s.apply('1') == '0');
    CHECK(rng.last_hi() == 9);
    CHECK(s.apply('x') == 'x');   // Letters untouched under Number
}

TEST_CASE("Strategy RANDOM preserves span length and filtered classes", "[strategy][random]") {
    MersenneRandomSource rng(12345);
    ScrambleStrategy s(ScrambleMethod::RANDOM, DataType::BOTH, rng);

    const std::string input = "Acct-0042 (Jane)";
    const auto out = s.apply_span(input);
    REQUIRE(out.size() == input.size());
    for (size_t i = 0; i < input.size(); ++i) {
        switch (classify(input[i])) {
            case CharClass::LETTER: CHECK(classify(out[i]) == CharClass::LETTER); break;
            case CharClass::DIGIT:  CHECK(classify(out[i]) == CharClass::DIGIT); break;
            case CharClass::HYPHEN: CHECK(out[i] == '-'); break;
            case CharClass::OTHER:  CHECK(out[i] == ' '); break;
        }
    }
}

// ============================================================================
// INCREMENTAL
// ============================================================================

TEST_CASE("Strategy INCREMENTAL rotates by the drawn amount", "[strategy][incremental]") {
    ScriptedRandomSource rng({3});
    ScrambleStrategy s(ScrambleMethod::INCREMENTAL, DataType::NUMBER, rng);

    CHECK(s.apply('5') == '8');
    CHECK(s.apply('9') == '2');   // wraps mod 10
    CHECK(rng.last_lo() == 1);
    CHECK(rng.last_hi() == 9);
}

TEST_CASE("Strategy INCREMENTAL never returns the input digit", "[strategy][incremental]") {
    MersenneRandomSource rng(7);
    ScrambleStrategy s(ScrambleMethod::INCREMENTAL, DataType::NUMBER, rng);

    for (int round = 0; round < 200; ++round) {
        for (char d = '0'; d <= '9'; ++d) {
            const char out = s.apply(d);
            CHECK(out != d);
            CHECK(classify(out) == CharClass::DIGIT);
        }
    }
}

TEST_CASE("Strategy INCREMENTAL leaves letters untouched", "[strategy][incremental]") {
    ScriptedRandomSource rng({1});
    ScrambleStrategy s(ScrambleMethod::INCREMENTAL, DataType::NUMBER, rng);

    CHECK(s.apply_span("ab-12/cd") == "ab-23 cd");
}
