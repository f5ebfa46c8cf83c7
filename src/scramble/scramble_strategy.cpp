#include "scramble/scramble_strategy.hpp"
#include "scramble/character_classifier.hpp"
#include "core/utf8.hpp"

#include <stdexcept>

namespace scrambler {

static constexpr std::string_view kAsciiLetters =
    "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";

ScrambleStrategy::ScrambleStrategy(ScrambleMethod method,
                                   DataType data_type,
                                   IRandomSource& rng,
                                   std::optional<char> letter_replacement,
                                   std::optional<char> digit_replacement)
    : method_(method),
      data_type_(data_type),
      rng_(rng),
      letter_replacement_(letter_replacement),
      digit_replacement_(digit_replacement) {
    if (method_ == ScrambleMethod::SIMPLE) {
        if (class_mask::letters(data_type_) && !letter_replacement_) {
            throw std::invalid_argument("simple method requires a letter replacement");
        }
        if (class_mask::digits(data_type_) && !digit_replacement_) {
            throw std::invalid_argument("simple method requires a digit replacement");
        }
    }
}

ScrambleStrategy ScrambleStrategy::from_request(
    const ScrambleRequest& request, IRandomSource& rng) {
    return ScrambleStrategy(request.method, request.data_type, rng,
                            request.letter_replacement, request.digit_replacement);
}

char ScrambleStrategy::apply(char c) {
    switch (classify(c)) {
        case CharClass::HYPHEN:
            return c;

        case CharClass::OTHER:
            return ' ';

        case CharClass::LETTER:
            if (!class_mask::letters(data_type_)) return c;
            return replace_letter(c);

        case CharClass::DIGIT:
            if (!class_mask::digits(data_type_)) return c;
            return replace_digit(c);
    }
    return c;
}

std::string ScrambleStrategy::apply_span(std::string_view span) {
    std::string result;
    result.reserve(span.size());

    size_t i = 0;
    while (i < span.size()) {
        const auto lead = static_cast<unsigned char>(span[i]);
        if (lead < 0x80) {
            result += apply(span[i]);
            ++i;
            continue;
        }
        result += ' ';
        const size_t len = utf8::sequence_length(lead);
        i += (len == 0) ? 1 : len;
    }
    return result;
}

char ScrambleStrategy::replace_letter(char letter) {
    switch (method_) {
        case ScrambleMethod::SIMPLE:
            return *letter_replacement_;

        case ScrambleMethod::RANDOM:
            return kAsciiLetters[rng_.uniform(0, static_cast<uint32_t>(kAsciiLetters.size() - 1))];

        case ScrambleMethod::INCREMENTAL:
            // Rotation is defined for digits only
            return letter;
    }
    return letter;
}

char ScrambleStrategy::replace_digit(char digit) {
    switch (method_) {
        case ScrambleMethod::SIMPLE:
            return *digit_replacement_;

        case ScrambleMethod::RANDOM:
            return static_cast<char>('0' + rng_.uniform(0, 9));

        case ScrambleMethod::INCREMENTAL: {
            const uint32_t d = static_cast<uint32_t>(digit - '0');
            const uint32_t r = rng_.uniform(1, 9);
            return static_cast<char>('0' + (d + r) % 10);
        }
    }
    return digit;
}

} // namespace scrambler
