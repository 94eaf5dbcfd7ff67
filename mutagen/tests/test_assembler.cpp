#include <catch2/catch_test_macros.hpp>

#include <mutagen/assembler.hpp>

#include <string>
#include <vector>

using namespace mutagen;

namespace {

OutputToken word(std::string_view text) { return {TokenKind::Word, text}; }

const OutputToken PERIOD{TokenKind::Period};
const OutputToken COMMA{TokenKind::Comma};
const OutputToken SEMICOLON{TokenKind::Semicolon};
const OutputToken DASH{TokenKind::Dash};
const OutputToken AAN{TokenKind::AAn};
const OutputToken CONCAT{TokenKind::Concat};

std::string run(std::vector<OutputToken> tokens) {
    return assemble(tokens);
}

} // namespace

TEST_CASE("Assembler spacing and capitalization", "[assembler]") {
    SECTION("words are joined by spaces and closed with a period") {
        CHECK(run({word("the"), word("cat"), word("sat")}) == "The cat sat.");
    }

    SECTION("single word") {
        CHECK(run({word("hello")}) == "Hello.");
    }

    SECTION("empty stream gives empty text") {
        CHECK(run({}) == "");
    }

    SECTION("empty words are skipped") {
        CHECK(run({word(""), word("quiet"), word("")}) == "Quiet.");
    }

    SECTION("period starts a new capitalized sentence") {
        CHECK(run({word("hello"), PERIOD, word("goodbye")}) == "Hello. Goodbye.");
    }

    SECTION("trailing period is not doubled") {
        CHECK(run({word("hello"), word("world"), PERIOD}) == "Hello world");
    }

    SECTION("leading period is written before the first word") {
        CHECK(run({PERIOD, word("hello")}) == ". Hello.");
    }

    SECTION("only the first byte is capitalized") {
        CHECK(run({word("o'clock")}) == "O'clock.");
        CHECK(run({word("42nd"), word("street")}) == "42nd street.");
    }
}

TEST_CASE("Assembler punctuation precedence", "[assembler]") {
    SECTION("comma") {
        CHECK(run({word("a"), COMMA, word("b")}) == "A, b.");
    }

    SECTION("semicolon") {
        CHECK(run({word("a"), SEMICOLON, word("b")}) == "A; b.");
    }

    SECTION("dash") {
        CHECK(run({word("a"), DASH, word("b")}) == "A -- b.");
    }

    SECTION("period overrides a pending comma") {
        CHECK(run({word("hello"), COMMA, PERIOD, word("goodbye")}) == "Hello. Goodbye.");
    }

    SECTION("comma never weakens a period") {
        CHECK(run({word("hello"), PERIOD, COMMA, word("goodbye")}) == "Hello. Goodbye.");
    }

    SECTION("dash beats comma, semicolon beats dash") {
        CHECK(run({word("a"), COMMA, DASH, word("b")}) == "A -- b.");
        CHECK(run({word("a"), DASH, SEMICOLON, word("b")}) == "A; b.");
        CHECK(run({word("a"), COMMA, SEMICOLON, word("b")}) == "A; b.");
    }

    SECTION("weaker marks never replace stronger ones") {
        CHECK(run({word("a"), SEMICOLON, DASH, word("b")}) == "A; b.");
        CHECK(run({word("a"), SEMICOLON, COMMA, word("b")}) == "A; b.");
        CHECK(run({word("a"), DASH, COMMA, word("b")}) == "A -- b.");
    }

    SECTION("punctuation before the first word is dropped") {
        CHECK(run({COMMA, word("a")}) == "A.");
        CHECK(run({SEMICOLON, DASH, word("a")}) == "A.");
    }

    SECTION("repeated commas collapse") {
        CHECK(run({word("a"), COMMA, COMMA, word("b")}) == "A, b.");
    }
}

TEST_CASE("Assembler a/an", "[assembler]") {
    SECTION("vowel") {
        CHECK(run({AAN, word("elephant")}) == "An elephant.");
    }

    SECTION("consonant") {
        CHECK(run({AAN, word("cat")}) == "A cat.");
    }

    SECTION("vowel test ignores case") {
        CHECK(run({word("saw"), AAN, word("Owl")}) == "Saw an Owl.");
    }

    SECTION("mid-sentence article is lower case") {
        CHECK(run({word("she"), word("fell"), word("into"), AAN, word("old"), word("well")})
              == "She fell into an old well.");
    }

    SECTION("article with nothing after it") {
        CHECK(run({word("just"), AAN}) == "Just a.");
    }

    SECTION("punctuation after the article replaces the a/an decision") {
        CHECK(run({AAN, PERIOD, word("apple")}) == "A. Apple.");
    }
}

TEST_CASE("Assembler concat", "[assembler]") {
    SECTION("suppresses the space") {
        CHECK(run({word("five"), CONCAT, word("pm")}) == "Fivepm.");
    }

    SECTION("plural suffix") {
        CHECK(run({word("three"), word("week"), CONCAT, word("s"), word("ago")})
              == "Three weeks ago.");
    }

    SECTION("overrides pending punctuation") {
        CHECK(run({word("a"), COMMA, CONCAT, word("b")}) == "Ab.");
    }
}

TEST_CASE("TextAssembler incremental use", "[assembler]") {
    TextAssembler assembler;
    CHECK(assembler.mode() == AssemblyMode::Beginning);

    assembler.push(word("hello"));
    CHECK(assembler.mode() == AssemblyMode::Interword);

    assembler.push(COMMA);
    CHECK(assembler.mode() == AssemblyMode::Comma);

    assembler.push(PERIOD);
    CHECK(assembler.mode() == AssemblyMode::NewSentence);

    assembler.push(word("again"));
    CHECK(assembler.finish() == "Hello. Again.");

    SECTION("finish resets the assembler") {
        CHECK(assembler.mode() == AssemblyMode::Beginning);
        assembler.push(word("next"));
        CHECK(assembler.finish() == "Next.");
    }
}

TEST_CASE("starts_with_vowel", "[assembler]") {
    CHECK(starts_with_vowel("apple"));
    CHECK(starts_with_vowel("Umbrella"));
    CHECK_FALSE(starts_with_vowel("yes"));
    CHECK_FALSE(starts_with_vowel("cat"));
    CHECK_FALSE(starts_with_vowel(""));
}
