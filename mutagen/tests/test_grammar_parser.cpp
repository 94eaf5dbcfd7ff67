#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "mutagen/grammar_lexer.hpp"
#include "mutagen/grammar_parser.hpp"

using namespace mutagen;
using Catch::Matchers::ContainsSubstring;

// Helper to lex and parse grammar text
static std::pair<Grammar, std::vector<Diagnostic>> parse(std::string_view source) {
    auto [tokens, lex_diags] = lex_grammar(source);
    REQUIRE(lex_diags.empty());
    return parse_grammar(std::move(tokens));
}

// Helper to get the body node of the only rule
static const Node& only_body(const Grammar& grammar) {
    REQUIRE(grammar.rules.size() == 1);
    REQUIRE(grammar.arena.valid(grammar.rules[0].body));
    return grammar.arena[grammar.rules[0].body];
}

TEST_CASE("Parser rule structure", "[grammar_parser]") {
    SECTION("single rule") {
        auto [grammar, diags] = parse("-root- = hello");
        REQUIRE(diags.empty());
        REQUIRE(grammar.rules.size() == 1);
        CHECK(grammar.rules[0].name == "-root-");
        CHECK(grammar.rules[0].location.line == 1);

        const Node& body = only_body(grammar);
        CHECK(body.type == NodeType::Literal);
        CHECK(body.as_literal() == "hello");
    }

    SECTION("a rule ends where the next begins") {
        auto [grammar, diags] = parse("-a- = x y -b- = z");
        REQUIRE(diags.empty());
        REQUIRE(grammar.rules.size() == 2);
        CHECK(grammar.rules[0].name == "-a-");
        CHECK(grammar.arena[grammar.rules[0].body].type == NodeType::Sequence);
        CHECK(grammar.arena[grammar.rules[0].body].children.size() == 2);
        CHECK(grammar.rules[1].name == "-b-");
        CHECK(grammar.arena[grammar.rules[1].body].as_literal() == "z");
    }

    SECTION("rules over several lines") {
        auto [grammar, diags] = parse("# fates\n-a- = x\n  / y\n\n-b- = -a-\n");
        REQUIRE(diags.empty());
        REQUIRE(grammar.rules.size() == 2);
        CHECK(grammar.arena[grammar.rules[0].body].type == NodeType::Weighted);
        CHECK(grammar.rules[1].location.line == 5);
        CHECK(grammar.find_rule("-b-") == grammar.rules[1].body);
        CHECK(grammar.find_rule("-c-") == NULL_NODE);
    }

    SECTION("empty body") {
        auto [grammar, diags] = parse("-nothing- =");
        REQUIRE(diags.empty());
        CHECK(only_body(grammar).type == NodeType::Empty);
    }
}

TEST_CASE("Parser expressions", "[grammar_parser]") {
    SECTION("sequence of words, references and punctuation") {
        auto [grammar, diags] = parse("-r- = -a-an- 3 o'clock , ; -- .");
        REQUIRE(diags.empty());
        const Node& body = only_body(grammar);
        REQUIRE(body.type == NodeType::Sequence);
        REQUIRE(body.children.size() == 7);

        const auto& arena = grammar.arena;
        CHECK(arena[body.children[0]].type == NodeType::RuleRef);
        CHECK(arena[body.children[0]].as_rule_name() == "-a-an-");
        CHECK(arena[body.children[1]].as_literal() == "3");
        CHECK(arena[body.children[2]].as_literal() == "o'clock");
        CHECK(arena[body.children[3]].type == NodeType::Comma);
        CHECK(arena[body.children[4]].type == NodeType::Semicolon);
        CHECK(arena[body.children[5]].type == NodeType::Dash);
        CHECK(arena[body.children[6]].type == NodeType::Period);
    }

    SECTION("alternatives with default and explicit weights") {
        auto [grammar, diags] = parse("-r- = gloomy / [3] dank and dark");
        REQUIRE(diags.empty());
        const Node& body = only_body(grammar);
        REQUIRE(body.type == NodeType::Weighted);
        CHECK(body.as_weights() == std::vector<std::uint32_t>{1, 3});
        REQUIRE(body.children.size() == 2);
        CHECK(grammar.arena[body.children[0]].type == NodeType::Literal);
        CHECK(grammar.arena[body.children[1]].type == NodeType::Sequence);
        CHECK(grammar.arena[body.children[1]].children.size() == 3);
    }

    SECTION("empty alternative") {
        auto [grammar, diags] = parse("-r- = very / ");
        REQUIRE(diags.empty());
        const Node& body = only_body(grammar);
        REQUIRE(body.children.size() == 2);
        CHECK(grammar.arena[body.children[1]].type == NodeType::Empty);
    }

    SECTION("long digit runs are literal text") {
        auto [grammar, diags] = parse("-r- = call 18005551234 now");
        REQUIRE(diags.empty());
        const Node& body = only_body(grammar);
        REQUIRE(body.children.size() == 3);
        CHECK(grammar.arena[body.children[1]].as_literal() == "18005551234");
    }

    SECTION("group inside a sequence") {
        auto [grammar, diags] = parse("-r- = (a / b) c");
        REQUIRE(diags.empty());
        const Node& body = only_body(grammar);
        REQUIRE(body.type == NodeType::Sequence);
        CHECK(grammar.arena[body.children[0]].type == NodeType::Weighted);
        CHECK(grammar.arena[body.children[1]].as_literal() == "c");
    }

    SECTION("group of one sequence is flattened") {
        auto [grammar, diags] = parse("-r- = (a b)");
        REQUIRE(diags.empty());
        CHECK(only_body(grammar).type == NodeType::Sequence);
    }

    SECTION("empty group") {
        auto [grammar, diags] = parse("-r- = ()");
        REQUIRE(diags.empty());
        CHECK(only_body(grammar).type == NodeType::Empty);
    }

    SECTION("shuffle") {
        auto [grammar, diags] = parse("-r- = { one / two / three }");
        REQUIRE(diags.empty());
        const Node& body = only_body(grammar);
        CHECK(body.type == NodeType::Shuffle);
        CHECK(body.children.size() == 3);
    }

    SECTION("labeled choice") {
        auto [grammar, diags] = parse("-r- = gender{ he / she }");
        REQUIRE(diags.empty());
        const Node& body = only_body(grammar);
        REQUIRE(body.type == NodeType::Fixed);
        CHECK(body.as_label() == "gender");
        REQUIRE(body.children.size() == 1);

        const Node& choice = grammar.arena[body.children[0]];
        CHECK(choice.type == NodeType::Weighted);
        CHECK(choice.as_weights() == std::vector<std::uint32_t>{1, 1});
    }

    SECTION("labeled single alternative is still a choice") {
        auto [grammar, diags] = parse("-r- = gender{ he }");
        REQUIRE(diags.empty());
        const Node& body = only_body(grammar);
        REQUIRE(body.type == NodeType::Fixed);
        const Node& choice = grammar.arena[body.children[0]];
        CHECK(choice.type == NodeType::Weighted);
        CHECK(choice.children.size() == 1);
    }
}

TEST_CASE("Parser shuffle weights", "[grammar_parser]") {
    auto [grammar, diags] = parse("-r- = { [2] a / b }");
    REQUIRE(diags.size() == 1);
    CHECK(diags[0].severity == Severity::Warning);
    CHECK(diags[0].code == "W003");
    CHECK(only_body(grammar).children.size() == 2);

    // The warning covers "[2]" and suggests deleting it
    CHECK(diags[0].location.column == 9);
    CHECK(diags[0].location.length == 3);
    REQUIRE(diags[0].fix.has_value());
    CHECK(diags[0].fix->description == "remove the weight");
    CHECK(diags[0].fix->new_text.empty());
    CHECK(diags[0].fix->location.offset == 8);
    CHECK(diags[0].fix->location.length == 3);
}

TEST_CASE("Parser errors", "[grammar_parser]") {
    SECTION("text outside a rule") {
        auto [grammar, diags] = parse("a = b");
        REQUIRE(diags.size() == 1);
        CHECK(diags[0].code == "P001");
        CHECK_THAT(diags[0].message, ContainsSubstring("rule definition"));
        CHECK(grammar.rules.empty());
    }

    SECTION("zero weight") {
        auto [grammar, diags] = parse("-r- = [0] a / b");
        REQUIRE(has_errors(diags));
        CHECK(diags[0].code == "P001");
        CHECK_THAT(diags[0].message, ContainsSubstring("positive"));
    }

    SECTION("missing weight number") {
        auto [grammar, diags] = parse("-r- = [x] a");
        REQUIRE(has_errors(diags));
        CHECK_THAT(diags[0].message, ContainsSubstring("weight"));
    }

    SECTION("weight too large") {
        auto [grammar, diags] = parse("-r- = [99999999999] a / b");
        REQUIRE(diags.size() == 1);
        CHECK(diags[0].code == "P001");
        CHECK(diags[0].message == "Weight is too large");
        CHECK(diags[0].location.column == 8);
    }

    SECTION("weight in the middle of a sequence") {
        auto [grammar, diags] = parse("-r- = a [2] b");
        REQUIRE(has_errors(diags));
        CHECK_THAT(diags[0].message, ContainsSubstring("start of an alternative"));
    }

    SECTION("unclosed shuffle") {
        auto [grammar, diags] = parse("-r- = { a / b");
        REQUIRE(diags.size() == 1);
        CHECK_THAT(diags[0].message, ContainsSubstring("'}'"));
    }

    SECTION("stray closing paren") {
        auto [grammar, diags] = parse("-r- = a )");
        REQUIRE(diags.size() == 1);
        CHECK(diags[0].message == "Unexpected ')' in rule -r-");
        CHECK(diags[0].location.column == 9);
    }

    SECTION("recovery continues with the next rule") {
        auto [grammar, diags] = parse("-r- = ( a\n-s- = b");
        REQUIRE(diags.size() == 1);
        CHECK_THAT(diags[0].message, ContainsSubstring("')'"));
        REQUIRE(grammar.rules.size() == 2);
        CHECK(grammar.rules[1].name == "-s-");
        CHECK(grammar.arena[grammar.rules[1].body].as_literal() == "b");
    }

    SECTION("one error per broken rule") {
        auto [grammar, diags] = parse("-a- = ( x\n-b- = y )\n-c- = z");
        CHECK(diags.size() == 2);
        CHECK(grammar.rules.size() == 3);
    }
}
