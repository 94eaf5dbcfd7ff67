#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "mutagen/mutagen.hpp"

#include <array>
#include <set>
#include <string>

using namespace mutagen;
using Catch::Matchers::ContainsSubstring;

#ifndef MUTAGEN_GRAMMAR_DIR
#define MUTAGEN_GRAMMAR_DIR "grammars"
#endif

static const std::string GOREY_FATE = std::string(MUTAGEN_GRAMMAR_DIR) + "/gorey_fate.txt";

TEST_CASE("Mutagen compilation", "[mutagen]") {
    SECTION("empty source produces error") {
        auto result = compile_grammar("");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.diagnostics.size() == 1);
        CHECK(result.diagnostics[0].severity == Severity::Error);
        CHECK(result.diagnostics[0].code == "E001");
        CHECK_FALSE(result.generator.has_value());
    }

    SECTION("comment-only source defines no rules") {
        auto result = compile_grammar("# nothing here\n");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.diagnostics.size() == 1);
        CHECK(result.diagnostics[0].code == "E001");
        CHECK(result.diagnostics[0].message == "Grammar defines no rules");
    }

    SECTION("simple grammar") {
        auto result = compile_grammar("-root- = -a-an- (elephant / cat)");
        REQUIRE(result.success);
        REQUIRE(result.generator.has_value());
        CHECK(result.rule == "-root-");
        CHECK(result.diagnostics.empty());
        CHECK(result.generator->generate(0) == "An elephant.");
        CHECK(result.generator->generate(1) == "A cat.");
    }

    SECTION("numbers outside weights are words") {
        auto result = compile_grammar("-root- = call 18005551234 now\n");
        REQUIRE(result.success);
        CHECK(result.generator->generate(0) == "Call 18005551234 now.");
    }

    SECTION("-root- is preferred over the first rule") {
        auto result = compile_grammar("-other- = no\n-root- = yes");
        REQUIRE(result.success);
        CHECK(result.rule == "-root-");
        CHECK(result.generator->generate(0) == "Yes.");
    }

    SECTION("without -root- the first rule is used") {
        auto result = compile_grammar("-first- = one\n-second- = two");
        REQUIRE(result.success);
        CHECK(result.rule == "-first-");
        CHECK(result.generator->generate(0) == "One.");
    }

    SECTION("named rule") {
        auto result = compile_grammar("-first- = one\n-second- = two", "-second-");
        REQUIRE(result.success);
        CHECK(result.rule == "-second-");
        CHECK(result.generator->generate(0) == "Two.");
    }

    SECTION("unknown rule") {
        auto result = compile_grammar("-root- = one", "-missing-");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.diagnostics.size() == 1);
        CHECK(result.diagnostics[0].code == "E002");
        CHECK(result.diagnostics[0].message == "Rule not found: -missing-");
    }
}

TEST_CASE("Mutagen error propagation", "[mutagen]") {
    SECTION("lexer errors stop compilation") {
        auto result = compile_grammar("-root- = a @ b");
        REQUIRE_FALSE(result.success);
        CHECK(has_code(result.diagnostics, "L001"));
    }

    SECTION("parser errors stop compilation") {
        auto result = compile_grammar("-root- = ( a -nope-");
        REQUIRE_FALSE(result.success);
        CHECK(has_code(result.diagnostics, "P001"));
        CHECK_FALSE(has_code(result.diagnostics, "R002"));
    }

    SECTION("resolver errors stop compilation") {
        auto result = compile_grammar("-root- = -nope-");
        REQUIRE_FALSE(result.success);
        CHECK(has_code(result.diagnostics, "R002"));
    }

    SECTION("recursive rules are rejected") {
        auto result = compile_grammar("-root- = word -root-");
        REQUIRE_FALSE(result.success);
        CHECK(has_code(result.diagnostics, "R003"));
    }

    SECTION("compiler errors stop compilation") {
        static constexpr std::array<std::uint32_t, 1> primes{7};
        CompileOptions options;
        options.primes = primes;
        auto result = compile_grammar("-root- = (a / b) (c / d)", {}, "<input>", options);
        REQUIRE_FALSE(result.success);
        CHECK(has_code(result.diagnostics, "C001"));
    }

    SECTION("warnings do not stop compilation") {
        auto result = compile_grammar("-root- = g{ a / b } g{ c / d / e }");
        REQUIRE(result.success);
        CHECK(has_code(result.diagnostics, "W001"));
        CHECK_FALSE(has_errors(result.diagnostics));
    }

    SECTION("diagnostics carry the filename") {
        auto result = compile_grammar("-root- = -nope-", {}, "fates.txt");
        REQUIRE(result.diagnostics.size() == 1);
        CHECK(result.diagnostics[0].filename == "fates.txt");
    }

    SECTION("missing file") {
        auto result = compile_grammar_file("/nonexistent/grammar.txt");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.diagnostics.size() == 1);
        CHECK(result.diagnostics[0].code == "E000");
        CHECK_THAT(result.diagnostics[0].message, ContainsSubstring("/nonexistent/grammar.txt"));
    }
}

TEST_CASE("Mutagen load_grammar", "[mutagen]") {
    auto loaded = load_grammar("-root- = the -animal-\n-animal- = cat / owl");
    REQUIRE(loaded.success);
    CHECK(loaded.grammar.rules.size() == 2);
    CHECK(loaded.grammar.find_rule("-animal-") != NULL_NODE);
}

TEST_CASE("Gorey fate grammar", "[mutagen][integration]") {
    SECTION("loads and compiles with label warnings") {
        auto result = compile_grammar_file(GOREY_FATE);
        REQUIRE(result.success);
        CHECK(result.rule == "-root-");

        // Co-labeled choices in the grammar differ in size
        CHECK(has_code(result.diagnostics, "W001"));
        CHECK_FALSE(has_errors(result.diagnostics));

        const auto& grammar = result.generator->grammar();
        CHECK(grammar.cycles_used == 173);
        CHECK(grammar.label_count == 4);
        CHECK(grammar.shuffle_slots == 0);
    }

    SECTION("-root- output") {
        auto result = compile_grammar_file(GOREY_FATE);
        REQUIRE(result.success);
        auto& gen = *result.generator;

        CHECK(gen.generate(0) ==
              "Bernard, a precocious toddler of great perspicacity, exploded away one rainy day");
        CHECK(gen.generate(1) ==
              "Chloe, a girl, tumbled into a hole one afternoon last month");
        CHECK(gen.generate(2) == "Last Wednesday, Emmett melted");
        CHECK(gen.generate(3) ==
              "Last week Eunice, a flapper of not inconsiderable wit, plummeted into a banal "
              "antiquated oubliette");
        CHECK(gen.generate(4) ==
              "It was a month ago that Eugene, an inimitable toddler, evaporated");
        CHECK(gen.generate(5) == "Jennifer dropped into a pit on St. Swithin's Day");
    }

    SECTION("-gorey-fate- output gains the closing period") {
        auto result = compile_grammar_file(GOREY_FATE, "-gorey-fate-");
        REQUIRE(result.success);
        auto& gen = *result.generator;

        CHECK(gen.generate(2) == "Last Wednesday, Emmett melted.");
        CHECK(gen.generate(5) == "Jennifer dropped into a pit on St. Swithin's Day.");
    }

    SECTION("generation is deterministic and varied") {
        auto first = compile_grammar_file(GOREY_FATE);
        auto second = compile_grammar_file(GOREY_FATE);
        REQUIRE(first.success);
        REQUIRE(second.success);

        std::set<std::string> texts;
        for (std::uint64_t seed = 0; seed < 100; ++seed) {
            auto text = first.generator->generate(seed);
            CHECK(text == second.generator->generate(seed));
            texts.insert(text);
        }
        CHECK(texts.size() > 90);
    }
}
