#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "mutagen/diagnostics.hpp"

using Catch::Matchers::ContainsSubstring;

TEST_CASE("Diagnostic formatting", "[diagnostics]") {
    mutagen::Diagnostic diag{
        .severity = mutagen::Severity::Error,
        .code = "R002",
        .message = "Undefined rule -colour-",
        .filename = "fates.mut",
        .location = {.line = 2, .column = 9, .offset = 19, .length = 8}
    };

    SECTION("terminal format includes location") {
        std::string source = "-root- = -fate-\n-fate- = -colour- sky\n";
        auto output = mutagen::format_diagnostic(diag, source);

        CHECK_THAT(output, ContainsSubstring("fates.mut:2:9"));
        CHECK_THAT(output, ContainsSubstring("error"));
        CHECK_THAT(output, ContainsSubstring("R002"));
        CHECK_THAT(output, ContainsSubstring("Undefined rule -colour-"));
    }

    SECTION("terminal format shows the source line") {
        std::string source = "-root- = -fate-\n-fate- = -colour- sky\n";
        auto output = mutagen::format_diagnostic(diag, source);

        CHECK_THAT(output, ContainsSubstring("-fate- = -colour- sky"));
        CHECK_THAT(output, ContainsSubstring("^~~~~~~"));
    }

    SECTION("zero-length locations print no excerpt") {
        diag.location.length = 0;
        auto output = mutagen::format_diagnostic(diag, "-root- = -fate-\n-fate- = -colour- sky\n");

        CHECK_THAT(output, !ContainsSubstring("-fate- = -colour- sky"));
    }

    SECTION("related notes are printed") {
        diag.related.push_back({
            .message = "first defined here",
            .filename = "fates.mut",
            .location = {.line = 1, .column = 1}
        });
        auto output = mutagen::format_diagnostic(diag, "");

        CHECK_THAT(output, ContainsSubstring("note: first defined here"));
        CHECK_THAT(output, ContainsSubstring("fates.mut:1:1"));
    }

    SECTION("fixes are printed") {
        diag.severity = mutagen::Severity::Warning;
        diag.fix = mutagen::Diagnostic::Fix{
            .description = "remove the weight",
            .new_text = "",
            .location = {.line = 2, .column = 9, .offset = 19, .length = 3}
        };
        auto output = mutagen::format_diagnostic(diag, "");
        CHECK_THAT(output, ContainsSubstring("help: remove the weight"));

        auto json = mutagen::format_diagnostic_json(diag);
        CHECK_THAT(json, ContainsSubstring(R"("fix":{"description":"remove the weight","newText":"")"));
        CHECK_THAT(json, ContainsSubstring(R"("length":3})"));
    }

    SECTION("JSON format") {
        auto json = mutagen::format_diagnostic_json(diag);

        CHECK_THAT(json, ContainsSubstring(R"("severity":"error")"));
        CHECK_THAT(json, ContainsSubstring(R"("code":"R002")"));
        CHECK_THAT(json, ContainsSubstring(R"("line":1)"));       // 0-indexed
        CHECK_THAT(json, ContainsSubstring(R"("character":8)"));  // 0-indexed
        CHECK_THAT(json, ContainsSubstring(R"("character":16)")); // end of span
        CHECK_THAT(json, !ContainsSubstring("fix"));
    }

    SECTION("JSON escapes message text") {
        diag.message = "Unexpected '\"'";
        auto json = mutagen::format_diagnostic_json(diag);

        CHECK_THAT(json, ContainsSubstring(R"(Unexpected '\"')"));
    }
}

TEST_CASE("has_errors helper", "[diagnostics]") {
    SECTION("empty list has no errors") {
        std::vector<mutagen::Diagnostic> diags;
        CHECK_FALSE(mutagen::has_errors(diags));
    }

    SECTION("warnings are not errors") {
        std::vector<mutagen::Diagnostic> diags{
            {.severity = mutagen::Severity::Warning},
            {.severity = mutagen::Severity::Warning, .code = "W003"}
        };
        CHECK_FALSE(mutagen::has_errors(diags));
    }

    SECTION("detects errors") {
        std::vector<mutagen::Diagnostic> diags{
            {.severity = mutagen::Severity::Warning},
            {.severity = mutagen::Severity::Error}
        };
        CHECK(mutagen::has_errors(diags));
    }
}

TEST_CASE("has_code helper", "[diagnostics]") {
    std::vector<mutagen::Diagnostic> diags{
        {.severity = mutagen::Severity::Warning, .code = "W001"},
        {.severity = mutagen::Severity::Error, .code = "C001"}
    };

    CHECK(mutagen::has_code(diags, mutagen::codes::LabelMismatch));
    CHECK(mutagen::has_code(diags, mutagen::codes::PoolExhausted));
    CHECK_FALSE(mutagen::has_code(diags, mutagen::codes::EmptyChoice));
}
