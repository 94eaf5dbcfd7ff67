#include "mutagen/mutagen.hpp"
#include "mutagen/grammar_lexer.hpp"
#include "mutagen/resolver.hpp"
#include <fstream>
#include <sstream>

namespace mutagen {

static void append_diagnostics(std::vector<Diagnostic>& out,
                               const std::vector<Diagnostic>& diags) {
    out.insert(out.end(), diags.begin(), diags.end());
}

LoadResult load_grammar(std::string_view source, std::string_view filename) {
    LoadResult result;

    if (source.empty()) {
        result.diagnostics.push_back(Diagnostic{
            .severity = Severity::Error,
            .code = std::string(codes::EmptySource),
            .message = "Empty grammar",
            .filename = std::string(filename),
            .location = {.line = 1, .column = 1, .offset = 0, .length = 0}
        });
        return result;
    }

    // Phase 1: Lexing
    auto [tokens, lex_diags] = lex_grammar(source, filename);
    append_diagnostics(result.diagnostics, lex_diags);
    if (has_errors(lex_diags)) {
        return result;
    }

    // Phase 2: Parsing
    auto [grammar, parse_diags] = parse_grammar(std::move(tokens), filename);
    append_diagnostics(result.diagnostics, parse_diags);
    if (has_errors(parse_diags)) {
        return result;
    }

    if (!grammar.valid()) {
        result.diagnostics.push_back(Diagnostic{
            .severity = Severity::Error,
            .code = std::string(codes::EmptySource),
            .message = "Grammar defines no rules",
            .filename = std::string(filename),
            .location = {.line = 1, .column = 1, .offset = 0, .length = 0}
        });
        return result;
    }

    // Phase 3: Rule resolution
    auto resolved = resolve_rules(std::move(grammar), filename);
    append_diagnostics(result.diagnostics, resolved.diagnostics);
    if (!resolved.success) {
        return result;
    }

    result.grammar = std::move(resolved.grammar);
    result.success = true;
    return result;
}

GrammarResult compile_grammar(std::string_view source, std::string_view rule,
                              std::string_view filename, CompileOptions options) {
    GrammarResult result;

    auto loaded = load_grammar(source, filename);
    result.diagnostics = std::move(loaded.diagnostics);
    if (!loaded.success) {
        return result;
    }

    const Grammar& grammar = loaded.grammar;

    if (rule.empty()) {
        rule = grammar.find_rule(DEFAULT_RULE) != NULL_NODE
            ? DEFAULT_RULE
            : std::string_view(grammar.rules.front().name);
    }

    NodeIndex root = grammar.find_rule(rule);
    if (root == NULL_NODE) {
        result.diagnostics.push_back(Diagnostic{
            .severity = Severity::Error,
            .code = std::string(codes::RuleNotFound),
            .message = "Rule not found: " + std::string(rule),
            .filename = std::string(filename),
            .location = {}
        });
        return result;
    }
    result.rule = std::string(rule);

    // Phase 4: Node compilation
    options.filename = filename;
    auto compiled = compile(grammar.arena, root, options);
    append_diagnostics(result.diagnostics, compiled.diagnostics);
    if (!compiled.success) {
        return result;
    }

    result.generator.emplace(std::move(compiled.grammar));
    result.success = true;
    return result;
}

GrammarResult compile_grammar_file(const std::string& path, std::string_view rule,
                                   CompileOptions options) {
    std::ifstream file(path);
    if (!file) {
        GrammarResult result;
        result.diagnostics.push_back(Diagnostic{
            .severity = Severity::Error,
            .code = std::string(codes::FileUnreadable),
            .message = "Could not open file: " + path,
            .filename = path,
            .location = {}
        });
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string source = buffer.str();
    return compile_grammar(source, rule, path, options);
}

} // namespace mutagen
