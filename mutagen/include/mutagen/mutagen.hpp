#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "compiler.hpp"
#include "diagnostics.hpp"
#include "generator.hpp"
#include "grammar_parser.hpp"

namespace mutagen {

/// Mutagen version information
struct Version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    static constexpr std::string_view string() { return "0.1.0"; }
};

/// Rule used when none is named and no -root- rule exists: the first one
inline constexpr std::string_view DEFAULT_RULE = "-root-";

/// Grammar text after lexing, parsing and rule resolution
struct LoadResult {
    bool success = false;
    Grammar grammar;               // Rule bodies with references linked
    std::vector<Diagnostic> diagnostics;
};

/// Grammar text compiled down to a generator for one rule
struct GrammarResult {
    bool success = false;
    std::optional<Generator> generator;
    std::string rule;              // The rule that was compiled
    std::vector<Diagnostic> diagnostics;
};

/// Lex, parse and resolve grammar text
/// @param source The grammar text
/// @param filename Optional filename for error reporting
LoadResult load_grammar(std::string_view source, std::string_view filename = "<input>");

/// Load grammar text and compile one of its rules
/// @param source The grammar text
/// @param rule Rule to compile; empty selects -root- or else the first rule
/// @param filename Optional filename for error reporting
/// @param options Compiler settings (its filename is replaced by `filename`)
/// @return Generator for the rule, plus all diagnostics
GrammarResult compile_grammar(std::string_view source, std::string_view rule = {},
                              std::string_view filename = "<input>",
                              CompileOptions options = {});

/// Compile from file
/// @param path Path to the grammar file
/// @param rule Rule to compile; empty selects the default
GrammarResult compile_grammar_file(const std::string& path, std::string_view rule = {},
                                   CompileOptions options = {});

} // namespace mutagen
