#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace mutagen {

/// Source location for error reporting
struct SourceLocation {
    std::uint32_t line = 1;      // 1-based line number
    std::uint32_t column = 1;    // 1-based column number
    std::uint32_t offset = 0;    // 0-based byte offset
    std::uint32_t length = 0;    // Length of the span
};

/// Diagnostic severity levels
enum class Severity {
    Error,      // Grammar cannot be compiled
    Warning     // Suspicious construct, compilation continues
};

/// Diagnostic codes, grouped by the phase that emits them
namespace codes {
    // Driver
    constexpr std::string_view FileUnreadable   = "E000";
    constexpr std::string_view EmptySource      = "E001";
    constexpr std::string_view RuleNotFound     = "E002";

    // Grammar lexer / parser
    constexpr std::string_view UnexpectedChar   = "L001";
    constexpr std::string_view BadRuleName      = "L002";
    constexpr std::string_view Syntax           = "P001";

    // Rule resolution
    constexpr std::string_view DuplicateRule    = "R001";
    constexpr std::string_view UndefinedRule    = "R002";
    constexpr std::string_view RecursiveRule    = "R003";

    // Node compilation
    constexpr std::string_view PoolExhausted    = "C001";
    constexpr std::string_view EmptyChoice      = "C002";
    constexpr std::string_view InvalidWeight    = "C003";
    constexpr std::string_view RecursiveNode    = "C004";
    constexpr std::string_view InvalidNode      = "C005";

    // Warnings
    constexpr std::string_view LabelMismatch    = "W001";
    constexpr std::string_view LabelIgnored     = "W002";
    constexpr std::string_view ShuffleWeight    = "W003";
} // namespace codes

/// A single diagnostic message
struct Diagnostic {
    Severity severity = Severity::Error;
    std::string code;           // Diagnostic code (e.g., "C001", "W002")
    std::string message;        // Human-readable message
    std::string filename;       // Grammar file name
    SourceLocation location;    // Location in grammar source

    /// Related information (e.g., "label first used here")
    struct Related {
        std::string message;
        std::string filename;
        SourceLocation location;
    };
    std::vector<Related> related;

    /// Suggested edit: replace `location` with `new_text`
    struct Fix {
        std::string description;
        std::string new_text;
        SourceLocation location;
    };
    std::optional<Fix> fix;
};

/// Format a diagnostic for terminal output
std::string format_diagnostic(const Diagnostic& diag, std::string_view source);

/// Format a diagnostic as JSON (one object, no trailing newline)
std::string format_diagnostic_json(const Diagnostic& diag);

/// Escape a string for inclusion in a JSON string literal
std::string escape_json(std::string_view s);

/// Check if any diagnostic is an error
bool has_errors(const std::vector<Diagnostic>& diagnostics);

/// Check if a diagnostic with the given code is present
bool has_code(const std::vector<Diagnostic>& diagnostics, std::string_view code);

} // namespace mutagen
