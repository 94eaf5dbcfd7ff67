#include "mutagen/diagnostics.hpp"
#include <sstream>
#include <algorithm>

namespace mutagen {

namespace {

std::string_view severity_string(Severity s) {
    switch (s) {
        case Severity::Error:   return "error";
        case Severity::Warning: return "warning";
    }
    return "unknown";
}

std::string_view severity_color(Severity s) {
    switch (s) {
        case Severity::Error:   return "\033[1;31m";
        case Severity::Warning: return "\033[1;33m";
    }
    return "";
}

constexpr std::string_view RESET = "\033[0m";
constexpr std::string_view BOLD = "\033[1m";

// Line `line_num` (1-based) of source, without its newline
std::string_view source_line(std::string_view source, std::uint32_t line_num) {
    std::size_t line_start = 0;
    for (std::uint32_t current = 1; current < line_num; ++current) {
        auto nl = source.find('\n', line_start);
        if (nl == std::string_view::npos) {
            return {};
        }
        line_start = nl + 1;
    }
    if (line_start > source.size()) {
        return {};
    }

    auto line_end = source.find('\n', line_start);
    if (line_end == std::string_view::npos) {
        line_end = source.size();
    }
    return source.substr(line_start, line_end - line_start);
}

// Header: filename:line:column
void write_position(std::ostringstream& out, std::string_view filename,
                    const SourceLocation& loc) {
    out << BOLD << (filename.empty() ? std::string_view("<grammar>") : filename)
        << ":" << loc.line << ":" << loc.column << ": " << RESET;
}

} // namespace

std::string escape_json(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:   out += c; break;
        }
    }
    return out;
}

std::string format_diagnostic(const Diagnostic& diag, std::string_view source) {
    std::ostringstream out;

    write_position(out, diag.filename, diag.location);
    out << severity_color(diag.severity) << severity_string(diag.severity);
    if (!diag.code.empty()) {
        out << "[" << diag.code << "]";
    }
    out << RESET << ": " << BOLD << diag.message << RESET << "\n";

    // Source excerpt with caret, only for diagnostics that came from text
    if (!source.empty() && diag.location.length > 0) {
        auto line = source_line(source, diag.location.line);
        if (!line.empty()) {
            out << "    " << diag.location.line << " | " << line << "\n";
            out << "      | ";
            for (std::uint32_t i = 1; i < diag.location.column; ++i) {
                out << ' ';
            }
            out << severity_color(diag.severity) << "^";
            for (std::uint32_t i = 1; i < diag.location.length && i < 80; ++i) {
                out << "~";
            }
            out << RESET << "\n";
        }
    }

    for (const auto& rel : diag.related) {
        write_position(out, rel.filename, rel.location);
        out << "note: " << rel.message << "\n";
    }

    if (diag.fix) {
        out << "  = help: " << diag.fix->description << "\n";
    }

    return out.str();
}

std::string format_diagnostic_json(const Diagnostic& diag) {
    std::ostringstream out;

    out << R"({"severity":")" << severity_string(diag.severity) << R"(",)";
    out << R"("code":")" << escape_json(diag.code) << R"(",)";
    out << R"("message":")" << escape_json(diag.message) << R"(",)";
    out << R"("file":")" << escape_json(diag.filename) << R"(",)";
    out << R"("range":{"start":{"line":)" << (diag.location.line - 1)
        << R"(,"character":)" << (diag.location.column - 1) << R"(},)";
    out << R"("end":{"line":)" << (diag.location.line - 1)
        << R"(,"character":)" << (diag.location.column - 1 + diag.location.length) << R"(}})";

    if (!diag.related.empty()) {
        out << R"(,"related":[)";
        for (std::size_t i = 0; i < diag.related.size(); ++i) {
            const auto& rel = diag.related[i];
            if (i > 0) out << ",";
            out << R"({"message":")" << escape_json(rel.message) << R"(",)";
            out << R"("line":)" << (rel.location.line - 1)
                << R"(,"character":)" << (rel.location.column - 1) << "}";
        }
        out << "]";
    }

    if (diag.fix) {
        out << R"(,"fix":{"description":")" << escape_json(diag.fix->description) << R"(",)";
        out << R"("newText":")" << escape_json(diag.fix->new_text) << R"(",)";
        out << R"("line":)" << (diag.fix->location.line - 1)
            << R"(,"character":)" << (diag.fix->location.column - 1)
            << R"(,"length":)" << diag.fix->location.length << "}";
    }
    out << "}";

    return out.str();
}

bool has_errors(const std::vector<Diagnostic>& diagnostics) {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
        [](const Diagnostic& d) { return d.severity == Severity::Error; });
}

bool has_code(const std::vector<Diagnostic>& diagnostics, std::string_view code) {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
        [code](const Diagnostic& d) { return d.code == code; });
}

} // namespace mutagen
