#include "mutagen/grammar_parser.hpp"

namespace mutagen {

namespace {

bool is_digits(std::string_view text) {
    if (text.empty()) return false;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

} // namespace

GrammarParser::GrammarParser(std::vector<GrammarToken> tokens, std::string_view filename)
    : tokens_(std::move(tokens))
    , filename_(filename)
{
    if (tokens_.empty() || !tokens_.back().is_eof()) {
        tokens_.push_back(GrammarToken{.type = GrammarTokenType::Eof});
    }
}

Grammar GrammarParser::parse() {
    Grammar grammar;

    while (!is_at_end()) {
        if (at_rule_start()) {
            parse_rule(grammar);
        } else {
            error("Expected a rule definition such as '-name- = ...'");
        }
        if (panic_mode_) {
            synchronize();
        }
    }

    grammar.arena = std::move(arena_);
    return grammar;
}

// Token navigation

const GrammarToken& GrammarParser::current() const {
    return tokens_[current_idx_];
}

const GrammarToken& GrammarParser::previous() const {
    return tokens_[current_idx_ - 1];
}

const GrammarToken& GrammarParser::peek_next() const {
    if (current_idx_ + 1 < tokens_.size()) {
        return tokens_[current_idx_ + 1];
    }
    return tokens_.back();
}

bool GrammarParser::is_at_end() const {
    return current().type == GrammarTokenType::Eof;
}

bool GrammarParser::check(GrammarTokenType type) const {
    return current().type == type;
}

bool GrammarParser::match(GrammarTokenType type) {
    if (check(type)) {
        advance();
        return true;
    }
    return false;
}

const GrammarToken& GrammarParser::advance() {
    if (!is_at_end()) {
        current_idx_++;
    }
    return previous();
}

const GrammarToken& GrammarParser::consume(GrammarTokenType type, std::string_view message) {
    if (check(type)) {
        return advance();
    }
    error(message);
    return current();
}

bool GrammarParser::at_rule_start() const {
    return check(GrammarTokenType::RuleName) &&
           peek_next().type == GrammarTokenType::Equals;
}

bool GrammarParser::at_sequence_end() const {
    switch (current().type) {
        case GrammarTokenType::Eof:
        case GrammarTokenType::Slash:
        case GrammarTokenType::RParen:
        case GrammarTokenType::RBrace:
            return true;
        default:
            return at_rule_start();
    }
}

// Error handling

void GrammarParser::error(std::string_view message) {
    error_at(current(), message);
}

void GrammarParser::error_at(const GrammarToken& token, std::string_view message) {
    if (panic_mode_) return;  // Suppress cascading errors
    panic_mode_ = true;

    diagnostics_.push_back(Diagnostic{
        .severity = Severity::Error,
        .code = std::string(codes::Syntax),
        .message = std::string(message),
        .filename = filename_,
        .location = token.location
    });
}

void GrammarParser::warning_at(std::string_view code, SourceLocation loc, std::string message,
                               std::optional<Diagnostic::Fix> fix) {
    diagnostics_.push_back(Diagnostic{
        .severity = Severity::Warning,
        .code = std::string(code),
        .message = std::move(message),
        .filename = filename_,
        .location = loc,
        .fix = std::move(fix)
    });
}

void GrammarParser::synchronize() {
    panic_mode_ = false;

    while (!is_at_end()) {
        if (at_rule_start()) {
            return;
        }
        advance();
    }
}

// Grammar structure

void GrammarParser::parse_rule(Grammar& grammar) {
    GrammarToken name = advance();
    advance();  // '='

    NodeIndex body = parse_expression();

    if (!panic_mode_ && !is_at_end() && !at_rule_start()) {
        error("Unexpected '" + std::string(current().lexeme) + "' in rule " +
              std::string(name.lexeme));
    }

    grammar.rules.push_back(RuleDef{
        .name = std::string(name.lexeme),
        .body = body,
        .location = name.location
    });
}

NodeIndex GrammarParser::parse_expression() {
    SourceLocation loc = current().location;
    auto alternatives = parse_alternatives();

    if (alternatives.size() == 1) {
        return alternatives[0].node;
    }
    return make_choice(alternatives, loc);
}

std::vector<GrammarParser::Alternative> GrammarParser::parse_alternatives() {
    std::vector<Alternative> alternatives;
    alternatives.push_back(parse_alternative());

    while (!panic_mode_ && match(GrammarTokenType::Slash)) {
        alternatives.push_back(parse_alternative());
    }
    return alternatives;
}

GrammarParser::Alternative GrammarParser::parse_alternative() {
    Alternative alt;
    alt.location = current().location;

    if (match(GrammarTokenType::LBracket)) {
        if (!check(GrammarTokenType::Number)) {
            if (check(GrammarTokenType::Word) && is_digits(current().lexeme)) {
                error("Weight is too large");
            } else {
                error("Expected a weight after '['");
            }
            return alt;
        }
        const GrammarToken& weight = advance();
        if (weight.as_number() == 0) {
            error_at(weight, "Weight must be a positive integer");
            return alt;
        }
        alt.weight = weight.as_number();
        alt.explicit_weight = true;
        consume(GrammarTokenType::RBracket, "Expected ']' after weight");
        if (panic_mode_) return alt;

        const GrammarToken& close = previous();
        alt.weight_location = alt.location;
        alt.weight_location.length =
            close.location.offset + close.location.length - alt.location.offset;
    }

    alt.node = parse_sequence();
    return alt;
}

NodeIndex GrammarParser::parse_sequence() {
    const GrammarToken& first = current();
    std::vector<NodeIndex> factors;

    while (!at_sequence_end() && !panic_mode_) {
        NodeIndex factor = parse_factor();
        if (factor != NULL_NODE) {
            factors.push_back(factor);
        }
    }

    if (factors.empty()) {
        return make_node(NodeType::Empty, first);
    }
    if (factors.size() == 1) {
        return factors[0];
    }

    NodeIndex seq = make_node(NodeType::Sequence, first);
    for (NodeIndex factor : factors) {
        arena_.add_child(seq, factor);
    }
    return seq;
}

NodeIndex GrammarParser::parse_factor() {
    const GrammarToken& tok = current();

    switch (tok.type) {
        case GrammarTokenType::RuleName: {
            advance();
            NodeIndex ref = make_node(NodeType::RuleRef, tok);
            arena_[ref].data = Node::RuleRefData{std::string(tok.lexeme)};
            return ref;
        }

        case GrammarTokenType::Word:
        case GrammarTokenType::Number: {
            advance();
            if (match(GrammarTokenType::LBrace)) {
                return parse_fixed(tok);
            }
            NodeIndex lit = make_node(NodeType::Literal, tok);
            arena_[lit].data = Node::LiteralData{std::string(tok.lexeme)};
            return lit;
        }

        case GrammarTokenType::LParen:
            advance();
            return parse_group();

        case GrammarTokenType::LBrace:
            advance();
            return parse_shuffle();

        case GrammarTokenType::Period:    return parse_punctuation(NodeType::Period);
        case GrammarTokenType::Comma:     return parse_punctuation(NodeType::Comma);
        case GrammarTokenType::Semicolon: return parse_punctuation(NodeType::Semicolon);
        case GrammarTokenType::Dash:      return parse_punctuation(NodeType::Dash);

        case GrammarTokenType::LBracket:
            error("Weights are only allowed at the start of an alternative");
            return NULL_NODE;

        default:
            error("Unexpected '" + std::string(tok.lexeme) + "'");
            return NULL_NODE;
    }
}

// Factors

NodeIndex GrammarParser::parse_group() {
    NodeIndex inner = parse_expression();
    consume(GrammarTokenType::RParen, "Expected ')' to close group");
    return inner;
}

NodeIndex GrammarParser::parse_shuffle() {
    const GrammarToken& open = previous();
    auto alternatives = parse_alternatives();
    consume(GrammarTokenType::RBrace, "Expected '}' to close shuffle");

    NodeIndex shuffle = make_node(NodeType::Shuffle, open);
    for (const auto& alt : alternatives) {
        if (alt.explicit_weight) {
            warning_at(codes::ShuffleWeight, alt.weight_location,
                       "Weights inside '{ }' are ignored; every shuffled alternative is drawn once",
                       Diagnostic::Fix{
                           .description = "remove the weight",
                           .new_text = "",
                           .location = alt.weight_location
                       });
        }
        if (alt.node != NULL_NODE) {
            arena_.add_child(shuffle, alt.node);
        }
    }
    return shuffle;
}

NodeIndex GrammarParser::parse_fixed(const GrammarToken& label) {
    auto alternatives = parse_alternatives();
    consume(GrammarTokenType::RBrace,
            "Expected '}' to close '" + std::string(label.lexeme) + "{'");

    NodeIndex choice = make_choice(alternatives, label.location);
    NodeIndex fixed = make_node(NodeType::Fixed, label);
    arena_[fixed].data = Node::LabelData{std::string(label.lexeme)};
    arena_.add_child(fixed, choice);
    return fixed;
}

NodeIndex GrammarParser::parse_punctuation(NodeType type) {
    const GrammarToken& tok = advance();
    return make_node(type, tok);
}

NodeIndex GrammarParser::make_choice(const std::vector<Alternative>& alternatives,
                                     SourceLocation loc) {
    NodeIndex choice = arena_.alloc(NodeType::Weighted, loc);
    for (const auto& alt : alternatives) {
        if (alt.node != NULL_NODE) {
            arena_.add_weighted_child(choice, alt.weight, alt.node);
        }
    }
    return choice;
}

NodeIndex GrammarParser::make_node(NodeType type, const GrammarToken& token) {
    return arena_.alloc(type, token.location);
}

std::pair<Grammar, std::vector<Diagnostic>>
parse_grammar(std::vector<GrammarToken> tokens, std::string_view filename) {
    GrammarParser parser(std::move(tokens), filename);
    auto grammar = parser.parse();
    return {std::move(grammar), parser.diagnostics()};
}

} // namespace mutagen
