#pragma once

#include "assembler.hpp"
#include "compiler.hpp"
#include "evaluator.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace mutagen {

/// A compiled grammar ready to produce text
///
/// generate(seed) uses a session owned by the generator, so calling it
/// several times with the same seed continues the Shuffle decks rather than
/// starting over. Use a separate session (new_session()) to get a clean,
/// reproducible run or to generate from several threads at once.
class Generator {
public:
    explicit Generator(CompiledGrammar grammar);

    /// Text for `seed`, using the generator's own session
    [[nodiscard]] std::string generate(std::uint64_t seed);

    /// Text for `seed`, using a caller-owned session
    [[nodiscard]] std::string generate(std::uint64_t seed, GenerationState& session) const;

    /// Raw token stream for `seed` (views into this generator's grammar)
    [[nodiscard]] std::vector<OutputToken> tokens(std::uint64_t seed,
                                                  GenerationState& session) const;

    /// Fresh session sized for this grammar
    [[nodiscard]] GenerationState new_session() const;

    /// Forget the Shuffle memos of the generator's own session
    void reset_session() { session_.reset(); }

    [[nodiscard]] const CompiledGrammar& grammar() const { return grammar_; }

private:
    CompiledGrammar grammar_;
    GenerationState session_;
};

} // namespace mutagen
