#include "mutagen/generator.hpp"

namespace mutagen {

Generator::Generator(CompiledGrammar grammar)
    : grammar_(std::move(grammar))
    , session_(grammar_.shuffle_slots)
{}

std::string Generator::generate(std::uint64_t seed) {
    return generate(seed, session_);
}

std::string Generator::generate(std::uint64_t seed, GenerationState& session) const {
    return assemble(tokens(seed, session));
}

std::vector<OutputToken> Generator::tokens(std::uint64_t seed,
                                           GenerationState& session) const {
    return evaluate_tokens(grammar_, seed, session);
}

GenerationState Generator::new_session() const {
    return GenerationState(grammar_.shuffle_slots);
}

} // namespace mutagen
