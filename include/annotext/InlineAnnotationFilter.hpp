#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "annotext/AnnotationConfig.hpp"
#include "annotext/TokenStream.hpp"

namespace annotext {

// Characters surrounded by the start/end delimiters are synonyms of the word
// in front of them:
//
//     "Mozart[artist]"          -> Mozart, [artist]
//     "Salzburg[city;Austria]"  -> Salzburg, [Austria], [city]
//
// The base token is emitted with the annotation stripped, then each synonym
// follows as its own token with positionIncrement 0, the configured synonym
// type and the base token's offsets and attributes. Synonyms are buffered on
// a stack, so several of them come out in reverse order of appearance.
class InlineAnnotationFilter : public TokenStream {
public:
    InlineAnnotationFilter(std::unique_ptr<TokenStream> input, AnnotationConfig config = {});

    std::optional<Token> next() override;

    // Drops buffered synonyms and rewinds the upstream.
    void reset() override;

    const AnnotationConfig& config() const { return config_; }
    std::size_t pendingSynonyms() const { return synonymStack_.size(); }

private:
    std::unique_ptr<TokenStream> input_;
    const AnnotationConfig config_;

    std::vector<std::string> synonymStack_;
    // Base token the buffered synonyms belong to; meaningful only while the stack is non-empty.
    Token anchor_;

    bool pushSynonyms(Token& token);
};

} // namespace annotext
