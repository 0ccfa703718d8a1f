#include "annotext/InlineAnnotationFilter.hpp"

#include <stdexcept>
#include <utility>
#include "annotext/AnnotationDetector.hpp"

namespace annotext {

InlineAnnotationFilter::InlineAnnotationFilter(std::unique_ptr<TokenStream> input, AnnotationConfig config)
    : input_(std::move(input)), config_(std::move(config)) {
    if (!input_) {
        throw std::invalid_argument("InlineAnnotationFilter requires an input stream");
    }
}

std::optional<Token> InlineAnnotationFilter::next() {
    if (!synonymStack_.empty()) {
        Token synonym = anchor_;
        synonym.text = config_.synonymPrefix + synonymStack_.back() + config_.synonymSuffix;
        synonymStack_.pop_back();
        synonym.type = config_.synonymType;
        synonym.positionIncrement = 0;
        return synonym;
    }

    auto token = input_->next();
    if (!token) {
        return std::nullopt;
    }

    if (pushSynonyms(*token)) {
        anchor_ = *token;
    }
    return token;
}

void InlineAnnotationFilter::reset() {
    synonymStack_.clear();
    anchor_ = Token{};
    input_->reset();
}

// Strips the annotation from token.text and stacks its synonyms.
// Returns true if at least one synonym was stacked.
bool InlineAnnotationFilter::pushSynonyms(Token& token) {
    auto match = detectAnnotation(token.text, config_);
    if (!match.found()) {
        return false;
    }

    token.text = std::move(match.prefix);
    for (auto& synonym : *match.synonyms) {
        synonymStack_.push_back(std::move(synonym));
    }
    return !synonymStack_.empty();
}

} // namespace annotext
