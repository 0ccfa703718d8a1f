#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include "annotext/TokenStream.hpp"

namespace annotext {

struct TokenizerOptions {
    // When both are set, whitespace between groupOpen and the following
    // groupClose does not split ("Salzburg[city; Austria]" stays one token).
    // Either may be a multi-byte UTF-8 sequence.
    std::string groupOpen;
    std::string groupClose;
};

// Splits on ASCII whitespace; no casing or punctuation handling.
class WhitespaceTokenizer : public TokenStream {
public:
    explicit WhitespaceTokenizer(std::string text, TokenizerOptions options = {});

    std::optional<Token> next() override;
    void reset() override { pos_ = 0; }

    const std::string& text() const { return text_; }

private:
    std::string text_;
    TokenizerOptions options_;
    std::size_t pos_ = 0;

    bool grouping() const { return !options_.groupOpen.empty() && !options_.groupClose.empty(); }
};

} // namespace annotext
