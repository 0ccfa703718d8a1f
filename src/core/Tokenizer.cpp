#include "annotext/Tokenizer.hpp"

#include <cctype>
#include <utility>

namespace annotext {

WhitespaceTokenizer::WhitespaceTokenizer(std::string text, TokenizerOptions options)
    : text_(std::move(text)), options_(std::move(options)) {
}

std::optional<Token> WhitespaceTokenizer::next() {
    const std::size_t length = text_.size();
    auto isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

    while (pos_ < length && isSpace(text_[pos_])) {
        ++pos_;
    }
    if (pos_ >= length) return std::nullopt;

    const std::size_t start = pos_;
    const std::string& open = options_.groupOpen;
    const std::string& close = options_.groupClose;
    bool inGroup = false;
    while (pos_ < length) {
        if (grouping()) {
            if (!inGroup && text_.compare(pos_, open.size(), open) == 0) {
                pos_ += open.size();
                // Only group if a close follows; otherwise behave like a plain split.
                inGroup = text_.find(close, pos_) != std::string::npos;
                continue;
            }
            if (inGroup && text_.compare(pos_, close.size(), close) == 0) {
                pos_ += close.size();
                inGroup = false;
                continue;
            }
        }
        if (!inGroup && isSpace(text_[pos_])) break;
        ++pos_;
    }

    Token token;
    token.text = text_.substr(start, pos_ - start);
    token.startOffset = start;
    token.endOffset = pos_;
    return token;
}

} // namespace annotext
