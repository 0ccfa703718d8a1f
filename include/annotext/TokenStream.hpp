#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>
#include "annotext/Token.hpp"

namespace annotext {

// Pull contract shared by tokenizers and filters.
class TokenStream {
public:
    virtual ~TokenStream() = default;

    // Next token, or std::nullopt once the stream is exhausted.
    virtual std::optional<Token> next() = 0;

    // Rewind so the stream can be consumed again.
    virtual void reset() {}
};

// Replays a fixed list of tokens. Handy as an upstream in tests and for
// re-filtering tokens that were already materialized.
class VectorTokenStream : public TokenStream {
public:
    explicit VectorTokenStream(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    std::optional<Token> next() override {
        if (pos_ >= tokens_.size()) return std::nullopt;
        return tokens_[pos_++];
    }

    void reset() override { pos_ = 0; }

private:
    std::vector<Token> tokens_;
    std::size_t pos_ = 0;
};

} // namespace annotext
