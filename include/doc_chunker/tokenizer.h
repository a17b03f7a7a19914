#pragma once

#include <string>
#include <vector>

namespace doc_chunker {

// Token counting and token-string rendering used by every merge pass.
// Implementations must be deterministic.
class Tokenizer {
public:
    virtual ~Tokenizer() = default;

    virtual size_t count_tokens(const std::string& text) const = 0;

    // Space-separated coarse token representation
    virtual std::string tokenize(const std::string& text) const = 0;

    // Refines the output of tokenize()
    virtual std::string fine_grained_tokenize(const std::string& coarse_tokens) const = 0;
};

/**
 * Default tokenizer. A run of ASCII letters/digits is one token; every other
 * non-space code point (punctuation, CJK, ...) is a token on its own.
 *
 *   count_tokens("Hello, world!")   -> 4
 *   count_tokens("第一章 总则")      -> 5
 *   tokenize("Hello, World")        -> "hello , world"
 *   fine_grained_tokenize("abc123") -> "abc 123"
 */
class WordTokenizer : public Tokenizer {
public:
    size_t count_tokens(const std::string& text) const override;
    std::string tokenize(const std::string& text) const override;
    std::string fine_grained_tokenize(const std::string& coarse_tokens) const override;

    std::vector<std::string> split(const std::string& text) const;
};

} // namespace doc_chunker
