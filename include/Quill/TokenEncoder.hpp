// =================================================================
// include/Quill/TokenEncoder.hpp
// =================================================================
// Header for token counting used by the stats report.

#pragma once

#include <string>
#include <vector>

namespace Quill {

/**
 * @brief Splits text into tokens; only the token count is consumed
 */
class TokenEncoder {
public:
    virtual ~TokenEncoder() = default;

    /**
     * @brief Encode text into a token sequence
     * @param text Input text
     * @return Tokens in order
     */
    virtual std::vector<std::string> encode(const std::string& text) const = 0;

    /**
     * @brief Number of tokens encode() would produce
     */
    virtual size_t countTokens(const std::string& text) const {
        return encode(text).size();
    }
};

/**
 * @brief Byte-level pre-tokenizer in the style of BPE encoders
 *
 * Produces one token per contraction suffix, letter run (with at most
 * one leading non-alphanumeric character such as a space), digit run of
 * up to three digits, punctuation run (with an optional leading space),
 * newline run and whitespace run. Bytes >= 0x80 are treated as letters
 * so UTF-8 words stay in one piece. Concatenating the tokens yields the
 * input exactly.
 */
class PretokenEncoder : public TokenEncoder {
public:
    std::vector<std::string> encode(const std::string& text) const override;
};

} // namespace Quill
