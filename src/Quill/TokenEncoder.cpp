// =================================================================
// src/Quill/TokenEncoder.cpp
// =================================================================
// Implementation for the default pre-tokenizing encoder.

#include "Quill/TokenEncoder.hpp"
#include <cctype>

namespace Quill {

namespace {

bool isLetter(unsigned char c) {
    return std::isalpha(c) || c >= 0x80;
}

bool isDigit(unsigned char c) {
    return std::isdigit(c) != 0;
}

bool isNewline(unsigned char c) {
    return c == '\n' || c == '\r';
}

bool isSpace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\v' || c == '\f' || isNewline(c);
}

bool isPunctuation(unsigned char c) {
    return !isLetter(c) && !isDigit(c) && !isSpace(c);
}

/**
 * Length of an English contraction suffix starting at pos, or 0.
 */
size_t contractionLength(const std::string& text, size_t pos) {
    static const char* const suffixes[] = {"'ll", "'re", "'ve", "'s", "'t", "'m", "'d"};
    for (const char* suffix : suffixes) {
        std::string candidate(suffix);
        if (text.compare(pos, candidate.size(), candidate) == 0) {
            return candidate.size();
        }
    }
    return 0;
}

} // namespace

std::vector<std::string> PretokenEncoder::encode(const std::string& text) const {
    std::vector<std::string> tokens;
    const size_t length = text.size();
    size_t pos = 0;
    
    auto at = [&](size_t i) { return static_cast<unsigned char>(text[i]); };
    
    while (pos < length) {
        size_t start = pos;
        unsigned char c = at(pos);
        
        if (c == '\'') {
            size_t suffix = contractionLength(text, pos);
            if (suffix > 0) {
                tokens.push_back(text.substr(pos, suffix));
                pos += suffix;
                continue;
            }
        }
        
        // Optional single leading non-letter (usually a space) before a word
        if (isLetter(c) ||
            (!isNewline(c) && !isDigit(c) && !isLetter(c) && pos + 1 < length && isLetter(at(pos + 1)))) {
            if (!isLetter(c)) {
                ++pos;
            }
            while (pos < length && isLetter(at(pos))) {
                ++pos;
            }
        } else if (isDigit(c)) {
            while (pos < length && isDigit(at(pos)) && pos - start < 3) {
                ++pos;
            }
        } else if (c == ' ' && pos + 1 < length && isPunctuation(at(pos + 1))) {
            ++pos;
            while (pos < length && isPunctuation(at(pos))) {
                ++pos;
            }
        } else if (isPunctuation(c)) {
            while (pos < length && isPunctuation(at(pos))) {
                ++pos;
            }
        } else if (isNewline(c)) {
            while (pos < length && isNewline(at(pos))) {
                ++pos;
            }
        } else {
            // Whitespace run; leave the last space to prefix a following word
            while (pos < length && isSpace(at(pos)) && !isNewline(at(pos))) {
                ++pos;
            }
            if (pos - start > 1 && pos < length && !isSpace(at(pos))) {
                --pos;
            }
        }
        
        tokens.push_back(text.substr(start, pos - start));
    }
    
    return tokens;
}

} // namespace Quill
