/**
 * @file Token.hpp
 * @brief Tokens produced by the block-definition lexer.
 */

#pragma once

#include <string>

#include "domain/rules/AuditErrors.hpp"

namespace scribeaudit::domain::rules {

enum class TokenKind {
    Keyword,
    Identifier,
    Number,
    Comparison,  ///< >= <= > < = !=
    String,      ///< Double-quoted literal, text holds the unescaped value.
    Pattern,     ///< Identifier text containing '*', or a bare '*'.
    Punctuation, ///< { } ( ) , ; -
    EndOfInput
};

inline std::string TokenKindToString(TokenKind kind) {
    switch (kind) {
        case TokenKind::Keyword: return "keyword";
        case TokenKind::Identifier: return "identifier";
        case TokenKind::Number: return "number";
        case TokenKind::Comparison: return "comparison";
        case TokenKind::String: return "string";
        case TokenKind::Pattern: return "pattern";
        case TokenKind::Punctuation: return "punctuation";
        case TokenKind::EndOfInput: return "end of input";
        default: return "unknown";
    }
}

struct Token {
    TokenKind kind = TokenKind::EndOfInput;
    std::string text;
    SourcePosition position;

    bool is(TokenKind k, const std::string& t) const { return kind == k && text == t; }
    bool isKeyword(const std::string& t) const { return is(TokenKind::Keyword, t); }
    bool isPunct(const std::string& t) const { return is(TokenKind::Punctuation, t); }

    /** @brief Human-readable form used in diagnostics, e.g. "keyword 'all-of'". */
    std::string Describe() const {
        if (kind == TokenKind::EndOfInput) return "end of input";
        return TokenKindToString(kind) + " '" + text + "'";
    }
};

} // namespace scribeaudit::domain::rules
