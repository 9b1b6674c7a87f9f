/**
 * @file Lexer.cpp
 * @brief Implementation of Lexer.
 */

#include "domain/rules/Lexer.hpp"

#include <cctype>
#include <unordered_set>

namespace scribeaudit::domain::rules {

namespace {

bool IsWordStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '*';
}

bool IsWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '*';
}

const std::unordered_set<std::string>& Keywords() {
    static const std::unordered_set<std::string> k_keywords = {
        "block", "major", "minor", "core", "other", "label",
        "all-of", "any-of", "of",
        "courses", "credits", "min", "grade", "at-least", "except",
        "maximum",
        "if", "then", "else", "and", "or", "not",
        "total-credits", "gpa", "count-of", "credits-of",
        "block-ref", "exclusive", "shared"
    };
    return k_keywords;
}

} // namespace

Lexer::Lexer(std::string source) : m_source(std::move(source)) {}

bool Lexer::IsKeyword(const std::string& word) {
    return Keywords().count(word) > 0;
}

void Lexer::Reset() {
    m_pos = 0;
    m_line = 1;
    m_column = 1;
}

char Lexer::peek(std::size_t ahead) const {
    const std::size_t i = m_pos + ahead;
    return i < m_source.size() ? m_source[i] : '\0';
}

char Lexer::advance() {
    const char c = m_source[m_pos++];
    if (c == '\n') {
        ++m_line;
        m_column = 1;
    } else {
        ++m_column;
    }
    return c;
}

void Lexer::skipTrivia() {
    while (!atEnd()) {
        const char c = peek();
        if (std::isspace(static_cast<unsigned char>(c))) {
            advance();
        } else if (c == '#' || (c == '/' && peek(1) == '/')) {
            while (!atEnd() && peek() != '\n') advance();
        } else {
            return;
        }
    }
}

Token Lexer::Next() {
    skipTrivia();
    const SourcePosition start{m_pos, m_line, m_column};
    if (atEnd()) {
        return Token{TokenKind::EndOfInput, "", start};
    }

    const char c = peek();
    if (IsWordStart(c)) return lexWord(start);
    if (std::isdigit(static_cast<unsigned char>(c))) return lexNumber(start);
    if (c == '"') return lexString(start);

    switch (c) {
        case '{': case '}': case '(': case ')': case ',': case ';': case '-':
            advance();
            return Token{TokenKind::Punctuation, std::string(1, c), start};
        case '>': case '<':
            advance();
            if (peek() == '=') {
                advance();
                return Token{TokenKind::Comparison, std::string(1, c) + "=", start};
            }
            return Token{TokenKind::Comparison, std::string(1, c), start};
        case '=':
            advance();
            return Token{TokenKind::Comparison, "=", start};
        case '!':
            if (peek(1) == '=') {
                advance();
                advance();
                return Token{TokenKind::Comparison, "!=", start};
            }
            break;
        default:
            break;
    }

    advance();
    throw LexError(start, c);
}

Token Lexer::lexWord(const SourcePosition& start) {
    std::string text;
    bool wildcard = false;
    while (!atEnd()) {
        const char c = peek();
        if (IsWordChar(c)) {
            if (c == '*') wildcard = true;
            text.push_back(advance());
        } else if (c == '-' && std::isalpha(static_cast<unsigned char>(peek(1)))) {
            text.push_back(advance());
        } else {
            break;
        }
    }

    if (wildcard) return Token{TokenKind::Pattern, text, start};
    if (IsKeyword(text)) return Token{TokenKind::Keyword, text, start};
    return Token{TokenKind::Identifier, text, start};
}

Token Lexer::lexNumber(const SourcePosition& start) {
    std::string text;
    while (std::isdigit(static_cast<unsigned char>(peek()))) text.push_back(advance());
    if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1)))) {
        text.push_back(advance());
        while (std::isdigit(static_cast<unsigned char>(peek()))) text.push_back(advance());
    }
    return Token{TokenKind::Number, text, start};
}

Token Lexer::lexString(const SourcePosition& start) {
    advance(); // opening quote
    std::string text;
    while (!atEnd()) {
        const char c = advance();
        if (c == '"') {
            return Token{TokenKind::String, text, start};
        }
        if (c == '\\' && !atEnd()) {
            const char escaped = advance();
            text.push_back(escaped == 'n' ? '\n' : escaped);
            continue;
        }
        if (c == '\n') break;
        text.push_back(c);
    }
    // Unterminated literal: report the opening quote.
    throw LexError(start, '"');
}

std::vector<Token> Lexer::Tokenize(const std::string& source, std::vector<LexError>* errors) {
    Lexer lexer(source);
    std::vector<Token> tokens;
    while (true) {
        try {
            Token token = lexer.Next();
            const bool done = token.kind == TokenKind::EndOfInput;
            tokens.push_back(std::move(token));
            if (done) break;
        } catch (const LexError& e) {
            if (!errors) throw;
            errors->push_back(e);
        }
    }
    return tokens;
}

} // namespace scribeaudit::domain::rules
