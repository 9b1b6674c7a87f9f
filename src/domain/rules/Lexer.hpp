/**
 * @file Lexer.hpp
 * @brief Tokenizer for block-definition source text.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/rules/Token.hpp"

namespace scribeaudit::domain::rules {

/**
 * @class Lexer
 * @brief Lazy, restartable token stream over one source text.
 *
 * Next() throws LexError on an invalid character after stepping past it, so a
 * caller can keep pulling tokens to collect further errors.
 */
class Lexer {
public:
    explicit Lexer(std::string source);

    /** @brief Returns the next token; EndOfInput is returned repeatedly once reached. */
    Token Next();

    /** @brief Restarts the stream from the first character. */
    void Reset();

    /**
     * @brief Tokenizes a whole source text, the last token being EndOfInput.
     * @param errors When null the first LexError is thrown; otherwise errors are
     *               appended here and lexing continues.
     */
    static std::vector<Token> Tokenize(const std::string& source, std::vector<LexError>* errors = nullptr);

    static bool IsKeyword(const std::string& word);

private:
    char peek(std::size_t ahead = 0) const;
    char advance();
    bool atEnd() const { return m_pos >= m_source.size(); }
    void skipTrivia();

    Token lexWord(const SourcePosition& start);
    Token lexNumber(const SourcePosition& start);
    Token lexString(const SourcePosition& start);

    std::string m_source;
    std::size_t m_pos = 0;
    std::size_t m_line = 1;
    std::size_t m_column = 1;
};

} // namespace scribeaudit::domain::rules
