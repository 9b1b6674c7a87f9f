/**
 * @file AuditErrors.hpp
 * @brief Exception hierarchy raised by the lexer, parser, linker and evaluator.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace scribeaudit::domain::rules {

/**
 * @struct SourcePosition
 * @brief Location inside block source text (1-based line and column).
 */
struct SourcePosition {
    std::size_t offset = 0;
    std::size_t line = 1;
    std::size_t column = 1;

    std::string ToString() const {
        return std::to_string(line) + ":" + std::to_string(column);
    }
};

/** @brief Base class of every engine error. */
class AuditError : public std::runtime_error {
public:
    explicit AuditError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class SyntaxError
 * @brief Lex or parse failure, always attributable to a source position.
 */
class SyntaxError : public AuditError {
public:
    SyntaxError(const SourcePosition& position, const std::string& message)
        : AuditError(position.ToString() + ": " + message), m_position(position) {}

    const SourcePosition& position() const { return m_position; }

private:
    SourcePosition m_position;
};

class LexError : public SyntaxError {
public:
    LexError(const SourcePosition& position, char unexpected)
        : SyntaxError(position, std::string("unexpected character '") + unexpected + "'"),
          m_unexpected(unexpected) {}

    char unexpected() const { return m_unexpected; }

private:
    char m_unexpected;
};

class ParseError : public SyntaxError {
public:
    ParseError(const SourcePosition& position, const std::string& expected, const std::string& found)
        : SyntaxError(position, "expected " + expected + ", found " + found),
          m_expected(expected), m_found(found) {}

    const std::string& expected() const { return m_expected; }
    const std::string& found() const { return m_found; }

private:
    std::string m_expected;
    std::string m_found;
};

/**
 * @struct LinkIssue
 * @brief One offending block reference (or duplicate definition) found while linking.
 */
struct LinkIssue {
    enum class Kind { MissingBlock, CycleDetected, DuplicateBlock };

    Kind kind;
    std::string blockId;          ///< Block containing the offending reference.
    std::string target;           ///< Referenced (or duplicated) block id.
    SourcePosition position;
    std::vector<std::string> cycle; ///< Block ids along the cycle, first id repeated at the end.

    std::string ToString() const;
};

inline std::string LinkIssueKindToString(LinkIssue::Kind kind) {
    switch (kind) {
        case LinkIssue::Kind::MissingBlock: return "missing-block";
        case LinkIssue::Kind::CycleDetected: return "cycle-detected";
        case LinkIssue::Kind::DuplicateBlock: return "duplicate-block";
        default: return "unknown";
    }
}

inline std::string LinkIssue::ToString() const {
    std::string text = blockId + " " + position.ToString() + ": " + LinkIssueKindToString(kind);
    if (kind == Kind::CycleDetected) {
        text += " (";
        for (std::size_t i = 0; i < cycle.size(); ++i) {
            if (i > 0) text += " -> ";
            text += cycle[i];
        }
        text += ")";
    } else {
        text += " '" + target + "'";
    }
    return text;
}

/**
 * @class LinkError
 * @brief Missing or cyclic block references, reported per offending reference.
 */
class LinkError : public AuditError {
public:
    explicit LinkError(std::vector<LinkIssue> issues)
        : AuditError(Describe(issues)), m_issues(std::move(issues)) {}

    const std::vector<LinkIssue>& issues() const { return m_issues; }

private:
    static std::string Describe(const std::vector<LinkIssue>& issues) {
        std::string text = "link failed";
        for (const auto& issue : issues) {
            text += "\n  " + issue.ToString();
        }
        return text;
    }

    std::vector<LinkIssue> m_issues;
};

/**
 * @class EvaluationError
 * @brief Integration misuse: evaluating a reference that was never linked.
 */
class EvaluationError : public AuditError {
public:
    explicit EvaluationError(const std::string& unresolvedBlock)
        : AuditError("unresolved block reference '" + unresolvedBlock + "'"),
          m_unresolvedBlock(unresolvedBlock) {}

    const std::string& unresolvedBlock() const { return m_unresolvedBlock; }

private:
    std::string m_unresolvedBlock;
};

} // namespace scribeaudit::domain::rules
