/**
 * @file BlockParser.cpp
 * @brief Implementation of BlockParser.
 */

#include "domain/rules/BlockParser.hpp"

#include <set>

#include "domain/rules/Lexer.hpp"

namespace scribeaudit::domain::rules {

namespace {

/**
 * Cursor over the token vector of one parse. Builds into a local RuleTree per
 * block, so nothing outside the session is touched until the parse succeeds.
 */
class ParseSession {
public:
    ParseSession(std::vector<Token> tokens, std::size_t maxDepth, std::string sourceId)
        : m_tokens(std::move(tokens)), m_maxDepth(maxDepth), m_sourceId(std::move(sourceId)) {}

    ParsedSource parseSource() {
        ParsedSource result;
        std::set<std::string> seenIds;

        if (at(TokenKind::EndOfInput)) fail("'block'");

        bool first = true;
        while (!at(TokenKind::EndOfInput)) {
            Block block = parseBlock();
            if (!seenIds.insert(block.id).second) {
                throw ParseError(block.position, "unique block id", "duplicate '" + block.id + "'");
            }
            if (first) {
                result.root = std::move(block);
                first = false;
            } else {
                result.subBlocks.push_back(std::move(block));
            }
        }
        return result;
    }

private:
    // --- Cursor ---

    const Token& cur(std::size_t ahead = 0) const {
        const std::size_t i = m_idx + ahead;
        return i < m_tokens.size() ? m_tokens[i] : m_tokens.back();
    }

    bool at(TokenKind kind) const { return cur().kind == kind; }
    bool atKeyword(const std::string& word) const { return cur().isKeyword(word); }
    bool atPunct(const std::string& p) const { return cur().isPunct(p); }

    const Token& advance() {
        const Token& t = cur();
        if (t.kind != TokenKind::EndOfInput) ++m_idx;
        return t;
    }

    [[noreturn]] void fail(const std::string& expected) const {
        throw ParseError(cur().position, expected, cur().Describe());
    }

    const Token& expectKeyword(const std::string& word) {
        if (!atKeyword(word)) fail("'" + word + "'");
        return advance();
    }

    const Token& expectPunct(const std::string& p) {
        if (!atPunct(p)) fail("'" + p + "'");
        return advance();
    }

    const Token& expect(TokenKind kind, const std::string& what) {
        if (!at(kind)) fail(what);
        return advance();
    }

    bool acceptPunct(const std::string& p) {
        if (!atPunct(p)) return false;
        advance();
        return true;
    }

    static bool IsUnitWord(const Token& t, const char* plural, const char* singular) {
        return (t.kind == TokenKind::Keyword || t.kind == TokenKind::Identifier) &&
               (t.text == plural || t.text == singular);
    }

    // --- Numbers ---

    std::size_t parseCount(const std::string& what) {
        const Token& t = expect(TokenKind::Number, what);
        if (t.text.find('.') != std::string::npos) {
            throw ParseError(t.position, "whole number", t.Describe());
        }
        if (t.text.size() > 6) {
            throw ParseError(t.position, "number below 1000000", t.Describe());
        }
        return static_cast<std::size_t>(std::stoul(t.text));
    }

    Credits parseCredits(const std::string& what) {
        const Token& t = expect(TokenKind::Number, what);
        auto credits = Credits::Parse(t.text);
        if (!credits) {
            throw ParseError(t.position, "number with at most two decimals", t.Describe());
        }
        return *credits;
    }

    /** NUMBER '-' 'of' starts an N-of group rather than a course number or range. */
    bool atNOfHeader() const {
        return at(TokenKind::Number) && cur(1).isPunct("-") && cur(2).isKeyword("of");
    }

    // --- Blocks ---

    Block parseBlock() {
        Block block;
        block.position = expectKeyword("block").position;
        block.id = expect(TokenKind::Identifier, "block id").text;
        block.title = block.id;
        block.sourceId = m_sourceId;

        if (at(TokenKind::String)) {
            block.title = advance().text;
        }
        if (at(TokenKind::Keyword)) {
            if (auto type = BlockTypeFromString(cur().text)) {
                block.type = *type;
                advance();
            }
        }

        m_tree = RuleTree();
        m_depth = 0;
        const NodeId root = parseRule();
        m_tree.setRoot(root);
        block.rules = std::move(m_tree);
        return block;
    }

    // --- Rules ---

    NodeId parseRule() {
        if (++m_depth > m_maxDepth) {
            throw ParseError(cur().position, "nesting depth of at most " + std::to_string(m_maxDepth),
                             "deeper nesting");
        }

        std::string label;
        if (atKeyword("label")) {
            advance();
            label = expect(TokenKind::String, "label text").text;
        }

        RuleNode node;
        node.position = cur().position;
        node.label = std::move(label);

        if (atKeyword("all-of") || atKeyword("any-of") || atNOfHeader()) {
            node.body = parseGroup();
        } else if (atKeyword("courses")) {
            node.body = parseCourseSet();
        } else if (atKeyword("maximum")) {
            node.body = parseMaximum();
        } else if (atKeyword("if")) {
            node.body = parseConditional();
        } else if (atKeyword("block-ref")) {
            node.body = parseBlockReference();
        } else {
            fail("rule ('all-of', 'any-of', 'N-of', 'courses', 'maximum', 'if' or 'block-ref')");
        }

        --m_depth;
        return m_tree.add(std::move(node));
    }

    GroupRule parseGroup() {
        GroupRule group;
        const Token header = cur();
        std::size_t required = 0;

        if (atKeyword("all-of")) {
            advance();
            group.mode = GroupMode::All;
        } else if (atKeyword("any-of")) {
            advance();
            group.mode = GroupMode::Any;
        } else {
            group.mode = GroupMode::NOf;
            required = parseCount("group size");
            expectPunct("-");
            expectKeyword("of");
        }

        expectPunct("{");
        while (!atPunct("}")) {
            if (at(TokenKind::EndOfInput)) fail("'}'");
            group.children.push_back(parseRule());
            acceptPunct(";");
        }
        if (group.children.empty()) fail("rule");
        advance(); // '}'

        switch (group.mode) {
            case GroupMode::All: group.required = group.children.size(); break;
            case GroupMode::Any: group.required = 1; break;
            case GroupMode::NOf:
                if (required == 0 || required > group.children.size()) {
                    throw ParseError(header.position,
                                     "between 1 and " + std::to_string(group.children.size()) + " required children",
                                     std::to_string(required));
                }
                group.required = required;
                break;
        }
        return group;
    }

    CoursePattern parsePattern() {
        const Token& t = cur();
        if (t.kind != TokenKind::Identifier && t.kind != TokenKind::Pattern) {
            fail("course pattern");
        }
        const std::string subject = advance().text;

        if (!at(TokenKind::Number) || atNOfHeader()) {
            return CoursePattern::Subject(subject);
        }
        const Token lowToken = cur();
        const int low = static_cast<int>(parseCount("course number"));
        if (!atPunct("-")) {
            return CoursePattern::Exact(subject, low);
        }
        advance();
        const int high = static_cast<int>(parseCount("upper course number"));
        if (high < low) {
            throw ParseError(lowToken.position, "ascending number range",
                             std::to_string(low) + "-" + std::to_string(high));
        }
        return CoursePattern::Range(subject, low, high);
    }

    std::vector<CoursePattern> parsePatternList() {
        std::vector<CoursePattern> patterns;
        patterns.push_back(parsePattern());
        while (acceptPunct(",")) {
            patterns.push_back(parsePattern());
        }
        return patterns;
    }

    CourseSetRule parseCourseSet() {
        expectKeyword("courses");
        CourseSetRule set;
        set.patterns = parsePatternList();

        bool sawCount = false;
        bool sawCredits = false;
        while (true) {
            if (atKeyword("min")) {
                const Token clause = advance();
                if (!at(TokenKind::Number)) fail("minimum amount");
                if (atWordAfterNumber("courses", "course")) {
                    if (sawCount) throw ParseError(clause.position, "single 'min N courses' clause", "duplicate");
                    set.minCount = parseCount("course count");
                    advance();
                    sawCount = true;
                } else if (atWordAfterNumber("credits", "credit")) {
                    if (sawCredits) throw ParseError(clause.position, "single 'min N credits' clause", "duplicate");
                    set.minCredits = parseCredits("credit amount");
                    advance();
                    sawCredits = true;
                } else {
                    throw ParseError(cur(1).position, "'courses' or 'credits'", cur(1).Describe());
                }
            } else if (atKeyword("grade")) {
                advance();
                expectKeyword("at-least");
                const Token& g = expect(TokenKind::Identifier, "letter grade");
                auto grade = GradeFromString(g.text);
                if (!grade || !IsLetterGrade(*grade) || g.text.size() != 1) {
                    throw ParseError(g.position, "letter grade A, B, C, D or F", g.Describe());
                }
                set.gradeFloor = grade;
            } else if (atKeyword("except")) {
                advance();
                auto excluded = parsePatternList();
                set.excluded.insert(set.excluded.end(), excluded.begin(), excluded.end());
            } else {
                break;
            }
        }

        if (!sawCount && !sawCredits) set.minCount = 1;
        return set;
    }

    /** Looks past the current NUMBER token at the unit word that follows it. */
    bool atWordAfterNumber(const char* plural, const char* singular) const {
        return IsUnitWord(cur(1), plural, singular);
    }

    MaximumRule parseMaximum() {
        expectKeyword("maximum");
        MaximumRule max;
        if (!at(TokenKind::Number)) fail("maximum amount");
        if (atWordAfterNumber("courses", "course")) {
            max.unit = LimitUnit::Courses;
            max.maxCount = parseCount("course count");
        } else if (atWordAfterNumber("credits", "credit")) {
            max.unit = LimitUnit::Credits;
            max.maxCredits = parseCredits("credit amount");
        } else {
            throw ParseError(cur(1).position, "'courses' or 'credits'", cur(1).Describe());
        }
        advance(); // unit word
        max.child = parseRule();
        return max;
    }

    ConditionalRule parseConditional() {
        expectKeyword("if");
        ConditionalRule cond;
        cond.predicate = parsePredicate();
        expectKeyword("then");
        cond.thenBranch = parseRule();
        expectKeyword("else");
        cond.elseBranch = parseRule();
        return cond;
    }

    BlockReferenceRule parseBlockReference() {
        expectKeyword("block-ref");
        BlockReferenceRule ref;
        ref.blockId = expect(TokenKind::Identifier, "block id").text;
        if (atKeyword("shared")) {
            advance();
            ref.policy = SharePolicy::Shared;
        } else if (atKeyword("exclusive")) {
            advance();
            ref.policy = SharePolicy::Exclusive;
        }
        return ref;
    }

    // --- Predicates ---

    Predicate parsePredicate() {
        Predicate left = parseAnd();
        if (!atKeyword("or")) return left;

        Predicate orNode;
        orNode.op = Predicate::Op::Or;
        orNode.operands.push_back(std::move(left));
        while (atKeyword("or")) {
            advance();
            orNode.operands.push_back(parseAnd());
        }
        return orNode;
    }

    Predicate parseAnd() {
        Predicate left = parseNot();
        if (!atKeyword("and")) return left;

        Predicate andNode;
        andNode.op = Predicate::Op::And;
        andNode.operands.push_back(std::move(left));
        while (atKeyword("and")) {
            advance();
            andNode.operands.push_back(parseNot());
        }
        return andNode;
    }

    Predicate parseNot() {
        if (++m_depth > m_maxDepth) {
            throw ParseError(cur().position, "nesting depth of at most " + std::to_string(m_maxDepth),
                             "deeper nesting");
        }
        Predicate result;
        if (atKeyword("not")) {
            advance();
            result.op = Predicate::Op::Not;
            result.operands.push_back(parseNot());
        } else if (atPunct("(")) {
            advance();
            result = parsePredicate();
            expectPunct(")");
        } else {
            result = parseComparison();
        }
        --m_depth;
        return result;
    }

    Predicate parseComparison() {
        Predicate cmp;
        cmp.op = Predicate::Op::Compare;

        if (atKeyword("total-credits")) {
            advance();
            cmp.aggregate.kind = Aggregate::Kind::TotalCredits;
        } else if (atKeyword("gpa")) {
            advance();
            cmp.aggregate.kind = Aggregate::Kind::Gpa;
        } else if (atKeyword("count-of") || atKeyword("credits-of")) {
            cmp.aggregate.kind = atKeyword("count-of") ? Aggregate::Kind::CountOf : Aggregate::Kind::CreditsOf;
            advance();
            expectPunct("(");
            cmp.aggregate.patterns = parsePatternList();
            expectPunct(")");
        } else {
            fail("aggregate ('total-credits', 'gpa', 'count-of' or 'credits-of')");
        }

        const Token& op = expect(TokenKind::Comparison, "comparison operator");
        if (op.text == "<") cmp.comparison = Comparison::Less;
        else if (op.text == "<=") cmp.comparison = Comparison::LessEqual;
        else if (op.text == ">") cmp.comparison = Comparison::Greater;
        else if (op.text == ">=") cmp.comparison = Comparison::GreaterEqual;
        else if (op.text == "=") cmp.comparison = Comparison::Equal;
        else cmp.comparison = Comparison::NotEqual;

        cmp.thresholdHundredths = parseCredits("threshold").hundredths;
        return cmp;
    }

    std::vector<Token> m_tokens;
    std::size_t m_idx = 0;
    std::size_t m_maxDepth;
    std::size_t m_depth = 0;
    std::string m_sourceId;
    RuleTree m_tree;
};

} // namespace

ParsedSource BlockParser::Parse(const std::string& source, const std::string& sourceId) const {
    ParseSession session(Lexer::Tokenize(source), m_options.maxNestingDepth, sourceId);
    return session.parseSource();
}

} // namespace scribeaudit::domain::rules
