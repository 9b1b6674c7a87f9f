/**
 * @file Rule.hpp
 * @brief Rule AST: tagged rule nodes stored in an arena and addressed by NodeId.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "domain/Course.hpp"
#include "domain/rules/AuditErrors.hpp"
#include "domain/rules/CoursePattern.hpp"

namespace scribeaudit::domain::rules {

using NodeId = std::size_t;

enum class RuleKind { CourseSet, Group, Maximum, Conditional, BlockReference };
enum class GroupMode { All, Any, NOf };
enum class SharePolicy { Exclusive, Shared };
enum class LimitUnit { Courses, Credits };

inline std::string RuleKindToString(RuleKind kind) {
    switch (kind) {
        case RuleKind::CourseSet: return "course-set";
        case RuleKind::Group: return "group";
        case RuleKind::Maximum: return "maximum";
        case RuleKind::Conditional: return "conditional";
        case RuleKind::BlockReference: return "block-reference";
        default: return "unknown";
    }
}

inline std::string SharePolicyToString(SharePolicy policy) {
    return policy == SharePolicy::Shared ? "shared" : "exclusive";
}

/**
 * @struct CourseSetRule
 * @brief Leaf: courses matching any pattern (and no exclusion) until both minimums hold.
 */
struct CourseSetRule {
    std::vector<CoursePattern> patterns;
    std::vector<CoursePattern> excluded;
    std::size_t minCount = 0;
    Credits minCredits;
    std::optional<Grade> gradeFloor;
};

struct GroupRule {
    GroupMode mode = GroupMode::All;
    std::size_t required = 0; ///< k for N_OF; 1 for ANY; children.size() for ALL.
    std::vector<NodeId> children;
};

struct MaximumRule {
    LimitUnit unit = LimitUnit::Credits;
    std::size_t maxCount = 0;
    Credits maxCredits;
    NodeId child = 0;
};

/**
 * @struct Aggregate
 * @brief Transcript-wide quantity a predicate compares against.
 */
struct Aggregate {
    enum class Kind { TotalCredits, Gpa, CountOf, CreditsOf };
    Kind kind = Kind::TotalCredits;
    std::vector<CoursePattern> patterns; ///< Only for CountOf / CreditsOf.
};

enum class Comparison { Less, LessEqual, Greater, GreaterEqual, Equal, NotEqual };

inline std::string ComparisonToString(Comparison cmp) {
    switch (cmp) {
        case Comparison::Less: return "<";
        case Comparison::LessEqual: return "<=";
        case Comparison::Greater: return ">";
        case Comparison::GreaterEqual: return ">=";
        case Comparison::Equal: return "=";
        case Comparison::NotEqual: return "!=";
        default: return "?";
    }
}

/**
 * @struct Predicate
 * @brief Boolean expression over transcript aggregates.
 */
struct Predicate {
    enum class Op { And, Or, Not, Compare };

    Op op = Op::Compare;
    std::vector<Predicate> operands; ///< And/Or: two or more, Not: exactly one.
    Aggregate aggregate;
    Comparison comparison = Comparison::GreaterEqual;
    std::int64_t thresholdHundredths = 0; ///< Threshold in hundredths ("2.5" -> 250).
};

struct ConditionalRule {
    Predicate predicate;
    NodeId thenBranch = 0;
    NodeId elseBranch = 0;
};

struct BlockReferenceRule {
    std::string blockId;
    SharePolicy policy = SharePolicy::Exclusive;
};

using RuleBody = std::variant<CourseSetRule, GroupRule, MaximumRule, ConditionalRule, BlockReferenceRule>;

struct RuleNode {
    NodeId id = 0;
    SourcePosition position;
    std::string label; ///< Optional display label from a 'label' clause.
    RuleBody body;

    RuleKind kind() const { return static_cast<RuleKind>(body.index()); }
};

/**
 * @class RuleTree
 * @brief Arena of rule nodes for one block. Immutable once a parse completes.
 */
class RuleTree {
public:
    NodeId add(RuleNode node) {
        node.id = m_nodes.size();
        m_nodes.push_back(std::move(node));
        return m_nodes.back().id;
    }

    const RuleNode& node(NodeId id) const { return m_nodes.at(id); }
    const std::vector<RuleNode>& nodes() const { return m_nodes; }
    std::size_t size() const { return m_nodes.size(); }

    NodeId root() const { return m_root; }
    void setRoot(NodeId id) { m_root = id; }

private:
    std::vector<RuleNode> m_nodes;
    NodeId m_root = 0;
};

/**
 * @brief Compares two rule subtrees ignoring node ids and source positions.
 */
bool StructurallyEqual(const RuleTree& a, NodeId aNode, const RuleTree& b, NodeId bNode);

bool StructurallyEqual(const Predicate& a, const Predicate& b);

/** @brief One-line summary of a node, e.g. "MATH 100-199", "2 of 3", "block CORE (shared)". */
std::string DescribeNode(const RuleTree& tree, NodeId id);

/** @brief Source form of a predicate, e.g. "total-credits >= 60 and gpa >= 2". */
std::string PredicateToString(const Predicate& predicate);

/** @brief Fixed-point hundredths as decimal text without trailing zeros. */
std::string HundredthsToString(std::int64_t hundredths);

} // namespace scribeaudit::domain::rules
