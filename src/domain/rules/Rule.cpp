/**
 * @file Rule.cpp
 * @brief Structural comparison and descriptions of rule nodes.
 */

#include "domain/rules/Rule.hpp"

namespace scribeaudit::domain::rules {

namespace {

bool SamePatterns(const std::vector<CoursePattern>& a, const std::vector<CoursePattern>& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i] != b[i]) return false;
    }
    return true;
}

std::string AggregateToString(const Aggregate& aggregate) {
    switch (aggregate.kind) {
        case Aggregate::Kind::TotalCredits: return "total-credits";
        case Aggregate::Kind::Gpa: return "gpa";
        case Aggregate::Kind::CountOf: return "count-of(" + PatternsToString(aggregate.patterns) + ")";
        case Aggregate::Kind::CreditsOf: return "credits-of(" + PatternsToString(aggregate.patterns) + ")";
        default: return "?";
    }
}

std::string OperandToString(const Predicate& operand) {
    if (operand.op == Predicate::Op::And || operand.op == Predicate::Op::Or) {
        return "(" + PredicateToString(operand) + ")";
    }
    return PredicateToString(operand);
}

} // namespace

std::string HundredthsToString(std::int64_t hundredths) {
    return Credits::FromHundredths(hundredths).ToString();
}

bool StructurallyEqual(const Predicate& a, const Predicate& b) {
    if (a.op != b.op) return false;
    if (a.op == Predicate::Op::Compare) {
        return a.aggregate.kind == b.aggregate.kind &&
               SamePatterns(a.aggregate.patterns, b.aggregate.patterns) &&
               a.comparison == b.comparison &&
               a.thresholdHundredths == b.thresholdHundredths;
    }
    if (a.operands.size() != b.operands.size()) return false;
    for (std::size_t i = 0; i < a.operands.size(); ++i) {
        if (!StructurallyEqual(a.operands[i], b.operands[i])) return false;
    }
    return true;
}

bool StructurallyEqual(const RuleTree& a, NodeId aNode, const RuleTree& b, NodeId bNode) {
    const RuleNode& na = a.node(aNode);
    const RuleNode& nb = b.node(bNode);
    if (na.kind() != nb.kind() || na.label != nb.label) return false;

    switch (na.kind()) {
        case RuleKind::CourseSet: {
            const auto& x = std::get<CourseSetRule>(na.body);
            const auto& y = std::get<CourseSetRule>(nb.body);
            return SamePatterns(x.patterns, y.patterns) && SamePatterns(x.excluded, y.excluded) &&
                   x.minCount == y.minCount && x.minCredits == y.minCredits &&
                   x.gradeFloor == y.gradeFloor;
        }
        case RuleKind::Group: {
            const auto& x = std::get<GroupRule>(na.body);
            const auto& y = std::get<GroupRule>(nb.body);
            if (x.mode != y.mode || x.required != y.required || x.children.size() != y.children.size()) {
                return false;
            }
            for (std::size_t i = 0; i < x.children.size(); ++i) {
                if (!StructurallyEqual(a, x.children[i], b, y.children[i])) return false;
            }
            return true;
        }
        case RuleKind::Maximum: {
            const auto& x = std::get<MaximumRule>(na.body);
            const auto& y = std::get<MaximumRule>(nb.body);
            return x.unit == y.unit && x.maxCount == y.maxCount && x.maxCredits == y.maxCredits &&
                   StructurallyEqual(a, x.child, b, y.child);
        }
        case RuleKind::Conditional: {
            const auto& x = std::get<ConditionalRule>(na.body);
            const auto& y = std::get<ConditionalRule>(nb.body);
            if (!StructurallyEqual(x.predicate, y.predicate)) return false;
            return StructurallyEqual(a, x.thenBranch, b, y.thenBranch) &&
                   StructurallyEqual(a, x.elseBranch, b, y.elseBranch);
        }
        case RuleKind::BlockReference: {
            const auto& x = std::get<BlockReferenceRule>(na.body);
            const auto& y = std::get<BlockReferenceRule>(nb.body);
            return x.blockId == y.blockId && x.policy == y.policy;
        }
    }
    return false;
}

std::string PredicateToString(const Predicate& predicate) {
    switch (predicate.op) {
        case Predicate::Op::Compare:
            return AggregateToString(predicate.aggregate) + " " + ComparisonToString(predicate.comparison) +
                   " " + HundredthsToString(predicate.thresholdHundredths);
        case Predicate::Op::Not:
            return "not " + OperandToString(predicate.operands.at(0));
        case Predicate::Op::And:
        case Predicate::Op::Or: {
            const std::string joiner = predicate.op == Predicate::Op::And ? " and " : " or ";
            std::string out;
            for (std::size_t i = 0; i < predicate.operands.size(); ++i) {
                if (i > 0) out += joiner;
                out += OperandToString(predicate.operands[i]);
            }
            return out;
        }
    }
    return {};
}

std::string DescribeNode(const RuleTree& tree, NodeId id) {
    const RuleNode& n = tree.node(id);
    switch (n.kind()) {
        case RuleKind::CourseSet: {
            const auto& cs = std::get<CourseSetRule>(n.body);
            std::string text = PatternsToString(cs.patterns);
            if (!cs.excluded.empty()) text += " except " + PatternsToString(cs.excluded);
            return text;
        }
        case RuleKind::Group: {
            const auto& g = std::get<GroupRule>(n.body);
            const std::string count = std::to_string(g.children.size());
            if (g.mode == GroupMode::All) return "all of " + count;
            if (g.mode == GroupMode::Any) return "any of " + count;
            return std::to_string(g.required) + " of " + count;
        }
        case RuleKind::Maximum: {
            const auto& m = std::get<MaximumRule>(n.body);
            if (m.unit == LimitUnit::Courses) return "maximum " + std::to_string(m.maxCount) + " courses";
            return "maximum " + m.maxCredits.ToString() + " credits";
        }
        case RuleKind::Conditional:
            return "if " + PredicateToString(std::get<ConditionalRule>(n.body).predicate);
        case RuleKind::BlockReference: {
            const auto& r = std::get<BlockReferenceRule>(n.body);
            return "block " + r.blockId + " (" + SharePolicyToString(r.policy) + ")";
        }
    }
    return {};
}

} // namespace scribeaudit::domain::rules
