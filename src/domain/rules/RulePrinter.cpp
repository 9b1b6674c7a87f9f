/**
 * @file RulePrinter.cpp
 * @brief Implementation of RulePrinter.
 */

#include "domain/rules/RulePrinter.hpp"

#include <sstream>

namespace scribeaudit::domain::rules {

namespace {

std::string Quote(const std::string& text) {
    std::string out = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\') out.push_back('\\');
        if (c == '\n') {
            out += "\\n";
            continue;
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string Pad(int indent) {
    return std::string(static_cast<std::size_t>(indent) * 2, ' ');
}

} // namespace

std::string RulePrinter::PrintRule(const RuleTree& tree, NodeId id, int indent) {
    const RuleNode& node = tree.node(id);
    std::ostringstream out;
    if (!node.label.empty()) out << "label " << Quote(node.label) << " ";

    switch (node.kind()) {
        case RuleKind::CourseSet: {
            const auto& cs = std::get<CourseSetRule>(node.body);
            out << "courses " << PatternsToString(cs.patterns);
            if (cs.minCount > 0) out << " min " << cs.minCount << " courses";
            if (!cs.minCredits.isZero()) out << " min " << cs.minCredits.ToString() << " credits";
            if (cs.minCount == 0 && cs.minCredits.isZero()) out << " min 0 courses";
            if (cs.gradeFloor) out << " grade at-least " << GradeToString(*cs.gradeFloor);
            if (!cs.excluded.empty()) out << " except " << PatternsToString(cs.excluded);
            break;
        }
        case RuleKind::Group: {
            const auto& g = std::get<GroupRule>(node.body);
            if (g.mode == GroupMode::All) out << "all-of {\n";
            else if (g.mode == GroupMode::Any) out << "any-of {\n";
            else out << g.required << "-of {\n";
            for (NodeId child : g.children) {
                out << Pad(indent + 1) << PrintRule(tree, child, indent + 1) << ";\n";
            }
            out << Pad(indent) << "}";
            break;
        }
        case RuleKind::Maximum: {
            const auto& m = std::get<MaximumRule>(node.body);
            if (m.unit == LimitUnit::Courses) out << "maximum " << m.maxCount << " courses ";
            else out << "maximum " << m.maxCredits.ToString() << " credits ";
            out << PrintRule(tree, m.child, indent);
            break;
        }
        case RuleKind::Conditional: {
            const auto& c = std::get<ConditionalRule>(node.body);
            out << "if " << PredicateToString(c.predicate) << " then\n"
                << Pad(indent + 1) << PrintRule(tree, c.thenBranch, indent + 1);
            out << "\n" << Pad(indent) << "else\n"
                << Pad(indent + 1) << PrintRule(tree, c.elseBranch, indent + 1);
            break;
        }
        case RuleKind::BlockReference: {
            const auto& r = std::get<BlockReferenceRule>(node.body);
            out << "block-ref " << r.blockId << " " << SharePolicyToString(r.policy);
            break;
        }
    }
    return out.str();
}

std::string RulePrinter::PrintBlock(const Block& block) {
    std::ostringstream out;
    out << "block " << block.id << " " << Quote(block.title) << " " << BlockTypeToString(block.type) << "\n"
        << Pad(1) << PrintRule(block.rules, block.rules.root(), 1) << "\n";
    return out.str();
}

std::string RulePrinter::PrintBlocks(const std::vector<Block>& blocks) {
    std::string out;
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        if (i > 0) out += "\n";
        out += PrintBlock(blocks[i]);
    }
    return out;
}

} // namespace scribeaudit::domain::rules
