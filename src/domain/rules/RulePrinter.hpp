/**
 * @file RulePrinter.hpp
 * @brief Renders rule trees back to block source text.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/Block.hpp"

namespace scribeaudit::domain::rules {

/**
 * @class RulePrinter
 * @brief Pretty-printer whose output parses back to a structurally equal tree.
 */
class RulePrinter {
public:
    static std::string PrintBlock(const Block& block);
    static std::string PrintBlocks(const std::vector<Block>& blocks);
    static std::string PrintRule(const RuleTree& tree, NodeId id, int indent = 0);
};

} // namespace scribeaudit::domain::rules
