/**
 * @file AuditResult.hpp
 * @brief Immutable evaluator output: per-node verdicts and per-block results.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "domain/Block.hpp"
#include "domain/Course.hpp"
#include "domain/rules/Rule.hpp"

namespace scribeaudit::domain::audit {

/**
 * @struct AppliedCourse
 * @brief A transcript entry as it appears in a verdict.
 */
struct AppliedCourse {
    std::size_t transcriptIndex = 0;
    CourseKey key;
    std::string displayName;
    Credits credits;
    Grade grade = Grade::A;
    bool repeated = false;
    bool shared = false; ///< Reached through a shared block reference; not consumed by this run.
};

/**
 * @struct RuleVerdict
 * @brief Outcome of one rule node. Mirrors the rule tree it was produced from.
 */
struct RuleVerdict {
    rules::NodeId node = 0;
    rules::RuleKind kind = rules::RuleKind::CourseSet;
    std::string description;
    std::string label;

    bool satisfied = false;
    bool counted = true;               ///< False for group children beyond the k that count.

    std::vector<AppliedCourse> applied; ///< Every course applied in this subtree.
    std::size_t appliedCount = 0;
    Credits appliedCredits;

    std::string shortfall;             ///< Empty when satisfied.
    std::vector<RuleVerdict> children;

    std::optional<bool> branchTaken;   ///< Conditional only: true for 'then'.
    std::string referencedBlock;       ///< Block reference only.
    bool memoized = false;             ///< Block reference resolved from an earlier evaluation in the run.
};

/**
 * @struct BlockAuditResult
 * @brief Verdict for one block plus the pool left after evaluating it.
 */
struct BlockAuditResult {
    std::string blockId;
    std::string title;
    BlockType type = BlockType::Other;
    bool satisfied = false;
    RuleVerdict root;
    std::vector<AppliedCourse> unconsumed;
};

} // namespace scribeaudit::domain::audit
