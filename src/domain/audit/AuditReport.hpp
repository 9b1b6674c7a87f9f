/**
 * @file AuditReport.hpp
 * @brief Final audit outcome for one student across the requested blocks.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "domain/audit/AuditResult.hpp"

namespace scribeaudit::domain::audit {

/**
 * @struct ShortfallLine
 * @brief What remains for one unmet rule node.
 */
struct ShortfallLine {
    std::string blockId;
    rules::NodeId node = 0;
    std::string label;       ///< Node label, or its description when unlabelled.
    std::string text;        ///< e.g. "needs 2 more credits from CHEM 100-299".
};

struct TranscriptTotals {
    std::size_t courseCount = 0;
    Credits earnedCredits;
    std::int64_t gpaHundredths = 0; ///< GPA rounded to two decimals.
};

struct AuditReport {
    std::string studentId;
    bool satisfied = false;                    ///< Every requested block satisfied.
    std::vector<std::string> satisfiedBlocks;
    std::vector<std::string> unsatisfiedBlocks;
    std::vector<ShortfallLine> shortfalls;
    std::vector<AppliedCourse> unusedCourses;  ///< Never applied to anything, shared or not.
    std::vector<BlockAuditResult> blocks;
    TranscriptTotals totals;
};

} // namespace scribeaudit::domain::audit
