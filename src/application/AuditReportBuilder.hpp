/**
 * @file AuditReportBuilder.hpp
 * @brief Aggregates per-block results of one audit run into an AuditReport.
 */

#pragma once

#include <vector>

#include "domain/audit/AuditReport.hpp"
#include "domain/audit/Evaluator.hpp"

namespace scribeaudit::application {

class AuditReportBuilder {
public:
    /**
     * @brief Builds the report for a finished run.
     * @param run Evaluator that produced the results; supplies the transcript and final pool.
     * @param results Block results in the order they were requested.
     */
    static domain::audit::AuditReport Build(const domain::audit::Evaluator& run,
                                            const std::vector<domain::audit::BlockAuditResult>& results);

    /**
     * @brief Shortfall lines for every unmet node under an unmet verdict.
     *
     * Maximum and conditional nodes repeat their child's shortfall, so only
     * course sets, groups and block references produce lines.
     */
    static void CollectShortfalls(const std::string& blockId,
                                  const domain::audit::RuleVerdict& verdict,
                                  std::vector<domain::audit::ShortfallLine>& out);
};

} // namespace scribeaudit::application
