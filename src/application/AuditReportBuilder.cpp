#include "application/AuditReportBuilder.hpp"

#include <set>

namespace scribeaudit::application {

using namespace scribeaudit::domain::audit;
using scribeaudit::domain::rules::RuleKind;

namespace {

void CollectApplied(const RuleVerdict& verdict, std::set<std::size_t>& out) {
    for (const auto& course : verdict.applied) out.insert(course.transcriptIndex);
    for (const auto& child : verdict.children) CollectApplied(child, out);
}

} // namespace

void AuditReportBuilder::CollectShortfalls(const std::string& blockId,
                                           const RuleVerdict& verdict,
                                           std::vector<ShortfallLine>& out) {
    if (verdict.satisfied) return;

    if (verdict.kind == RuleKind::CourseSet || verdict.kind == RuleKind::Group ||
        verdict.kind == RuleKind::BlockReference) {
        ShortfallLine line;
        line.blockId = blockId;
        line.node = verdict.node;
        line.label = verdict.label.empty() ? verdict.description : verdict.label;
        line.text = verdict.shortfall;
        out.push_back(std::move(line));
    }

    // Exclusive references carry the referenced block's verdict; its shortfalls belong to that block.
    if (verdict.kind == RuleKind::BlockReference) return;

    for (const auto& child : verdict.children) {
        CollectShortfalls(blockId, child, out);
    }
}

AuditReport AuditReportBuilder::Build(const Evaluator& run, const std::vector<BlockAuditResult>& results) {
    AuditReport report;
    report.studentId = run.transcript().studentId;
    report.blocks = results;

    for (const auto& result : results) {
        if (result.satisfied) {
            report.satisfiedBlocks.push_back(result.blockId);
        } else {
            report.unsatisfiedBlocks.push_back(result.blockId);
            CollectShortfalls(result.blockId, result.root, report.shortfalls);
        }
    }
    report.satisfied = report.unsatisfiedBlocks.empty();

    std::set<std::size_t> applied;
    for (const auto& result : results) {
        CollectApplied(result.root, applied);
    }
    for (std::size_t index : run.state().unconsumed()) {
        if (applied.count(index) == 0) {
            report.unusedCourses.push_back(run.describeCourse(index));
        }
    }

    report.totals.courseCount = run.transcript().courses.size();
    report.totals.earnedCredits = run.aggregates().earnedCredits();
    report.totals.gpaHundredths = run.aggregates().gpaHundredths();
    return report;
}

} // namespace scribeaudit::application
