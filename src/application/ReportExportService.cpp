#include "application/ReportExportService.hpp"

#include <sstream>

#include "domain/rules/Rule.hpp"

namespace scribeaudit::application {

using namespace scribeaudit::domain::audit;
using scribeaudit::domain::Credits;

namespace {

double CreditsValue(Credits credits) {
    return static_cast<double>(credits.hundredths) / 100.0;
}

nlohmann::json CourseToJson(const AppliedCourse& course) {
    nlohmann::json j;
    j["subject"] = course.key.subject;
    j["number"] = course.key.number;
    j["term"] = course.key.term;
    j["credits"] = CreditsValue(course.credits);
    j["grade"] = domain::GradeToString(course.grade);
    j["display"] = course.displayName;
    if (course.repeated) j["repeat"] = true;
    if (course.shared) j["shared"] = true;
    return j;
}

nlohmann::json CoursesToJson(const std::vector<AppliedCourse>& courses) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& course : courses) list.push_back(CourseToJson(course));
    return list;
}

std::string Escape(const std::string& cell) {
    std::string out;
    for (char c : cell) {
        if (c == '|') out += "\\|";
        else if (c == '\n') out += ' ';
        else out += c;
    }
    return out;
}

void WriteVerdictTree(std::stringstream& ss, const RuleVerdict& verdict, int depth) {
    ss << std::string(static_cast<std::size_t>(depth) * 2, ' ') << "- "
       << (verdict.satisfied ? "[x] " : "[ ] ");
    if (!verdict.label.empty()) ss << "**" << verdict.label << "** ";
    ss << verdict.description;
    if (!verdict.counted) ss << " _(not counted)_";
    if (verdict.branchTaken) ss << (*verdict.branchTaken ? " -> then" : " -> else");
    if (verdict.memoized) ss << " _(evaluated earlier)_";

    if (verdict.kind == domain::rules::RuleKind::CourseSet && !verdict.applied.empty()) {
        ss << ": ";
        for (std::size_t i = 0; i < verdict.applied.size(); ++i) {
            if (i > 0) ss << ", ";
            ss << verdict.applied[i].displayName;
            if (verdict.applied[i].shared) ss << " (shared)";
        }
    }
    if (!verdict.satisfied && !verdict.shortfall.empty()) ss << " (" << verdict.shortfall << ")";
    ss << "\n";

    for (const auto& child : verdict.children) {
        WriteVerdictTree(ss, child, depth + 1);
    }
}

} // namespace

nlohmann::json ReportExportService::VerdictToJson(const RuleVerdict& verdict) {
    nlohmann::json j;
    j["node"] = verdict.node;
    j["kind"] = domain::rules::RuleKindToString(verdict.kind);
    j["description"] = verdict.description;
    j["label"] = verdict.label;
    j["satisfied"] = verdict.satisfied;
    j["counted"] = verdict.counted;
    j["applied"] = CoursesToJson(verdict.applied);
    j["appliedCount"] = verdict.appliedCount;
    j["appliedCredits"] = CreditsValue(verdict.appliedCredits);
    j["shortfall"] = verdict.shortfall;
    if (verdict.branchTaken) j["branch"] = *verdict.branchTaken ? "then" : "else";
    if (!verdict.referencedBlock.empty()) j["block"] = verdict.referencedBlock;
    if (verdict.memoized) j["memoized"] = true;

    nlohmann::json children = nlohmann::json::array();
    for (const auto& child : verdict.children) children.push_back(VerdictToJson(child));
    j["children"] = children;
    return j;
}

nlohmann::json ReportExportService::ToJson(const AuditReport& report) {
    nlohmann::json j;
    j["studentId"] = report.studentId;
    j["satisfied"] = report.satisfied;
    j["satisfiedBlocks"] = report.satisfiedBlocks;
    j["unsatisfiedBlocks"] = report.unsatisfiedBlocks;

    nlohmann::json shortfalls = nlohmann::json::array();
    for (const auto& line : report.shortfalls) {
        shortfalls.push_back({{"block", line.blockId}, {"node", line.node}, {"label", line.label}, {"text", line.text}});
    }
    j["shortfalls"] = shortfalls;
    j["unusedCourses"] = CoursesToJson(report.unusedCourses);

    nlohmann::json blocks = nlohmann::json::array();
    for (const auto& block : report.blocks) {
        nlohmann::json b;
        b["id"] = block.blockId;
        b["title"] = block.title;
        b["type"] = domain::BlockTypeToString(block.type);
        b["satisfied"] = block.satisfied;
        b["root"] = VerdictToJson(block.root);
        b["unconsumed"] = CoursesToJson(block.unconsumed);
        blocks.push_back(b);
    }
    j["blocks"] = blocks;

    j["totals"] = {
        {"courses", report.totals.courseCount},
        {"earnedCredits", CreditsValue(report.totals.earnedCredits)},
        {"gpa", static_cast<double>(report.totals.gpaHundredths) / 100.0}
    };
    return j;
}

std::string ReportExportService::ToMarkdown(const AuditReport& report) {
    std::stringstream ss;
    ss << "# Degree Audit: " << report.studentId << "\n\n";
    ss << "Status: " << (report.satisfied ? "all requirements satisfied" : "requirements outstanding") << "\n\n";
    ss << "Earned credits: " << report.totals.earnedCredits.ToString()
       << " | GPA: " << domain::rules::HundredthsToString(report.totals.gpaHundredths)
       << " | Courses: " << report.totals.courseCount << "\n\n";

    ss << "## Blocks\n\n";
    ss << "| Block | Title | Type | Status | Applied credits |\n";
    ss << "|---|---|---|---|---|\n";
    for (const auto& block : report.blocks) {
        ss << "| " << Escape(block.blockId) << " | " << Escape(block.title) << " | "
           << domain::BlockTypeToString(block.type) << " | "
           << (block.satisfied ? "satisfied" : "unsatisfied") << " | "
           << block.root.appliedCredits.ToString() << " |\n";
    }
    ss << "\n";

    if (!report.shortfalls.empty()) {
        ss << "## Outstanding\n\n";
        ss << "| Block | Requirement | Shortfall |\n";
        ss << "|---|---|---|\n";
        for (const auto& line : report.shortfalls) {
            ss << "| " << Escape(line.blockId) << " | " << Escape(line.label) << " | " << Escape(line.text) << " |\n";
        }
        ss << "\n";
    }

    if (!report.unusedCourses.empty()) {
        ss << "## Unused Courses\n\n";
        ss << "| Course | Credits | Grade |\n";
        ss << "|---|---|---|\n";
        for (const auto& course : report.unusedCourses) {
            ss << "| " << Escape(course.displayName) << " | " << course.credits.ToString() << " | "
               << domain::GradeToString(course.grade) << " |\n";
        }
        ss << "\n";
    }

    for (const auto& block : report.blocks) {
        ss << "## " << block.blockId;
        if (!block.title.empty() && block.title != block.blockId) ss << ": " << block.title;
        ss << "\n\n";
        WriteVerdictTree(ss, block.root, 0);
        ss << "\n";
    }

    return ss.str();
}

std::string ReportExportService::Render(const AuditReport& report, ReportFormat format) {
    if (format == ReportFormat::Markdown) return ToMarkdown(report);
    return ToJson(report).dump(2);
}

} // namespace scribeaudit::application
