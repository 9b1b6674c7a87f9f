/**
 * @file ReportExportService.hpp
 * @brief Service to export audit reports as JSON or Markdown.
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "domain/audit/AuditReport.hpp"

namespace scribeaudit::application {

enum class ReportFormat {
    Json,
    Markdown
};

inline std::string ReportFormatExtension(ReportFormat format) {
    return format == ReportFormat::Markdown ? ".md" : ".json";
}

class ReportExportService {
public:
    /**
     * @brief Structured form with stable field names for downstream tools.
     */
    static nlohmann::json ToJson(const domain::audit::AuditReport& report);

    /** @brief One verdict subtree. */
    static nlohmann::json VerdictToJson(const domain::audit::RuleVerdict& verdict);

    /**
     * @brief Human-readable report: summary table, shortfalls, unused courses and verdict trees.
     */
    static std::string ToMarkdown(const domain::audit::AuditReport& report);

    static std::string Render(const domain::audit::AuditReport& report, ReportFormat format);
};

} // namespace scribeaudit::application
