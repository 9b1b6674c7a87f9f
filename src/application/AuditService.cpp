#include "application/AuditService.hpp"

#include <future>
#include <stdexcept>

#include "application/AuditReportBuilder.hpp"
#include "domain/audit/Evaluator.hpp"

namespace scribeaudit::application {

using domain::audit::AuditReport;
using domain::rules::LinkedCatalog;

AuditService::AuditService(std::shared_ptr<BlockCatalogService> catalog, domain::audit::EvaluationPolicy policy)
    : m_catalog(std::move(catalog)), m_policy(std::move(policy)) {}

std::shared_ptr<const LinkedCatalog> AuditService::RequireSnapshot() const {
    auto snapshot = m_catalog ? m_catalog->Snapshot() : nullptr;
    if (!snapshot) {
        throw std::runtime_error("block catalog has not been built");
    }
    return snapshot;
}

AuditReport AuditService::Run(const domain::Transcript& transcript,
                              std::shared_ptr<const LinkedCatalog> catalog,
                              const domain::audit::EvaluationPolicy& policy,
                              const std::vector<std::string>& blockIds) {
    domain::audit::Evaluator run(transcript, std::move(catalog), policy);
    std::vector<domain::audit::BlockAuditResult> results;
    results.reserve(blockIds.size());
    for (const auto& blockId : blockIds) {
        results.push_back(run.Evaluate(blockId));
    }
    return AuditReportBuilder::Build(run, results);
}

AuditReport AuditService::Audit(const domain::Transcript& transcript,
                                const std::vector<std::string>& blockIds) const {
    return Run(transcript, RequireSnapshot(), m_policy, blockIds);
}

std::vector<AuditReport> AuditService::AuditBatch(const std::vector<domain::Transcript>& transcripts,
                                                  const std::vector<std::string>& blockIds) const {
    auto snapshot = RequireSnapshot();

    std::vector<std::future<AuditReport>> pending;
    pending.reserve(transcripts.size());
    for (const auto& transcript : transcripts) {
        pending.push_back(std::async(std::launch::async, [&transcript, snapshot, &blockIds, this]() {
            return Run(transcript, snapshot, m_policy, blockIds);
        }));
    }

    std::vector<AuditReport> reports;
    reports.reserve(pending.size());
    for (auto& future : pending) {
        reports.push_back(future.get());
    }
    return reports;
}

} // namespace scribeaudit::application
