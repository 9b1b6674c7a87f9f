/**
 * @file AuditService.hpp
 * @brief Runs audits of transcripts against the published block catalog.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "application/BlockCatalogService.hpp"
#include "domain/audit/AuditReport.hpp"
#include "domain/audit/EvaluationPolicy.hpp"

namespace scribeaudit::application {

/**
 * @class AuditService
 * @brief Evaluates one student (or many, concurrently) against an ordered list of blocks.
 *
 * Blocks of one audit share a single allocation state and are evaluated in the
 * given order, so earlier blocks get first pick of the courses.
 */
class AuditService {
public:
    AuditService(std::shared_ptr<BlockCatalogService> catalog, domain::audit::EvaluationPolicy policy = {});

    /**
     * @brief Audits one transcript.
     * @throws std::runtime_error if the catalog has never been built.
     * @throws rules::EvaluationError if a block id is not in the catalog.
     */
    domain::audit::AuditReport Audit(const domain::Transcript& transcript,
                                     const std::vector<std::string>& blockIds) const;

    /**
     * @brief Audits independent transcripts on worker threads against one snapshot.
     * @return Reports in the order of the input transcripts.
     */
    std::vector<domain::audit::AuditReport> AuditBatch(const std::vector<domain::Transcript>& transcripts,
                                                       const std::vector<std::string>& blockIds) const;

    const domain::audit::EvaluationPolicy& policy() const { return m_policy; }

private:
    std::shared_ptr<const domain::rules::LinkedCatalog> RequireSnapshot() const;

    static domain::audit::AuditReport Run(const domain::Transcript& transcript,
                                          std::shared_ptr<const domain::rules::LinkedCatalog> catalog,
                                          const domain::audit::EvaluationPolicy& policy,
                                          const std::vector<std::string>& blockIds);

    std::shared_ptr<BlockCatalogService> m_catalog;
    domain::audit::EvaluationPolicy m_policy;
};

} // namespace scribeaudit::application
