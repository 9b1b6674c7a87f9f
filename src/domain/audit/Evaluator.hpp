/**
 * @file Evaluator.hpp
 * @brief Allocates transcript courses to rule nodes and produces verdicts.
 */

#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "domain/Block.hpp"
#include "domain/audit/AllocationState.hpp"
#include "domain/audit/AuditResult.hpp"
#include "domain/audit/EvaluationPolicy.hpp"
#include "domain/audit/TranscriptAggregates.hpp"
#include "domain/rules/BlockLinker.hpp"

namespace scribeaudit::domain::audit {

/**
 * @class Evaluator
 * @brief One audit run over one transcript.
 *
 * Blocks evaluated through the same Evaluator share its allocation state, so a
 * course consumed by one block is unavailable to the next. Exclusive block
 * references are evaluated once per run and memoized; shared references run
 * against the full transcript in a scratch state.
 *
 * The transcript and catalog must outlive the evaluator.
 */
class Evaluator {
public:
    Evaluator(const Transcript& transcript,
              std::shared_ptr<const rules::LinkedCatalog> catalog,
              EvaluationPolicy policy = {});

    /**
     * @brief Evaluates a catalog block by id.
     * @throws rules::EvaluationError if there is no catalog or the id is not in it.
     */
    BlockAuditResult Evaluate(const std::string& blockId);

    /**
     * @brief Evaluates a block against the run's remaining pool.
     * @throws rules::EvaluationError when a reference inside it cannot be resolved.
     */
    BlockAuditResult Evaluate(const Block& block);

    const AllocationState& state() const { return m_state; }
    const TranscriptAggregates& aggregates() const { return m_aggregates; }
    const Transcript& transcript() const { return m_transcript; }
    const EvaluationPolicy& policy() const { return m_policy; }

    AppliedCourse describeCourse(std::size_t transcriptIndex) const;

private:
    RuleVerdict evaluateNode(const Block& block, rules::NodeId id);
    RuleVerdict evaluateCourseSet(const Block& block, const rules::RuleNode& node);
    RuleVerdict evaluateGroup(const Block& block, const rules::RuleNode& node);
    RuleVerdict evaluateMaximum(const Block& block, const rules::RuleNode& node);
    RuleVerdict evaluateConditional(const Block& block, const rules::RuleNode& node);
    RuleVerdict evaluateReference(const rules::RuleNode& node);

    /**
     * @brief Drops released courses from a subtree and recomputes its flags.
     * Exclusive references are recomputed inside their own block and the memoized result is updated.
     */
    void recompute(const Block& block, RuleVerdict& verdict, const std::set<std::size_t>& released);

    std::vector<AppliedCourse> unconsumedCourses() const;

    const Block& resolve(const std::string& blockId) const;
    bool isEligible(const Course& course) const;
    bool meetsGradeFloor(const Course& course, Grade floor) const;

    const Transcript& m_transcript;
    std::shared_ptr<const rules::LinkedCatalog> m_catalog;
    EvaluationPolicy m_policy;
    TranscriptAggregates m_aggregates;
    std::vector<TermKey> m_termKeys;
    AllocationState m_state;
    std::map<std::string, BlockAuditResult> m_evaluated;
};

} // namespace scribeaudit::domain::audit
