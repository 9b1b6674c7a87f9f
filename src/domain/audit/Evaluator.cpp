#include "domain/audit/Evaluator.hpp"

#include <algorithm>

namespace scribeaudit::domain::audit {

using rules::CourseSetRule;
using rules::GroupMode;
using rules::GroupRule;
using rules::NodeId;
using rules::RuleKind;
using rules::RuleNode;

namespace {

bool MatchesAny(const std::vector<rules::CoursePattern>& patterns, const Course& course) {
    for (const auto& pattern : patterns) {
        if (pattern.matches(course)) return true;
    }
    return false;
}

void Tally(RuleVerdict& verdict) {
    verdict.appliedCount = verdict.applied.size();
    verdict.appliedCredits = Credits{};
    for (const auto& course : verdict.applied) {
        verdict.appliedCredits += course.credits;
    }
}

std::string Plural(const std::string& amount, bool one, const std::string& noun) {
    return amount + " " + noun + (one ? "" : "s");
}

std::string CourseSetShortfall(const CourseSetRule& rule, std::size_t count, Credits credits) {
    const std::string more = (count == 0 && credits.isZero()) ? "" : "more ";
    std::vector<std::string> parts;
    if (count < rule.minCount) {
        const std::size_t missing = rule.minCount - count;
        parts.push_back(Plural(std::to_string(missing), missing == 1, more + "course"));
    }
    if (credits < rule.minCredits) {
        const Credits missing = rule.minCredits - credits;
        parts.push_back(Plural(missing.ToString(), missing == Credits::Whole(1), more + "credit"));
    }
    if (parts.empty()) return {};

    std::string text = "needs " + parts[0];
    for (std::size_t i = 1; i < parts.size(); ++i) {
        text += " and " + parts[i];
    }
    return text + " from " + rules::PatternsToString(rule.patterns);
}

void FinishCourseSet(RuleVerdict& verdict, const CourseSetRule& rule) {
    Tally(verdict);
    verdict.satisfied = verdict.appliedCount >= rule.minCount && verdict.appliedCredits >= rule.minCredits;
    verdict.shortfall = CourseSetShortfall(rule, verdict.appliedCount, verdict.appliedCredits);
}

// Satisfaction of a group and which satisfied children count toward it.
void FinishGroup(RuleVerdict& verdict, const GroupRule& rule, GroupPreference preference) {
    verdict.applied.clear();
    for (const auto& child : verdict.children) {
        verdict.applied.insert(verdict.applied.end(), child.applied.begin(), child.applied.end());
    }
    Tally(verdict);

    std::size_t required = rule.required;
    if (rule.mode == GroupMode::All) required = verdict.children.size();
    else if (rule.mode == GroupMode::Any) required = 1;

    std::vector<std::size_t> satisfied;
    for (std::size_t i = 0; i < verdict.children.size(); ++i) {
        if (verdict.children[i].satisfied) satisfied.push_back(i);
    }

    if (rule.mode == GroupMode::All) {
        for (auto& child : verdict.children) child.counted = true;
    } else {
        if (preference == GroupPreference::MostCredits) {
            std::stable_sort(satisfied.begin(), satisfied.end(), [&](std::size_t a, std::size_t b) {
                return verdict.children[a].appliedCredits > verdict.children[b].appliedCredits;
            });
        }
        for (auto& child : verdict.children) child.counted = false;
        for (std::size_t i = 0; i < satisfied.size() && i < required; ++i) {
            verdict.children[satisfied[i]].counted = true;
        }
    }

    verdict.satisfied = satisfied.size() >= required;
    verdict.shortfall.clear();
    if (!verdict.satisfied) {
        verdict.shortfall = "needs " + std::to_string(required - satisfied.size()) + " more of " +
                            std::to_string(verdict.children.size()) + " requirements";
    }
}

// Single-child nodes (maximum, conditional) take their child's outcome.
void Adopt(RuleVerdict& verdict) {
    const RuleVerdict& child = verdict.children.front();
    verdict.applied = child.applied;
    verdict.satisfied = child.satisfied;
    verdict.shortfall = child.shortfall;
    Tally(verdict);
}

void MarkShared(RuleVerdict& verdict) {
    for (auto& course : verdict.applied) course.shared = true;
    for (auto& child : verdict.children) MarkShared(child);
}

// Courses consumed within this subtree, including through exclusive references
// first evaluated here. Shared courses and memoized references own nothing.
void CollectOwned(const RuleVerdict& verdict, std::vector<std::size_t>& out) {
    if (verdict.kind == RuleKind::CourseSet) {
        for (const auto& course : verdict.applied) {
            if (!course.shared) out.push_back(course.transcriptIndex);
        }
        return;
    }
    for (const auto& child : verdict.children) CollectOwned(child, out);
}

} // namespace

Evaluator::Evaluator(const Transcript& transcript,
                     std::shared_ptr<const rules::LinkedCatalog> catalog,
                     EvaluationPolicy policy)
    : m_transcript(transcript),
      m_catalog(std::move(catalog)),
      m_policy(std::move(policy)),
      m_aggregates(transcript, m_policy),
      m_state(transcript.courses.size()) {
    m_termKeys.reserve(transcript.courses.size());
    for (const auto& course : transcript.courses) {
        m_termKeys.push_back(m_policy.calendar.keyFor(course.term));
    }
}

AppliedCourse Evaluator::describeCourse(std::size_t transcriptIndex) const {
    const Course& course = m_transcript.courses.at(transcriptIndex);
    AppliedCourse applied;
    applied.transcriptIndex = transcriptIndex;
    applied.key = course.key();
    applied.displayName = course.displayName();
    applied.credits = course.credits;
    applied.grade = course.grade;
    applied.repeated = course.repeated;
    return applied;
}

const Block& Evaluator::resolve(const std::string& blockId) const {
    const Block* block = m_catalog ? m_catalog->find(blockId) : nullptr;
    if (!block) {
        throw rules::EvaluationError(blockId);
    }
    return *block;
}

BlockAuditResult Evaluator::Evaluate(const std::string& blockId) {
    return Evaluate(resolve(blockId));
}

BlockAuditResult Evaluator::Evaluate(const Block& block) {
    auto it = m_evaluated.find(block.id);
    if (it != m_evaluated.end()) {
        BlockAuditResult cached = it->second;
        cached.unconsumed = unconsumedCourses();
        return cached;
    }

    BlockAuditResult result;
    result.blockId = block.id;
    result.title = block.title;
    result.type = block.type;
    result.root = evaluateNode(block, block.rules.root());
    result.satisfied = result.root.satisfied;
    result.unconsumed = unconsumedCourses();

    m_evaluated.emplace(block.id, result);
    return result;
}

std::vector<AppliedCourse> Evaluator::unconsumedCourses() const {
    std::vector<AppliedCourse> courses;
    for (std::size_t index : m_state.unconsumed()) {
        courses.push_back(describeCourse(index));
    }
    return courses;
}

bool Evaluator::isEligible(const Course& course) const {
    if (course.grade == Grade::InProgress) return m_policy.countInProgress;
    return IsPassingGrade(course.grade);
}

bool Evaluator::meetsGradeFloor(const Course& course, Grade floor) const {
    if (IsLetterGrade(course.grade)) {
        return static_cast<int>(course.grade) >= static_cast<int>(floor);
    }
    switch (course.grade) {
        case Grade::Pass:
        case Grade::Transfer:
            return m_policy.passMeetsGradeFloor;
        case Grade::InProgress:
            return m_policy.countInProgress;
        default:
            return false;
    }
}

RuleVerdict Evaluator::evaluateNode(const Block& block, NodeId id) {
    const RuleNode& node = block.rules.node(id);
    switch (node.kind()) {
        case RuleKind::CourseSet: return evaluateCourseSet(block, node);
        case RuleKind::Group: return evaluateGroup(block, node);
        case RuleKind::Maximum: return evaluateMaximum(block, node);
        case RuleKind::Conditional: return evaluateConditional(block, node);
        case RuleKind::BlockReference: return evaluateReference(node);
    }
    return {};
}

namespace {

RuleVerdict NewVerdict(const Block& block, const RuleNode& node) {
    RuleVerdict verdict;
    verdict.node = node.id;
    verdict.kind = node.kind();
    verdict.description = rules::DescribeNode(block.rules, node.id);
    verdict.label = node.label;
    return verdict;
}

} // namespace

RuleVerdict Evaluator::evaluateCourseSet(const Block& block, const RuleNode& node) {
    const auto& rule = std::get<CourseSetRule>(node.body);
    RuleVerdict verdict = NewVerdict(block, node);

    std::vector<std::size_t> candidates;
    for (std::size_t index : m_state.unconsumed()) {
        const Course& course = m_transcript.courses[index];
        if (!isEligible(course)) continue;
        if (!MatchesAny(rule.patterns, course)) continue;
        if (MatchesAny(rule.excluded, course)) continue;
        if (rule.gradeFloor && !meetsGradeFloor(course, *rule.gradeFloor)) continue;
        candidates.push_back(index);
    }

    // Earliest term first, then larger courses, then transcript order.
    std::sort(candidates.begin(), candidates.end(), [this](std::size_t a, std::size_t b) {
        if (!(m_termKeys[a] == m_termKeys[b])) return m_termKeys[a] < m_termKeys[b];
        const Credits ca = m_transcript.courses[a].credits;
        const Credits cb = m_transcript.courses[b].credits;
        if (ca != cb) return ca > cb;
        return a < b;
    });

    std::size_t count = 0;
    Credits credits;
    for (std::size_t index : candidates) {
        if (count >= rule.minCount && credits >= rule.minCredits) break;
        m_state.consume(index, block.id, node.id);
        verdict.applied.push_back(describeCourse(index));
        ++count;
        credits += m_transcript.courses[index].credits;
    }

    FinishCourseSet(verdict, rule);
    return verdict;
}

RuleVerdict Evaluator::evaluateGroup(const Block& block, const RuleNode& node) {
    const auto& rule = std::get<GroupRule>(node.body);
    RuleVerdict verdict = NewVerdict(block, node);

    // Every child is evaluated, even after the outcome is known.
    for (NodeId child : rule.children) {
        verdict.children.push_back(evaluateNode(block, child));
    }

    FinishGroup(verdict, rule, m_policy.groupPreference);
    return verdict;
}

RuleVerdict Evaluator::evaluateMaximum(const Block& block, const RuleNode& node) {
    const auto& rule = std::get<rules::MaximumRule>(node.body);
    RuleVerdict verdict = NewVerdict(block, node);
    RuleVerdict child = evaluateNode(block, rule.child);

    std::vector<std::size_t> owned;
    CollectOwned(child, owned);

    std::size_t count = owned.size();
    Credits credits;
    for (std::size_t index : owned) credits += m_transcript.courses[index].credits;

    auto overCeiling = [&]() {
        if (rule.unit == rules::LimitUnit::Courses) return count > rule.maxCount;
        return credits > rule.maxCredits;
    };

    if (overCeiling()) {
        const bool newestFirst = m_policy.releaseOrder == ReleaseOrder::MostRecentFirst;
        std::sort(owned.begin(), owned.end(), [&](std::size_t a, std::size_t b) {
            const auto sa = m_state.owner(a)->sequence;
            const auto sb = m_state.owner(b)->sequence;
            return newestFirst ? sa > sb : sa < sb;
        });

        std::set<std::size_t> released;
        for (std::size_t index : owned) {
            if (!overCeiling()) break;
            m_state.release(index);
            released.insert(index);
            --count;
            credits -= m_transcript.courses[index].credits;
        }
        recompute(block, child, released);
    }

    verdict.children.push_back(std::move(child));
    Adopt(verdict);
    return verdict;
}

RuleVerdict Evaluator::evaluateConditional(const Block& block, const RuleNode& node) {
    const auto& rule = std::get<rules::ConditionalRule>(node.body);
    RuleVerdict verdict = NewVerdict(block, node);

    const bool taken = m_aggregates.evaluate(rule.predicate);
    verdict.branchTaken = taken;
    verdict.children.push_back(evaluateNode(block, taken ? rule.thenBranch : rule.elseBranch));
    Adopt(verdict);
    return verdict;
}

RuleVerdict Evaluator::evaluateReference(const RuleNode& node) {
    const auto& rule = std::get<rules::BlockReferenceRule>(node.body);
    RuleVerdict verdict;
    verdict.node = node.id;
    verdict.kind = node.kind();
    verdict.label = node.label;
    verdict.referencedBlock = rule.blockId;
    verdict.description = "block " + rule.blockId + " (" + rules::SharePolicyToString(rule.policy) + ")";

    const Block& target = resolve(rule.blockId);

    if (rule.policy == rules::SharePolicy::Shared) {
        Evaluator scratch(m_transcript, m_catalog, m_policy);
        BlockAuditResult result = scratch.Evaluate(target);
        MarkShared(result.root);
        verdict.children.push_back(std::move(result.root));
        Adopt(verdict);
    } else if (m_evaluated.count(rule.blockId) != 0) {
        verdict.memoized = true;
        verdict.satisfied = m_evaluated.at(rule.blockId).satisfied;
    } else {
        BlockAuditResult result = Evaluate(target);
        verdict.children.push_back(std::move(result.root));
        Adopt(verdict);
    }

    verdict.shortfall = verdict.satisfied ? "" : "block " + rule.blockId + " is not satisfied";
    return verdict;
}

void Evaluator::recompute(const Block& block, RuleVerdict& verdict, const std::set<std::size_t>& released) {
    switch (verdict.kind) {
        case RuleKind::BlockReference: {
            const auto& rule = std::get<rules::BlockReferenceRule>(block.rules.node(verdict.node).body);
            if (rule.policy == rules::SharePolicy::Shared) return;

            auto memo = m_evaluated.find(rule.blockId);
            if (!verdict.memoized && !verdict.children.empty()) {
                recompute(resolve(rule.blockId), verdict.children.front(), released);
                Adopt(verdict);
                // Later references and top-level audits see the capped verdict.
                if (memo != m_evaluated.end()) {
                    memo->second.root = verdict.children.front();
                    memo->second.satisfied = memo->second.root.satisfied;
                }
            } else if (memo != m_evaluated.end()) {
                verdict.satisfied = memo->second.satisfied;
            }
            verdict.shortfall = verdict.satisfied ? "" : "block " + rule.blockId + " is not satisfied";
            return;
        }
        case RuleKind::CourseSet: {
            auto& applied = verdict.applied;
            applied.erase(std::remove_if(applied.begin(), applied.end(),
                                         [&](const AppliedCourse& c) {
                                             return !c.shared && released.count(c.transcriptIndex) != 0;
                                         }),
                          applied.end());
            FinishCourseSet(verdict, std::get<CourseSetRule>(block.rules.node(verdict.node).body));
            return;
        }
        case RuleKind::Group:
            for (auto& child : verdict.children) recompute(block, child, released);
            FinishGroup(verdict, std::get<GroupRule>(block.rules.node(verdict.node).body),
                        m_policy.groupPreference);
            return;
        case RuleKind::Maximum:
        case RuleKind::Conditional:
            recompute(block, verdict.children.front(), released);
            Adopt(verdict);
            return;
    }
}

} // namespace scribeaudit::domain::audit
