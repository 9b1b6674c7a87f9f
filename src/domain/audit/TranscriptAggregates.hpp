/**
 * @file TranscriptAggregates.hpp
 * @brief Transcript-wide totals that conditional rules test against.
 */

#pragma once

#include <cstdint>
#include <vector>

#include "domain/Course.hpp"
#include "domain/audit/EvaluationPolicy.hpp"
#include "domain/rules/Rule.hpp"

namespace scribeaudit::domain::audit {

/**
 * @struct Fraction
 * @brief Exact non-negative value numerator / denominator (denominator > 0).
 */
struct Fraction {
    std::int64_t numerator = 0;
    std::int64_t denominator = 1;
};

/**
 * @class TranscriptAggregates
 * @brief Totals computed once over the full transcript at audit start.
 *
 * Earned credits and pattern counts include every allocatable course under the
 * evaluation policy. GPA is credit-weighted over letter grades only (F included).
 * Holds pointers into the transcript, which must outlive it.
 */
class TranscriptAggregates {
public:
    TranscriptAggregates(const Transcript& transcript, const EvaluationPolicy& policy);

    Credits earnedCredits() const { return m_earnedCredits; }

    /** @brief Exact GPA; 0/1 when no letter-graded credit was attempted. */
    Fraction gpa() const { return m_gpa; }

    /** @brief GPA rounded to two decimals, in hundredths. */
    std::int64_t gpaHundredths() const;

    std::int64_t countOf(const std::vector<rules::CoursePattern>& patterns) const;
    Credits creditsOf(const std::vector<rules::CoursePattern>& patterns) const;

    Fraction valueOf(const rules::Aggregate& aggregate) const;

    /** @brief Evaluates a predicate without rounding. */
    bool evaluate(const rules::Predicate& predicate) const;

private:
    std::vector<const Course*> m_counted;
    Credits m_earnedCredits;
    Fraction m_gpa;
};

} // namespace scribeaudit::domain::audit
