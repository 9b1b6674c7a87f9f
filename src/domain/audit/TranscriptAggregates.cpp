#include "domain/audit/TranscriptAggregates.hpp"

namespace scribeaudit::domain::audit {

namespace {

bool MatchesAny(const std::vector<rules::CoursePattern>& patterns, const Course& course) {
    for (const auto& pattern : patterns) {
        if (pattern.matches(course)) return true;
    }
    return false;
}

// a/b against t/100, cross-multiplied.
bool Compare(const Fraction& value, rules::Comparison cmp, std::int64_t thresholdHundredths) {
    const std::int64_t lhs = value.numerator * 100;
    const std::int64_t rhs = thresholdHundredths * value.denominator;
    switch (cmp) {
        case rules::Comparison::Less: return lhs < rhs;
        case rules::Comparison::LessEqual: return lhs <= rhs;
        case rules::Comparison::Greater: return lhs > rhs;
        case rules::Comparison::GreaterEqual: return lhs >= rhs;
        case rules::Comparison::Equal: return lhs == rhs;
        case rules::Comparison::NotEqual: return lhs != rhs;
    }
    return false;
}

} // namespace

TranscriptAggregates::TranscriptAggregates(const Transcript& transcript, const EvaluationPolicy& policy) {
    std::int64_t qualityPoints = 0; // grade points x credit hundredths
    std::int64_t attempted = 0;     // credit hundredths

    for (const auto& course : transcript.courses) {
        const bool counts = IsPassingGrade(course.grade) ||
                            (policy.countInProgress && course.grade == Grade::InProgress);
        if (counts) {
            m_counted.push_back(&course);
            m_earnedCredits += course.credits;
        }
        if (auto points = GradePoints(course.grade)) {
            qualityPoints += *points * course.credits.hundredths;
            attempted += course.credits.hundredths;
        }
    }

    if (attempted > 0) {
        m_gpa = Fraction{qualityPoints, attempted};
    }
}

std::int64_t TranscriptAggregates::gpaHundredths() const {
    return (m_gpa.numerator * 100 * 2 + m_gpa.denominator) / (2 * m_gpa.denominator);
}

std::int64_t TranscriptAggregates::countOf(const std::vector<rules::CoursePattern>& patterns) const {
    std::int64_t count = 0;
    for (const Course* course : m_counted) {
        if (MatchesAny(patterns, *course)) ++count;
    }
    return count;
}

Credits TranscriptAggregates::creditsOf(const std::vector<rules::CoursePattern>& patterns) const {
    Credits total;
    for (const Course* course : m_counted) {
        if (MatchesAny(patterns, *course)) total += course->credits;
    }
    return total;
}

Fraction TranscriptAggregates::valueOf(const rules::Aggregate& aggregate) const {
    switch (aggregate.kind) {
        case rules::Aggregate::Kind::TotalCredits:
            return Fraction{m_earnedCredits.hundredths, 100};
        case rules::Aggregate::Kind::Gpa:
            return m_gpa;
        case rules::Aggregate::Kind::CountOf:
            return Fraction{countOf(aggregate.patterns), 1};
        case rules::Aggregate::Kind::CreditsOf:
            return Fraction{creditsOf(aggregate.patterns).hundredths, 100};
    }
    return {};
}

bool TranscriptAggregates::evaluate(const rules::Predicate& predicate) const {
    using Op = rules::Predicate::Op;
    switch (predicate.op) {
        case Op::Compare:
            return Compare(valueOf(predicate.aggregate), predicate.comparison, predicate.thresholdHundredths);
        case Op::Not:
            return !evaluate(predicate.operands.at(0));
        case Op::And:
            for (const auto& operand : predicate.operands) {
                if (!evaluate(operand)) return false;
            }
            return true;
        case Op::Or:
            for (const auto& operand : predicate.operands) {
                if (evaluate(operand)) return true;
            }
            return false;
    }
    return false;
}

} // namespace scribeaudit::domain::audit
