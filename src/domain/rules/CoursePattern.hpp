/**
 * @file CoursePattern.hpp
 * @brief Compiled subject/number matcher used by CourseSet rules and predicates.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/Course.hpp"

namespace scribeaudit::domain::rules {

/**
 * @class CoursePattern
 * @brief A subject glob ("MATH", "ENG*", "*") plus an optional number constraint.
 *
 * The glob is split into literal segments once, at construction, so matching a
 * course never re-parses the pattern text.
 */
class CoursePattern {
public:
    enum class NumberMode { Any, Exact, Range };

    CoursePattern() = default;

    static CoursePattern Subject(const std::string& subjectGlob);
    static CoursePattern Exact(const std::string& subjectGlob, int number);
    static CoursePattern Range(const std::string& subjectGlob, int low, int high);

    bool matches(const Course& course) const;
    bool matchesSubject(const std::string& subject) const;

    const std::string& subjectGlob() const { return m_subjectGlob; }
    NumberMode numberMode() const { return m_numberMode; }
    int low() const { return m_low; }
    int high() const { return m_high; }

    /** @brief Source form: "MATH 100-199", "ENG*", "CS 101". */
    std::string ToString() const;

    friend bool operator==(const CoursePattern& a, const CoursePattern& b) {
        return a.m_subjectGlob == b.m_subjectGlob && a.m_numberMode == b.m_numberMode &&
               a.m_low == b.m_low && a.m_high == b.m_high;
    }
    friend bool operator!=(const CoursePattern& a, const CoursePattern& b) { return !(a == b); }

private:
    void compile();

    std::string m_subjectGlob;
    std::vector<std::string> m_segments; ///< Literal pieces between '*' wildcards.
    bool m_leadingStar = false;
    bool m_trailingStar = false;
    NumberMode m_numberMode = NumberMode::Any;
    int m_low = 0;
    int m_high = 0;
};

/** @brief "MATH 100-199, ENG*" */
std::string PatternsToString(const std::vector<CoursePattern>& patterns);

} // namespace scribeaudit::domain::rules
