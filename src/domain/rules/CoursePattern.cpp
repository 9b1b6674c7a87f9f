/**
 * @file CoursePattern.cpp
 * @brief Implementation of CoursePattern.
 */

#include "domain/rules/CoursePattern.hpp"

#include <algorithm>
#include <cctype>

namespace scribeaudit::domain::rules {

CoursePattern CoursePattern::Subject(const std::string& subjectGlob) {
    CoursePattern p;
    p.m_subjectGlob = subjectGlob;
    p.compile();
    return p;
}

CoursePattern CoursePattern::Exact(const std::string& subjectGlob, int number) {
    CoursePattern p = Subject(subjectGlob);
    p.m_numberMode = NumberMode::Exact;
    p.m_low = p.m_high = number;
    return p;
}

CoursePattern CoursePattern::Range(const std::string& subjectGlob, int low, int high) {
    CoursePattern p = Subject(subjectGlob);
    p.m_numberMode = NumberMode::Range;
    p.m_low = low;
    p.m_high = high;
    return p;
}

void CoursePattern::compile() {
    // Transcript subjects are upper case; "math*" matches MATH courses.
    std::transform(m_subjectGlob.begin(), m_subjectGlob.end(), m_subjectGlob.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    m_segments.clear();
    m_leadingStar = !m_subjectGlob.empty() && m_subjectGlob.front() == '*';
    m_trailingStar = !m_subjectGlob.empty() && m_subjectGlob.back() == '*';

    std::string current;
    for (char c : m_subjectGlob) {
        if (c == '*') {
            if (!current.empty()) m_segments.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) m_segments.push_back(current);
}

bool CoursePattern::matchesSubject(const std::string& subject) const {
    if (m_segments.empty()) {
        // Either "" (matches nothing but "") or only wildcards.
        return m_leadingStar || subject.empty();
    }

    std::size_t pos = 0;
    for (std::size_t i = 0; i < m_segments.size(); ++i) {
        const std::string& seg = m_segments[i];
        const bool first = (i == 0);
        const bool last = (i + 1 == m_segments.size());

        if (first && !m_leadingStar) {
            if (subject.compare(0, seg.size(), seg) != 0) return false;
            pos = seg.size();
        } else if (last && !m_trailingStar) {
            if (subject.size() < pos + seg.size()) return false;
            const std::size_t tail = subject.size() - seg.size();
            if (subject.compare(tail, seg.size(), seg) != 0) return false;
            pos = subject.size();
        } else {
            const std::size_t found = subject.find(seg, pos);
            if (found == std::string::npos) return false;
            pos = found + seg.size();
        }
    }
    return m_trailingStar || pos == subject.size();
}

bool CoursePattern::matches(const Course& course) const {
    if (!matchesSubject(course.subject)) return false;

    switch (m_numberMode) {
        case NumberMode::Any:
            return true;
        case NumberMode::Exact:
        case NumberMode::Range: {
            const int n = course.numericNumber();
            return n >= 0 && n >= m_low && n <= m_high;
        }
    }
    return false;
}

std::string CoursePattern::ToString() const {
    switch (m_numberMode) {
        case NumberMode::Exact:
            return m_subjectGlob + " " + std::to_string(m_low);
        case NumberMode::Range:
            return m_subjectGlob + " " + std::to_string(m_low) + "-" + std::to_string(m_high);
        case NumberMode::Any:
        default:
            return m_subjectGlob;
    }
}

std::string PatternsToString(const std::vector<CoursePattern>& patterns) {
    std::string out;
    for (std::size_t i = 0; i < patterns.size(); ++i) {
        if (i > 0) out += ", ";
        out += patterns[i].ToString();
    }
    return out;
}

} // namespace scribeaudit::domain::rules
