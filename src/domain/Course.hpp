/**
 * @file Course.hpp
 * @brief Value objects for completed coursework: credits, grades, terms, courses and transcripts.
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace scribeaudit::domain {

/**
 * @struct Credits
 * @brief Non-negative credit value stored exactly as hundredths of a credit.
 */
struct Credits {
    std::int64_t hundredths = 0;

    static Credits FromHundredths(std::int64_t h) { return Credits{h}; }
    static Credits Whole(std::int64_t units) { return Credits{units * 100}; }

    /**
     * @brief Parses decimal text such as "3", "3.5" or "0.25".
     * @return nullopt for negative values, more than two fractional digits or garbage.
     */
    static std::optional<Credits> Parse(const std::string& text);

    /** @brief Decimal form without trailing zeros ("3", "3.5", "0.25"). */
    std::string ToString() const;

    bool isZero() const { return hundredths == 0; }

    Credits& operator+=(Credits other) { hundredths += other.hundredths; return *this; }
    Credits& operator-=(Credits other) { hundredths -= other.hundredths; return *this; }
    friend Credits operator+(Credits a, Credits b) { return Credits{a.hundredths + b.hundredths}; }
    friend Credits operator-(Credits a, Credits b) { return Credits{a.hundredths - b.hundredths}; }
    friend bool operator==(Credits a, Credits b) { return a.hundredths == b.hundredths; }
    friend bool operator!=(Credits a, Credits b) { return a.hundredths != b.hundredths; }
    friend bool operator<(Credits a, Credits b) { return a.hundredths < b.hundredths; }
    friend bool operator<=(Credits a, Credits b) { return a.hundredths <= b.hundredths; }
    friend bool operator>(Credits a, Credits b) { return a.hundredths > b.hundredths; }
    friend bool operator>=(Credits a, Credits b) { return a.hundredths >= b.hundredths; }
};

/**
 * @enum Grade
 * @brief Letter grades are ordered F < D < C < B < A; the remaining values are markers.
 */
enum class Grade {
    F,          ///< Failing letter grade.
    D,
    C,
    B,
    A,
    Pass,       ///< Pass in a pass/fail course.
    Fail,       ///< Fail in a pass/fail course.
    Transfer,   ///< Credit transferred from another institution.
    InProgress  ///< Currently enrolled, no final grade yet.
};

inline bool IsLetterGrade(Grade g) {
    return g == Grade::F || g == Grade::D || g == Grade::C || g == Grade::B || g == Grade::A;
}

/** @brief True for grades that earn credit (everything but F, Fail and InProgress). */
inline bool IsPassingGrade(Grade g) {
    return g != Grade::F && g != Grade::Fail && g != Grade::InProgress;
}

/** @brief Grade points on a 4.0 scale; markers have none. */
inline std::optional<int> GradePoints(Grade g) {
    switch (g) {
        case Grade::A: return 4;
        case Grade::B: return 3;
        case Grade::C: return 2;
        case Grade::D: return 1;
        case Grade::F: return 0;
        default: return std::nullopt;
    }
}

inline std::string GradeToString(Grade g) {
    switch (g) {
        case Grade::A: return "A";
        case Grade::B: return "B";
        case Grade::C: return "C";
        case Grade::D: return "D";
        case Grade::F: return "F";
        case Grade::Pass: return "P";
        case Grade::Fail: return "NP";
        case Grade::Transfer: return "T";
        case Grade::InProgress: return "IP";
        default: return "?";
    }
}

/**
 * @brief Parses a grade as it appears on a transcript.
 * A trailing '+' or '-' folds to the base letter ("B+" -> B). Case-insensitive.
 */
std::optional<Grade> GradeFromString(const std::string& text);

/**
 * @struct TermKey
 * @brief Sort key of a term identifier: (year, session rank, raw text).
 */
struct TermKey {
    bool parsed = false; ///< False keys sort after every parsed key.
    int year = 0;
    int session = 0;
    std::string raw;

    friend bool operator<(const TermKey& a, const TermKey& b) {
        if (a.parsed != b.parsed) return a.parsed;
        if (a.year != b.year) return a.year < b.year;
        if (a.session != b.session) return a.session < b.session;
        return a.raw < b.raw;
    }
    friend bool operator==(const TermKey& a, const TermKey& b) {
        return a.parsed == b.parsed && a.year == b.year && a.session == b.session && a.raw == b.raw;
    }
};

/**
 * @class TermCalendar
 * @brief Orders term identifiers like "2020F" or "2021SU" using configurable session ranks.
 */
class TermCalendar {
public:
    /** @brief Calendar with W < SP < S = SU < F. */
    TermCalendar();
    explicit TermCalendar(std::map<std::string, int> sessionRanks);

    TermKey keyFor(const std::string& term) const;

    const std::map<std::string, int>& sessionRanks() const { return m_sessionRanks; }

private:
    std::map<std::string, int> m_sessionRanks; ///< Upper-case session code -> rank within a year.
};

/**
 * @struct CourseKey
 * @brief Identity of one course occurrence.
 */
struct CourseKey {
    std::string subject;
    std::string number;
    std::string term;

    friend bool operator==(const CourseKey& a, const CourseKey& b) {
        return a.subject == b.subject && a.number == b.number && a.term == b.term;
    }
    friend bool operator<(const CourseKey& a, const CourseKey& b) {
        if (a.subject != b.subject) return a.subject < b.subject;
        if (a.number != b.number) return a.number < b.number;
        return a.term < b.term;
    }
};

/**
 * @struct Course
 * @brief One completed (or in-progress) course occurrence on a transcript.
 */
struct Course {
    std::string subject;   ///< Upper-case subject code, e.g. "MATH".
    std::string number;    ///< Catalog number, e.g. "101" or "101L".
    Credits credits;
    Grade grade = Grade::A;
    std::string term;      ///< Term identifier, e.g. "2020F".
    bool repeated = false; ///< Marked as a repeat of an earlier attempt.
    std::string title;

    CourseKey key() const { return CourseKey{subject, number, term}; }

    /** @brief Leading digits of the catalog number, or -1 when there are none. */
    int numericNumber() const;

    /** @brief "MATH 101 (2020F)". */
    std::string displayName() const;
};

/**
 * @struct Transcript
 * @brief Courses of one student in chronological insertion order.
 */
struct Transcript {
    std::string studentId;
    std::vector<Course> courses;
};

} // namespace scribeaudit::domain
