/**
 * @file Course.cpp
 * @brief Parsing helpers for credits, grades and terms.
 */

#include "domain/Course.hpp"

#include <algorithm>
#include <cctype>

namespace scribeaudit::domain {

namespace {

std::string ToUpper(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        out.push_back(static_cast<char>(std::toupper(c)));
    }
    return out;
}

std::string Trimmed(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

std::optional<Credits> Credits::Parse(const std::string& text) {
    const std::string s = Trimmed(text);
    if (s.empty()) return std::nullopt;

    std::int64_t whole = 0;
    std::int64_t frac = 0;
    int fracDigits = 0;
    bool seenDot = false;
    bool seenDigit = false;

    for (char c : s) {
        if (c == '.') {
            if (seenDot) return std::nullopt;
            seenDot = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        seenDigit = true;
        if (seenDot) {
            if (++fracDigits > 2) return std::nullopt;
            frac = frac * 10 + (c - '0');
        } else {
            whole = whole * 10 + (c - '0');
            if (whole > 1000000) return std::nullopt;
        }
    }
    if (!seenDigit) return std::nullopt;
    if (fracDigits == 1) frac *= 10;
    return Credits{whole * 100 + frac};
}

std::string Credits::ToString() const {
    std::string out = std::to_string(hundredths / 100);
    const std::int64_t frac = hundredths % 100;
    if (frac != 0) {
        out += '.';
        out += static_cast<char>('0' + frac / 10);
        if (frac % 10 != 0) out += static_cast<char>('0' + frac % 10);
    }
    return out;
}

std::optional<Grade> GradeFromString(const std::string& text) {
    std::string g = ToUpper(Trimmed(text));
    if (g.size() == 2 && (g[1] == '+' || g[1] == '-')) g.pop_back();

    if (g == "A") return Grade::A;
    if (g == "B") return Grade::B;
    if (g == "C") return Grade::C;
    if (g == "D") return Grade::D;
    if (g == "F") return Grade::F;
    if (g == "P" || g == "PASS" || g == "S") return Grade::Pass;
    if (g == "NP" || g == "FAIL" || g == "U") return Grade::Fail;
    if (g == "T" || g == "TR" || g == "TRANSFER") return Grade::Transfer;
    if (g == "IP" || g == "INPROGRESS") return Grade::InProgress;
    return std::nullopt;
}

TermCalendar::TermCalendar()
    : m_sessionRanks{{"W", 0}, {"SP", 1}, {"S", 2}, {"SU", 2}, {"F", 3}} {}

TermCalendar::TermCalendar(std::map<std::string, int> sessionRanks) {
    for (const auto& [code, rank] : sessionRanks) {
        m_sessionRanks[ToUpper(code)] = rank;
    }
}

TermKey TermCalendar::keyFor(const std::string& term) const {
    TermKey key;
    key.raw = term;

    std::string digits;
    std::string letters;
    for (unsigned char c : term) {
        if (std::isdigit(c)) {
            digits.push_back(static_cast<char>(c));
        } else if (std::isalpha(c)) {
            letters.push_back(static_cast<char>(std::toupper(c)));
        }
    }
    if (digits.size() != 4) return key;

    auto it = m_sessionRanks.find(letters);
    if (it == m_sessionRanks.end()) return key;

    key.parsed = true;
    key.year = std::stoi(digits);
    key.session = it->second;
    return key;
}

int Course::numericNumber() const {
    int value = 0;
    bool any = false;
    for (char c : number) {
        if (!std::isdigit(static_cast<unsigned char>(c))) break;
        any = true;
        value = value * 10 + (c - '0');
        if (value > 1000000) break;
    }
    return any ? value : -1;
}

std::string Course::displayName() const {
    return subject + " " + number + " (" + term + ")";
}

} // namespace scribeaudit::domain
