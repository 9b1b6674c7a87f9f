/**
 * @file TranscriptLoader.hpp
 * @brief Reads student transcripts from JSON.
 */

#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/Course.hpp"

namespace scribeaudit::infrastructure {

/**
 * @class TranscriptLoader
 * @brief Converts transcript JSON into a domain Transcript.
 *
 * Expected shape:
 * @code
 * {"studentId": "S1",
 *  "courses": [{"subject": "MATH", "number": "101", "credits": 3, "grade": "A", "term": "2020F",
 *               "repeat": false, "title": "Calculus I"}]}
 * @endcode
 * "number" and "credits" may be given as strings or numbers. All failures are
 * reported as std::runtime_error naming the offending course.
 */
class TranscriptLoader {
public:
    static domain::Transcript FromJson(const nlohmann::json& j);
    static domain::Transcript Parse(const std::string& text);
    static domain::Transcript LoadFile(const std::string& path);

    /** @brief A file holding either one transcript object or an array of them. */
    static std::vector<domain::Transcript> LoadBatchFile(const std::string& path);

    static nlohmann::json ToJson(const domain::Transcript& transcript);
};

} // namespace scribeaudit::infrastructure
