/**
 * @file TranscriptLoader.cpp
 * @brief Implementation of TranscriptLoader.
 */

#include "infrastructure/TranscriptLoader.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace scribeaudit::infrastructure {

namespace {

std::string ScalarText(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number()) return value.dump();
    throw std::runtime_error("expected string or number, found " + std::string(value.type_name()));
}

domain::Course CourseFromJson(const nlohmann::json& j, std::size_t index) {
    const std::string where = "course #" + std::to_string(index + 1);
    if (!j.is_object()) {
        throw std::runtime_error(where + " is not an object");
    }
    for (const char* key : {"subject", "number", "credits", "grade", "term"}) {
        if (!j.contains(key)) {
            throw std::runtime_error(where + " is missing '" + key + "'");
        }
    }

    domain::Course course;
    try {
        course.subject = j["subject"].get<std::string>();
        std::transform(course.subject.begin(), course.subject.end(), course.subject.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        course.number = ScalarText(j["number"]);
        course.term = j["term"].get<std::string>();
        course.repeated = j.value("repeat", false);
        course.title = j.value("title", std::string());

        const std::string creditsText = ScalarText(j["credits"]);
        auto credits = domain::Credits::Parse(creditsText);
        if (!credits) {
            throw std::runtime_error("invalid credits '" + creditsText + "'");
        }
        course.credits = *credits;

        const std::string gradeText = j["grade"].get<std::string>();
        auto grade = domain::GradeFromString(gradeText);
        if (!grade) {
            throw std::runtime_error("invalid grade '" + gradeText + "'");
        }
        course.grade = *grade;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(where + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(where + ": " + e.what());
    }
    return course;
}

nlohmann::json ReadJsonFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("cannot open transcript " + path);
    }
    try {
        nlohmann::json j;
        f >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[TranscriptLoader] Malformed JSON in " << path << ": " << e.what() << std::endl;
        throw std::runtime_error("malformed transcript " + path);
    }
}

} // namespace

domain::Transcript TranscriptLoader::FromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("transcript must be a JSON object");
    }
    if (!j.contains("courses") || !j["courses"].is_array()) {
        throw std::runtime_error("transcript has no 'courses' array");
    }

    domain::Transcript transcript;
    transcript.studentId = j.contains("studentId") ? ScalarText(j["studentId"]) : std::string();
    const auto& courses = j["courses"];
    for (std::size_t i = 0; i < courses.size(); ++i) {
        transcript.courses.push_back(CourseFromJson(courses[i], i));
    }
    return transcript;
}

domain::Transcript TranscriptLoader::Parse(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("malformed transcript JSON: ") + e.what());
    }
    return FromJson(j);
}

domain::Transcript TranscriptLoader::LoadFile(const std::string& path) {
    return FromJson(ReadJsonFile(path));
}

std::vector<domain::Transcript> TranscriptLoader::LoadBatchFile(const std::string& path) {
    const nlohmann::json j = ReadJsonFile(path);
    std::vector<domain::Transcript> transcripts;
    if (j.is_array()) {
        for (const auto& item : j) transcripts.push_back(FromJson(item));
    } else {
        transcripts.push_back(FromJson(j));
    }
    return transcripts;
}

nlohmann::json TranscriptLoader::ToJson(const domain::Transcript& transcript) {
    nlohmann::json courses = nlohmann::json::array();
    for (const auto& course : transcript.courses) {
        nlohmann::json c;
        c["subject"] = course.subject;
        c["number"] = course.number;
        c["credits"] = course.credits.ToString();
        c["grade"] = domain::GradeToString(course.grade);
        c["term"] = course.term;
        if (course.repeated) c["repeat"] = true;
        if (!course.title.empty()) c["title"] = course.title;
        courses.push_back(c);
    }
    return {{"studentId", transcript.studentId}, {"courses", courses}};
}

} // namespace scribeaudit::infrastructure
