/**
 * @file TestSupport.hpp
 * @brief Small builders shared by the test executables.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "domain/Course.hpp"
#include "domain/rules/BlockLinker.hpp"
#include "domain/rules/BlockParser.hpp"

namespace scribeaudit::test {

inline domain::Course MakeCourse(const std::string& subject, const std::string& number,
                                 const std::string& credits, const std::string& grade, const std::string& term) {
    domain::Course course;
    course.subject = subject;
    course.number = number;
    course.credits = *domain::Credits::Parse(credits);
    course.grade = *domain::GradeFromString(grade);
    course.term = term;
    return course;
}

inline domain::Transcript MakeTranscript(const std::string& studentId, std::vector<domain::Course> courses) {
    domain::Transcript transcript;
    transcript.studentId = studentId;
    transcript.courses = std::move(courses);
    return transcript;
}

/** @brief Parses every block of a source and links them into a catalog. */
inline std::shared_ptr<const domain::rules::LinkedCatalog> LinkSource(const std::string& source) {
    domain::rules::BlockParser parser;
    std::vector<std::shared_ptr<const domain::Block>> blocks;
    for (auto& block : parser.Parse(source, "test.block").allBlocks()) {
        blocks.push_back(std::make_shared<const domain::Block>(std::move(block)));
    }
    return domain::rules::BlockLinker::Link(std::move(blocks));
}

} // namespace scribeaudit::test
