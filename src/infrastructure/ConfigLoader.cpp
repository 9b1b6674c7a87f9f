/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>

namespace scribeaudit::infrastructure {

AuditSettings ConfigLoader::LoadFromRoot(const std::string& projectRoot) {
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / "settings.json";
    return Load(configPath.string());
}

AuditSettings ConfigLoader::Load(const std::string& configPath) {
    if (!std::filesystem::exists(configPath)) {
        return AuditSettings{};
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;
        return FromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
    }

    return AuditSettings{};
}

AuditSettings ConfigLoader::FromJson(const nlohmann::json& j) {
    AuditSettings settings;
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] settings root is not an object, using defaults" << std::endl;
        return settings;
    }

    settings.verbose = j.value("verbose", settings.verbose);
    settings.maxNestingDepth = j.value("max_nesting_depth", settings.maxNestingDepth);
    settings.reportsDir = j.value("reports_dir", settings.reportsDir);

    if (j.contains("term_sessions") && j["term_sessions"].is_object()) {
        std::map<std::string, int> ranks;
        for (const auto& [code, rank] : j["term_sessions"].items()) {
            std::string upper = code;
            std::transform(upper.begin(), upper.end(), upper.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            ranks[upper] = rank.get<int>();
        }
        settings.evaluation.calendar = domain::TermCalendar(std::move(ranks));
    }

    if (j.contains("evaluation") && j["evaluation"].is_object()) {
        const auto& e = j["evaluation"];
        auto& policy = settings.evaluation;

        if (e.contains("release_order")) {
            const std::string text = e["release_order"].get<std::string>();
            if (auto order = domain::audit::ReleaseOrderFromString(text)) {
                policy.releaseOrder = *order;
            } else {
                std::cerr << "[ConfigLoader] Unknown release_order '" << text << "', using "
                          << domain::audit::ReleaseOrderToString(policy.releaseOrder) << std::endl;
            }
        }
        if (e.contains("group_preference")) {
            const std::string text = e["group_preference"].get<std::string>();
            if (auto preference = domain::audit::GroupPreferenceFromString(text)) {
                policy.groupPreference = *preference;
            } else {
                std::cerr << "[ConfigLoader] Unknown group_preference '" << text << "', using "
                          << domain::audit::GroupPreferenceToString(policy.groupPreference) << std::endl;
            }
        }
        policy.countInProgress = e.value("count_in_progress", policy.countInProgress);
        policy.passMeetsGradeFloor = e.value("pass_meets_grade_floor", policy.passMeetsGradeFloor);
    }

    return settings;
}

} // namespace scribeaudit::infrastructure
