/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Provides one place to read evaluation policy and engine limits
 * without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "domain/audit/EvaluationPolicy.hpp"

namespace scribeaudit::infrastructure {

/**
 * @struct AuditSettings
 * @brief Effective configuration; every field has a default.
 */
struct AuditSettings {
    bool verbose = false;
    std::size_t maxNestingDepth = 64;
    domain::audit::EvaluationPolicy evaluation;
    std::string reportsDir = "reports";
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json from the project root.
     * @param projectRoot Directory containing settings.json.
     */
    static AuditSettings LoadFromRoot(const std::string& projectRoot);

    /**
     * @brief Reads a settings file. A missing file yields defaults; malformed JSON is logged and yields defaults.
     */
    static AuditSettings Load(const std::string& configPath);

    /**
     * @brief Applies the keys present in a JSON object over the defaults.
     * Unknown enum values are logged and the default is kept.
     * @throws nlohmann::json::exception for keys of the wrong type.
     */
    static AuditSettings FromJson(const nlohmann::json& j);
};

} // namespace scribeaudit::infrastructure
