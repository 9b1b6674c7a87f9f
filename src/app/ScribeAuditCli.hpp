/**
 * @file ScribeAuditCli.hpp
 * @brief Command-line front end for ScribeAudit.
 */

#pragma once

#include <iostream>
#include <string>
#include <vector>

#include "infrastructure/ConfigLoader.hpp"

namespace scribeaudit::app {

/**
 * @class ScribeAuditCli
 * @brief Parses arguments and dispatches the check, print and audit commands.
 */
class ScribeAuditCli {
public:
    explicit ScribeAuditCli(std::ostream& out = std::cout, std::ostream& err = std::cerr);

    /**
     * @brief Runs one command.
     * @param args Arguments without the program name.
     * @return Exit code: 0 success, 1 failure, 2 usage error.
     */
    int Run(const std::vector<std::string>& args);

    static std::string Usage();

private:
    struct Options {
        std::vector<std::string> positional;
        std::string configPath;
        std::string format = "json";
        bool writeToStore = false;
    };

    static bool ParseOptions(const std::vector<std::string>& args, Options& options, std::string& error);

    int RunCheck(const Options& options, const infrastructure::AuditSettings& settings);
    int RunPrint(const Options& options, const infrastructure::AuditSettings& settings);
    int RunAudit(const Options& options, const infrastructure::AuditSettings& settings);

    std::ostream& m_out;
    std::ostream& m_err;
};

} // namespace scribeaudit::app
