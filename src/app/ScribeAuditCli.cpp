/**
 * @file ScribeAuditCli.cpp
 * @brief Implementation of ScribeAuditCli.
 */

#include "app/ScribeAuditCli.hpp"

#include <filesystem>
#include <memory>

#include "application/AuditService.hpp"
#include "application/BlockCatalogService.hpp"
#include "application/ReportExportService.hpp"
#include "domain/rules/RulePrinter.hpp"
#include "infrastructure/FileBlockRepository.hpp"
#include "infrastructure/ReportStore.hpp"
#include "infrastructure/TranscriptLoader.hpp"

namespace scribeaudit::app {

namespace {

std::shared_ptr<application::BlockCatalogService> MakeCatalog(const infrastructure::AuditSettings& settings) {
    domain::rules::BlockParser::Options parserOptions;
    parserOptions.maxNestingDepth = settings.maxNestingDepth;
    return std::make_shared<application::BlockCatalogService>(parserOptions, settings.verbose);
}

} // namespace

ScribeAuditCli::ScribeAuditCli(std::ostream& out, std::ostream& err) : m_out(out), m_err(err) {}

std::string ScribeAuditCli::Usage() {
    return "usage: scribeaudit <command> [options]\n"
           "  check <blocks-dir>                          parse and link all blocks\n"
           "  print <block-file>                          pretty-print the blocks of one file\n"
           "  audit <blocks-dir> <transcript.json> <block-id>...\n"
           "        [--format json|markdown] [--out]      audit one or more students\n"
           "options:\n"
           "  --config <settings.json>                    configuration file\n";
}

bool ScribeAuditCli::ParseOptions(const std::vector<std::string>& args, Options& options, std::string& error) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--config" || arg == "--format") {
            if (i + 1 >= args.size()) {
                error = arg + " needs a value";
                return false;
            }
            (arg == "--config" ? options.configPath : options.format) = args[++i];
        } else if (arg == "--out") {
            options.writeToStore = true;
        } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            error = "unknown option " + arg;
            return false;
        } else {
            options.positional.push_back(arg);
        }
    }
    if (options.format != "json" && options.format != "markdown") {
        error = "unknown format " + options.format;
        return false;
    }
    return true;
}

int ScribeAuditCli::Run(const std::vector<std::string>& args) {
    Options options;
    std::string error;
    if (!ParseOptions(args, options, error) || options.positional.empty()) {
        if (!error.empty()) m_err << "[ScribeAuditCli] " << error << "\n";
        m_err << Usage();
        return 2;
    }

    const infrastructure::AuditSettings settings = options.configPath.empty()
        ? infrastructure::ConfigLoader::LoadFromRoot(std::filesystem::current_path().string())
        : infrastructure::ConfigLoader::Load(options.configPath);

    const std::string command = options.positional.front();
    options.positional.erase(options.positional.begin());

    try {
        if (command == "check" && options.positional.size() == 1) return RunCheck(options, settings);
        if (command == "print" && options.positional.size() == 1) return RunPrint(options, settings);
        if (command == "audit" && options.positional.size() >= 3) return RunAudit(options, settings);
    } catch (const std::exception& e) {
        m_err << "[ScribeAuditCli] Error: " << e.what() << std::endl;
        return 1;
    }

    m_err << Usage();
    return 2;
}

int ScribeAuditCli::RunCheck(const Options& options, const infrastructure::AuditSettings& settings) {
    infrastructure::FileBlockRepository repository(options.positional[0]);
    auto catalog = MakeCatalog(settings);

    const auto diagnostics = catalog->LoadFrom(repository);
    for (const auto& diagnostic : diagnostics) {
        m_err << diagnostic.sourceId << ":" << diagnostic.message << "\n";
    }

    std::shared_ptr<const domain::rules::LinkedCatalog> linked;
    try {
        linked = catalog->Rebuild();
    } catch (const domain::rules::LinkError& e) {
        for (const auto& issue : e.issues()) {
            m_err << issue.ToString() << "\n";
        }
        return 1;
    }

    if (!diagnostics.empty()) {
        m_err << "[ScribeAuditCli] " << diagnostics.size() << " source(s) failed to parse" << std::endl;
        return 1;
    }

    m_out << "[ScribeAuditCli] " << linked->size() << " blocks from " << catalog->SourceIds().size()
          << " sources OK" << std::endl;
    return 0;
}

int ScribeAuditCli::RunPrint(const Options& options, const infrastructure::AuditSettings& settings) {
    const auto source = infrastructure::FileBlockRepository::ReadFile(options.positional[0]);

    domain::rules::BlockParser::Options parserOptions;
    parserOptions.maxNestingDepth = settings.maxNestingDepth;
    domain::rules::BlockParser parser(parserOptions);

    try {
        const auto parsed = parser.Parse(source.content, source.sourceId);
        m_out << domain::rules::RulePrinter::PrintBlocks(parsed.allBlocks());
    } catch (const domain::rules::SyntaxError& e) {
        m_err << source.sourceId << ":" << e.what() << "\n";
        return 1;
    }
    return 0;
}

int ScribeAuditCli::RunAudit(const Options& options, const infrastructure::AuditSettings& settings) {
    infrastructure::FileBlockRepository repository(options.positional[0]);
    auto catalog = MakeCatalog(settings);

    const auto diagnostics = catalog->LoadFrom(repository);
    for (const auto& diagnostic : diagnostics) {
        m_err << diagnostic.sourceId << ":" << diagnostic.message << "\n";
    }
    if (!diagnostics.empty()) {
        return 1;
    }
    catalog->Rebuild();

    const auto transcripts = infrastructure::TranscriptLoader::LoadBatchFile(options.positional[1]);
    const std::vector<std::string> blockIds(options.positional.begin() + 2, options.positional.end());

    application::AuditService service(catalog, settings.evaluation);
    const auto reports = transcripts.size() == 1
        ? std::vector<domain::audit::AuditReport>{service.Audit(transcripts.front(), blockIds)}
        : service.AuditBatch(transcripts, blockIds);

    const auto format = options.format == "markdown" ? application::ReportFormat::Markdown
                                                     : application::ReportFormat::Json;

    if (options.writeToStore) {
        infrastructure::ReportStore store(settings.reportsDir);
        for (const auto& report : reports) {
            const std::string name = infrastructure::ReportStore::FileNameFor(
                report.studentId, application::ReportFormatExtension(format));
            const std::string path = store.saveAsync(name, application::ReportExportService::Render(report, format));
            if (settings.verbose) {
                m_out << "[ScribeAuditCli] Writing " << path << std::endl;
            }
        }
        store.stop();
        if (store.failureCount() > 0) {
            m_err << "[ScribeAuditCli] " << store.failureCount() << " report(s) could not be written" << std::endl;
            return 1;
        }
        m_out << "[ScribeAuditCli] " << reports.size() << " report(s) written to " << store.reportsDir() << std::endl;
        return 0;
    }

    if (format == application::ReportFormat::Json && reports.size() > 1) {
        nlohmann::json all = nlohmann::json::array();
        for (const auto& report : reports) all.push_back(application::ReportExportService::ToJson(report));
        m_out << all.dump(2) << std::endl;
    } else {
        for (const auto& report : reports) {
            m_out << application::ReportExportService::Render(report, format) << std::endl;
        }
    }
    return 0;
}

} // namespace scribeaudit::app
