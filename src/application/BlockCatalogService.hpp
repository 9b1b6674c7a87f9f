/**
 * @file BlockCatalogService.hpp
 * @brief Parse cache for block sources and publisher of linked catalog snapshots.
 */

#pragma once

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "domain/BlockRepository.hpp"
#include "domain/rules/BlockLinker.hpp"
#include "domain/rules/BlockParser.hpp"

namespace scribeaudit::application {

/**
 * @struct SourceDiagnostic
 * @brief A source that failed to parse, with the error text.
 */
struct SourceDiagnostic {
    std::string sourceId;
    std::string message;
};

/**
 * @class BlockCatalogService
 * @brief Keeps the last good parse of every block source and links them on demand.
 *
 * Sources are re-parsed only when their content hash changes. Writers
 * (Upsert, Remove, Rebuild) take the lock exclusively; readers share it.
 * Published snapshots are immutable and stay valid after later rebuilds.
 */
class BlockCatalogService {
public:
    explicit BlockCatalogService(domain::rules::BlockParser::Options options = {}, bool verbose = false);

    /**
     * @brief Adds or replaces a source.
     * @return True if the text was parsed, false if the cached parse was reused.
     * @throws LexError, ParseError; the previous parse of this source stays in place.
     */
    bool Upsert(const std::string& sourceId, const std::string& text);

    /** @brief Forgets a source. Returns false when it was not known. */
    bool Remove(const std::string& sourceId);

    /**
     * @brief Upserts every source of a repository.
     * @return Sources that failed to parse; the others are loaded regardless.
     */
    std::vector<SourceDiagnostic> LoadFrom(domain::BlockRepository& repository);

    /**
     * @brief Links all parsed blocks and publishes the result.
     * @throws LinkError; the previous snapshot stays published.
     */
    std::shared_ptr<const domain::rules::LinkedCatalog> Rebuild();

    /** @brief Last published snapshot, or nullptr before the first successful Rebuild. */
    std::shared_ptr<const domain::rules::LinkedCatalog> Snapshot() const;

    std::vector<std::string> SourceIds() const;

    /** @brief Number of parses performed so far (cache misses). */
    std::size_t ParseCount() const;

    /** @brief Content hash of a source text. */
    static std::string ComputeSourceHash(const std::string& text);

private:
    struct SourceEntry {
        std::string hash;
        std::vector<std::shared_ptr<const domain::Block>> blocks;
    };

    domain::rules::BlockParser m_parser;
    bool m_verbose;

    mutable std::shared_mutex m_mutex;
    std::map<std::string, SourceEntry> m_sources;
    std::shared_ptr<const domain::rules::LinkedCatalog> m_snapshot;
    std::size_t m_parseCount = 0;
};

} // namespace scribeaudit::application
