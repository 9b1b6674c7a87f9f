/**
 * @file BlockCatalogService.cpp
 * @brief Implementation of BlockCatalogService.
 */

#include "application/BlockCatalogService.hpp"

#include <functional>
#include <iostream>
#include <mutex>

namespace scribeaudit::application {

using domain::Block;
using domain::rules::LinkedCatalog;

BlockCatalogService::BlockCatalogService(domain::rules::BlockParser::Options options, bool verbose)
    : m_parser(options), m_verbose(verbose) {}

std::string BlockCatalogService::ComputeSourceHash(const std::string& text) {
    return std::to_string(std::hash<std::string>{}(text));
}

bool BlockCatalogService::Upsert(const std::string& sourceId, const std::string& text) {
    const std::string hash = ComputeSourceHash(text);
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_sources.find(sourceId);
        if (it != m_sources.end() && it->second.hash == hash) {
            return false;
        }
    }

    // Parsing touches no shared state, so it runs outside the lock.
    domain::rules::ParsedSource parsed;
    try {
        parsed = m_parser.Parse(text, sourceId);
    } catch (const domain::rules::SyntaxError& e) {
        std::cerr << "[BlockCatalogService] " << sourceId << ":" << e.what() << std::endl;
        throw;
    }

    SourceEntry entry;
    entry.hash = hash;
    for (auto& block : parsed.allBlocks()) {
        block.sourceHash = hash;
        entry.blocks.push_back(std::make_shared<const Block>(std::move(block)));
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_sources[sourceId] = std::move(entry);
    ++m_parseCount;
    if (m_verbose) {
        std::cout << "[BlockCatalogService] Parsed " << sourceId << std::endl;
    }
    return true;
}

bool BlockCatalogService::Remove(const std::string& sourceId) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    return m_sources.erase(sourceId) > 0;
}

std::vector<SourceDiagnostic> BlockCatalogService::LoadFrom(domain::BlockRepository& repository) {
    std::vector<SourceDiagnostic> diagnostics;
    for (const auto& source : repository.fetchSources()) {
        try {
            Upsert(source.sourceId, source.content);
        } catch (const domain::rules::SyntaxError& e) {
            diagnostics.push_back({source.sourceId, e.what()});
        }
    }
    return diagnostics;
}

std::shared_ptr<const LinkedCatalog> BlockCatalogService::Rebuild() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);

    std::vector<std::shared_ptr<const Block>> blocks;
    for (const auto& [sourceId, entry] : m_sources) {
        blocks.insert(blocks.end(), entry.blocks.begin(), entry.blocks.end());
    }

    try {
        m_snapshot = domain::rules::BlockLinker::Link(std::move(blocks));
    } catch (const domain::rules::LinkError& e) {
        std::cerr << "[BlockCatalogService] " << e.what() << std::endl;
        throw;
    }

    if (m_verbose) {
        std::cout << "[BlockCatalogService] Linked " << m_snapshot->size() << " blocks from "
                  << m_sources.size() << " sources" << std::endl;
    }
    return m_snapshot;
}

std::shared_ptr<const LinkedCatalog> BlockCatalogService::Snapshot() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_snapshot;
}

std::vector<std::string> BlockCatalogService::SourceIds() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<std::string> ids;
    for (const auto& [sourceId, entry] : m_sources) {
        ids.push_back(sourceId);
    }
    return ids;
}

std::size_t BlockCatalogService::ParseCount() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_parseCount;
}

} // namespace scribeaudit::application
