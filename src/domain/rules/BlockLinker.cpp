/**
 * @file BlockLinker.cpp
 * @brief Implementation of BlockLinker.
 */

#include "domain/rules/BlockLinker.hpp"

#include <algorithm>
#include <functional>
#include <set>

namespace scribeaudit::domain::rules {

const Block* LinkedCatalog::find(const std::string& blockId) const {
    auto it = m_index.find(blockId);
    if (it == m_index.end()) return nullptr;
    return m_blocks[it->second].get();
}

std::vector<BlockReferenceSite> BlockLinker::ReferencesOf(const Block& block) {
    std::vector<BlockReferenceSite> sites;
    for (const auto& node : block.rules.nodes()) {
        if (node.kind() == RuleKind::BlockReference) {
            const auto& ref = std::get<BlockReferenceRule>(node.body);
            sites.push_back({ref.blockId, ref.policy, node.position});
        }
    }
    return sites;
}

std::shared_ptr<const LinkedCatalog> BlockLinker::Link(std::vector<std::shared_ptr<const Block>> blocks) {
    auto catalog = std::make_shared<LinkedCatalog>();
    std::vector<LinkIssue> issues;

    for (auto& block : blocks) {
        if (!block) continue;
        if (catalog->m_index.count(block->id)) {
            issues.push_back({LinkIssue::Kind::DuplicateBlock, block->id, block->id, block->position, {}});
            continue;
        }
        catalog->m_index[block->id] = catalog->m_blocks.size();
        catalog->m_blocks.push_back(std::move(block));
    }

    // Adjacency by catalog index; missing targets are reported and left out of the graph.
    std::vector<std::vector<std::size_t>> edges(catalog->m_blocks.size());
    for (std::size_t i = 0; i < catalog->m_blocks.size(); ++i) {
        const Block& block = *catalog->m_blocks[i];
        for (const auto& site : ReferencesOf(block)) {
            auto it = catalog->m_index.find(site.target);
            if (it == catalog->m_index.end()) {
                issues.push_back({LinkIssue::Kind::MissingBlock, block.id, site.target, site.position, {}});
            } else {
                edges[i].push_back(it->second);
            }
        }
    }

    // Depth-first search with colors; every back edge closes one cycle.
    enum class Color { White, Grey, Black };
    std::vector<Color> color(catalog->m_blocks.size(), Color::White);
    std::vector<std::size_t> stack;
    std::set<std::vector<std::string>> reportedCycles;

    std::function<void(std::size_t)> visit = [&](std::size_t u) {
        color[u] = Color::Grey;
        stack.push_back(u);
        for (std::size_t v : edges[u]) {
            if (color[v] == Color::White) {
                visit(v);
            } else if (color[v] == Color::Grey) {
                auto from = std::find(stack.begin(), stack.end(), v);
                std::vector<std::string> cycle;
                for (auto it = from; it != stack.end(); ++it) {
                    cycle.push_back(catalog->m_blocks[*it]->id);
                }
                // Canonical rotation so the same cycle is reported once.
                auto smallest = std::min_element(cycle.begin(), cycle.end());
                std::rotate(cycle.begin(), smallest, cycle.end());
                if (reportedCycles.insert(cycle).second) {
                    const Block& owner = *catalog->m_blocks[u];
                    SourcePosition where = owner.position;
                    for (const auto& site : ReferencesOf(owner)) {
                        if (site.target == catalog->m_blocks[v]->id) {
                            where = site.position;
                            break;
                        }
                    }
                    cycle.push_back(cycle.front());
                    issues.push_back({LinkIssue::Kind::CycleDetected, owner.id,
                                      catalog->m_blocks[v]->id, where, cycle});
                }
            }
        }
        stack.pop_back();
        color[u] = Color::Black;
    };

    for (std::size_t i = 0; i < catalog->m_blocks.size(); ++i) {
        if (color[i] == Color::White) visit(i);
    }

    if (!issues.empty()) {
        throw LinkError(std::move(issues));
    }
    return catalog;
}

} // namespace scribeaudit::domain::rules
