/**
 * @file BlockLinker.hpp
 * @brief Resolves block references over a set of parsed blocks.
 */

#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "domain/Block.hpp"

namespace scribeaudit::domain::rules {

/**
 * @class LinkedCatalog
 * @brief Immutable set of blocks whose references all resolve and form no cycle.
 *
 * Shared read-only by concurrent audit runs.
 */
class LinkedCatalog {
public:
    /** @brief Returns the block with the given id, or nullptr. */
    const Block* find(const std::string& blockId) const;

    const std::vector<std::shared_ptr<const Block>>& blocks() const { return m_blocks; }
    std::size_t size() const { return m_blocks.size(); }

private:
    friend class BlockLinker;

    std::vector<std::shared_ptr<const Block>> m_blocks;
    std::unordered_map<std::string, std::size_t> m_index;
};

/**
 * @struct BlockReferenceSite
 * @brief A BlockReference node found inside a block.
 */
struct BlockReferenceSite {
    std::string target;
    SharePolicy policy;
    SourcePosition position;
};

class BlockLinker {
public:
    /**
     * @brief Links a set of blocks.
     * @throws LinkError listing every missing target, duplicate id and cycle.
     */
    static std::shared_ptr<const LinkedCatalog> Link(std::vector<std::shared_ptr<const Block>> blocks);

    /** @brief All references made by a block, in node order. */
    static std::vector<BlockReferenceSite> ReferencesOf(const Block& block);
};

} // namespace scribeaudit::domain::rules
