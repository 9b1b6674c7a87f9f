/**
 * @file Block.hpp
 * @brief Domain entity for a named degree requirement block.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/rules/Rule.hpp"

namespace scribeaudit::domain {

enum class BlockType {
    Major,
    Minor,
    Core,
    Other
};

inline std::string BlockTypeToString(BlockType type) {
    switch (type) {
        case BlockType::Major: return "major";
        case BlockType::Minor: return "minor";
        case BlockType::Core: return "core";
        case BlockType::Other: return "other";
        default: return "other";
    }
}

inline std::optional<BlockType> BlockTypeFromString(const std::string& text) {
    if (text == "major") return BlockType::Major;
    if (text == "minor") return BlockType::Minor;
    if (text == "core") return BlockType::Core;
    if (text == "other") return BlockType::Other;
    return std::nullopt;
}

/**
 * @struct Block
 * @brief A parsed block: metadata plus its immutable rule tree.
 */
struct Block {
    std::string id;                  ///< Block identifier used by references, e.g. "CS-MAJOR".
    std::string title;               ///< Display title; defaults to the id.
    BlockType type = BlockType::Other;
    rules::RuleTree rules;
    rules::SourcePosition position;  ///< Position of the 'block' header.
    std::string sourceId;            ///< Source the block was parsed from (file name or caller id).
    std::string sourceHash;          ///< Content hash of that source text.
};

} // namespace scribeaudit::domain
