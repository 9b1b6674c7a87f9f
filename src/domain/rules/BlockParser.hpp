/**
 * @file BlockParser.hpp
 * @brief Recursive-descent parser turning block source text into rule trees.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/Block.hpp"

namespace scribeaudit::domain::rules {

/**
 * @struct ParsedSource
 * @brief Result of parsing one source text: its root block and any further blocks it defines.
 */
struct ParsedSource {
    Block root;
    std::vector<Block> subBlocks; ///< Flat table of named sub-blocks, in source order.

    /** @brief Root followed by the sub-blocks. */
    std::vector<Block> allBlocks() const {
        std::vector<Block> all;
        all.reserve(subBlocks.size() + 1);
        all.push_back(root);
        all.insert(all.end(), subBlocks.begin(), subBlocks.end());
        return all;
    }
};

/**
 * @class BlockParser
 * @brief Stateless parser for the block rule language.
 *
 * Grammar (abridged):
 * @code
 * block      := 'block' IDENT STRING? ('major'|'minor'|'core'|'other')? rule
 * rule       := ('label' STRING)? (group | courseset | maximum | conditional | blockref)
 * group      := ('all-of' | 'any-of' | NUMBER '-' 'of') '{' (rule ';'?)+ '}'
 * courseset  := 'courses' pattern (',' pattern)* clause*
 * maximum    := 'maximum' NUMBER ('courses'|'credits') rule
 * conditional:= 'if' predicate 'then' rule 'else' rule
 * blockref   := 'block-ref' IDENT ('exclusive'|'shared')?
 * @endcode
 */
class BlockParser {
public:
    struct Options {
        std::size_t maxNestingDepth = 64;
    };

    BlockParser() = default;
    explicit BlockParser(Options options) : m_options(options) {}

    /**
     * @brief Parses a complete source text.
     * @param source Block definition text.
     * @param sourceId Recorded on every produced block (file name or caller id).
     * @return The first block as root plus any further blocks.
     * @throws LexError, ParseError on malformed input; no partial result escapes.
     */
    ParsedSource Parse(const std::string& source, const std::string& sourceId = "") const;

private:
    Options m_options;
};

} // namespace scribeaudit::domain::rules
