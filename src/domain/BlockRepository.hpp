/**
 * @file BlockRepository.hpp
 * @brief Interface for retrieval of block definition sources.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace scribeaudit::domain {

/**
 * @struct BlockSource
 * @brief Raw block definition text and where it came from.
 */
struct BlockSource {
    std::string sourceId; ///< Stable identifier, e.g. the file name.
    std::string content;  ///< Source text in the block rule language.
};

/**
 * @class BlockRepository
 * @brief Abstract interface for stored block definitions.
 */
class BlockRepository {
public:
    virtual ~BlockRepository() = default;

    /** @brief Fetches every block source, ordered by source id. */
    virtual std::vector<BlockSource> fetchSources() = 0;

    /** @brief Fetches one source, or nullopt when it does not exist. */
    virtual std::optional<BlockSource> fetchSource(const std::string& sourceId) = 0;
};

} // namespace scribeaudit::domain
