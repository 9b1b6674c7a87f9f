/**
 * @file FileBlockRepository.hpp
 * @brief Filesystem-based implementation of the BlockRepository.
 */

#pragma once

#include <string>

#include "domain/BlockRepository.hpp"

namespace scribeaudit::infrastructure {

/**
 * @class FileBlockRepository
 * @brief Reads every *.block file of one directory; the file name is the source id.
 */
class FileBlockRepository : public domain::BlockRepository {
public:
    explicit FileBlockRepository(const std::string& blocksPath);

    /** @brief Lists *.block files sorted by name. @throws std::runtime_error if the directory is missing. */
    std::vector<domain::BlockSource> fetchSources() override;

    std::optional<domain::BlockSource> fetchSource(const std::string& sourceId) override;

    /** @brief Reads one file as a source. @throws std::runtime_error when unreadable. */
    static domain::BlockSource ReadFile(const std::string& path);

private:
    std::string m_blocksPath; ///< Directory holding the block files.
};

} // namespace scribeaudit::infrastructure
