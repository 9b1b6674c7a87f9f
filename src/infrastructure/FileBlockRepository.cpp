/**
 * @file FileBlockRepository.cpp
 * @brief Implementation of FileBlockRepository.
 */

#include "infrastructure/FileBlockRepository.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace scribeaudit::infrastructure {

namespace fs = std::filesystem;

FileBlockRepository::FileBlockRepository(const std::string& blocksPath) : m_blocksPath(blocksPath) {}

domain::BlockSource FileBlockRepository::ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open block file " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return domain::BlockSource{fs::path(path).filename().string(), buffer.str()};
}

std::vector<domain::BlockSource> FileBlockRepository::fetchSources() {
    if (!fs::is_directory(m_blocksPath)) {
        throw std::runtime_error("blocks directory not found: " + m_blocksPath);
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(m_blocksPath)) {
        if (entry.is_regular_file()) {
            std::string ext = entry.path().extension().string();
            std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });
            if (ext == ".block") {
                files.push_back(entry.path());
            }
        }
    }
    std::sort(files.begin(), files.end());

    std::vector<domain::BlockSource> sources;
    for (const auto& file : files) {
        sources.push_back(ReadFile(file.string()));
    }
    return sources;
}

std::optional<domain::BlockSource> FileBlockRepository::fetchSource(const std::string& sourceId) {
    fs::path file = fs::path(m_blocksPath) / sourceId;
    if (!fs::is_regular_file(file)) {
        return std::nullopt;
    }
    return ReadFile(file.string());
}

} // namespace scribeaudit::infrastructure
