/**
 * @file AllocationState.hpp
 * @brief Per-run record of which rule node owns each transcript entry.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "domain/rules/Rule.hpp"

namespace scribeaudit::domain::audit {

struct Allocation {
    std::string blockId;
    rules::NodeId node = 0;
    std::uint64_t sequence = 0; ///< Order of consumption within the run.
};

/**
 * @class AllocationState
 * @brief Mutable allocation of one audit run. Never shared between runs.
 */
class AllocationState {
public:
    explicit AllocationState(std::size_t courseCount) : m_owners(courseCount) {}

    std::size_t size() const { return m_owners.size(); }
    bool isConsumed(std::size_t index) const { return m_owners.at(index).has_value(); }
    const std::optional<Allocation>& owner(std::size_t index) const { return m_owners.at(index); }

    /** @throws std::logic_error if the entry is already owned. */
    std::uint64_t consume(std::size_t index, const std::string& blockId, rules::NodeId node);

    /** @brief Returns the entry to the pool; a no-op for free entries. */
    void release(std::size_t index);

    /** @brief Indices of entries nobody owns, ascending. */
    std::vector<std::size_t> unconsumed() const;

    std::size_t consumedCount() const;

private:
    std::vector<std::optional<Allocation>> m_owners;
    std::uint64_t m_nextSequence = 1;
};

} // namespace scribeaudit::domain::audit
