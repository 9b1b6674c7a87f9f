#include "domain/audit/AllocationState.hpp"

#include <stdexcept>

namespace scribeaudit::domain::audit {

std::uint64_t AllocationState::consume(std::size_t index, const std::string& blockId, rules::NodeId node) {
    auto& slot = m_owners.at(index);
    if (slot) {
        throw std::logic_error("transcript entry " + std::to_string(index) + " already allocated to block " +
                               slot->blockId);
    }
    slot = Allocation{blockId, node, m_nextSequence++};
    return slot->sequence;
}

void AllocationState::release(std::size_t index) {
    m_owners.at(index).reset();
}

std::vector<std::size_t> AllocationState::unconsumed() const {
    std::vector<std::size_t> free;
    for (std::size_t i = 0; i < m_owners.size(); ++i) {
        if (!m_owners[i]) free.push_back(i);
    }
    return free;
}

std::size_t AllocationState::consumedCount() const {
    std::size_t count = 0;
    for (const auto& slot : m_owners) {
        if (slot) ++count;
    }
    return count;
}

} // namespace scribeaudit::domain::audit
