/**
 * @file EvaluationPolicy.hpp
 * @brief Tunable choices the evaluator makes when several allocations are valid.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/Course.hpp"

namespace scribeaudit::domain::audit {

/** @brief Which courses a Maximum rule gives back first when over its ceiling. */
enum class ReleaseOrder {
    MostRecentFirst,
    OldestFirst
};

/** @brief Which satisfied children of an ANY / N-of group are reported as counted. */
enum class GroupPreference {
    DeclaredOrder,
    MostCredits
};

inline std::string ReleaseOrderToString(ReleaseOrder order) {
    return order == ReleaseOrder::OldestFirst ? "oldest_first" : "most_recent_first";
}

inline std::optional<ReleaseOrder> ReleaseOrderFromString(const std::string& text) {
    if (text == "most_recent_first") return ReleaseOrder::MostRecentFirst;
    if (text == "oldest_first") return ReleaseOrder::OldestFirst;
    return std::nullopt;
}

inline std::string GroupPreferenceToString(GroupPreference preference) {
    return preference == GroupPreference::MostCredits ? "most_credits" : "declared_order";
}

inline std::optional<GroupPreference> GroupPreferenceFromString(const std::string& text) {
    if (text == "declared_order") return GroupPreference::DeclaredOrder;
    if (text == "most_credits") return GroupPreference::MostCredits;
    return std::nullopt;
}

struct EvaluationPolicy {
    ReleaseOrder releaseOrder = ReleaseOrder::MostRecentFirst;
    GroupPreference groupPreference = GroupPreference::DeclaredOrder;
    bool countInProgress = false;      ///< Allocate in-progress courses as if completed.
    bool passMeetsGradeFloor = true;   ///< Pass and Transfer satisfy any grade floor.
    TermCalendar calendar;
};

} // namespace scribeaudit::domain::audit
