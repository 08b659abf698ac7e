/**
 * @file PackFormatter.cpp
 * @brief Implementation of PackFormatter.
 */

#include "domain/selection/PackFormatter.hpp"

#include <array>
#include <sstream>
#include <utility>

namespace contextwallet::domain::selection {

namespace {

constexpr const char* kPackHeader = "--- PERSONAL CONTEXT ---";
constexpr const char* kPackFooter = "--- END PERSONAL CONTEXT ---";
constexpr const char* kBullet = "• ";
constexpr const char* kHardMarker = " [HARD]";

const std::array<std::pair<CardType, const char*>, 4>& GroupOrder() {
    static const std::array<std::pair<CardType, const char*>, 4> groups = {{
        {CardType::Constraint, "CONSTRAINTS:"},
        {CardType::Preference, "PREFERENCES:"},
        {CardType::Goal, "GOALS:"},
        {CardType::Capability, "CAPABILITIES:"},
    }};
    return groups;
}

} // namespace

Selection PackFormatter::select(const std::vector<ScoredCard>& ordered, int maxCards) const {
    Selection selection;
    const std::size_t cap = maxCards > 0 ? static_cast<std::size_t>(maxCards) : 0;
    for (std::size_t i = 0; i < ordered.size(); ++i) {
        if (i < cap) {
            selection.selected.push_back(ordered[i]);
        } else {
            selection.overflow.push_back(ordered[i]);
        }
    }
    return selection;
}

std::string PackFormatter::render(const std::vector<MemoryCard>& cards) const {
    if (cards.empty()) return "";

    std::stringstream ss;
    ss << kPackHeader << "\n\n";

    for (const auto& [type, title] : GroupOrder()) {
        bool headerWritten = false;
        for (const auto& card : cards) {
            if (card.type != type) continue;
            if (!headerWritten) {
                ss << title << "\n";
                headerWritten = true;
            }
            ss << kBullet << card.text;
            if (card.isHardConstraint()) ss << kHardMarker;
            ss << "\n";
        }
        if (headerWritten) ss << "\n";
    }

    ss << kPackFooter;
    return ss.str();
}

} // namespace contextwallet::domain::selection
