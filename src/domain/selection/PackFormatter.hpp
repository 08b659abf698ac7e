/**
 * @file PackFormatter.hpp
 * @brief Truncation of the arbitrated list and rendering of the context block.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/ContextPack.hpp"

namespace contextwallet::domain::selection {

struct Selection {
    std::vector<ScoredCard> selected; ///< Prefix of the input, at most maxCards long.
    std::vector<ScoredCard> overflow; ///< Eligible cards cut by the cap.
};

/**
 * @class PackFormatter
 * @brief Selects the top of an already ordered list and renders it grouped by card type.
 */
class PackFormatter {
public:
    /**
     * @brief Takes the first min(size, maxCards) entries. No re-ranking.
     * @param ordered Score-ordered, arbitrated cards.
     * @param maxCards Cap; zero or negative selects nothing.
     */
    Selection select(const std::vector<ScoredCard>& ordered, int maxCards) const;

    /**
     * @brief Renders constraints, preferences, goals and capabilities in that order.
     *
     * Empty groups are omitted and hard constraints get a " [HARD]" marker.
     * Within a group the input order is kept. An empty input renders as "".
     */
    std::string render(const std::vector<MemoryCard>& cards) const;
};

} // namespace contextwallet::domain::selection
