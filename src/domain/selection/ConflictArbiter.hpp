/**
 * @file ConflictArbiter.hpp
 * @brief Card-versus-card conflict resolution: profile answers outrank mined facts.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/ContextPack.hpp"
#include "domain/selection/ContradictionRules.hpp"

namespace contextwallet::domain::selection {

struct ArbitrationDrop {
    std::string cardId;   ///< The extracted card that lost.
    std::string winnerId; ///< The profile card that contradicted it.
    std::string axis;
};

struct ArbitrationResult {
    std::vector<ScoredCard> kept; ///< Same relative order as the input.
    std::vector<ArbitrationDrop> dropped;
};

/**
 * @class ConflictArbiter
 * @brief Filters (never re-sorts) a score-ordered list.
 *
 * Profile cards are always kept. An extracted, non-profile card is dropped
 * when any profile card in the list contradicts it. Other cards pass through.
 */
class ConflictArbiter {
public:
    ConflictArbiter();
    explicit ConflictArbiter(ContradictionRuleTable rules);

    ArbitrationResult arbitrate(const std::vector<ScoredCard>& scoredCards) const;

private:
    ContradictionRuleTable m_rules;
};

} // namespace contextwallet::domain::selection
