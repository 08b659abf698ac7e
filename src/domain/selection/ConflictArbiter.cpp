/**
 * @file ConflictArbiter.cpp
 * @brief Implementation of ConflictArbiter.
 */

#include "domain/selection/ConflictArbiter.hpp"
#include "domain/selection/TextTokens.hpp"

#include <optional>

namespace contextwallet::domain::selection {

ConflictArbiter::ConflictArbiter()
    : m_rules(DefaultArbitrationRules()) {}

ConflictArbiter::ConflictArbiter(ContradictionRuleTable rules)
    : m_rules(std::move(rules)) {}

ArbitrationResult ConflictArbiter::arbitrate(const std::vector<ScoredCard>& scoredCards) const {
    struct ProfileText {
        const MemoryCard* card;
        std::string lower;
    };

    std::vector<ProfileText> profiles;
    for (const auto& scored : scoredCards) {
        if (scored.card.isProfile()) {
            profiles.push_back({&scored.card, ToLower(scored.card.text)});
        }
    }

    ArbitrationResult result;
    for (const auto& scored : scoredCards) {
        const MemoryCard& card = scored.card;
        if (!card.isExtractedOnly()) {
            result.kept.push_back(scored);
            continue;
        }

        const std::string extractedLower = ToLower(card.text);
        std::optional<ArbitrationDrop> drop;
        for (const auto& profile : profiles) {
            for (const auto& rule : m_rules) {
                if (rule.matches(extractedLower, profile.lower)) {
                    drop = ArbitrationDrop{card.id, profile.card->id, rule.axis};
                    break;
                }
            }
            if (drop) break;
        }

        if (drop) {
            result.dropped.push_back(*drop);
        } else {
            result.kept.push_back(scored);
        }
    }
    return result;
}

} // namespace contextwallet::domain::selection
