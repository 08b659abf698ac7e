/**
 * @file RelevanceScorer.hpp
 * @brief Multi-signal heuristic relevance of a memory card to a draft prompt.
 */

#pragma once

#include <string>
#include "domain/MemoryCard.hpp"
#include "domain/PromptAnalysis.hpp"

namespace contextwallet::domain::selection {

/**
 * @struct ScoringWeights
 * @brief Empirical constants of the additive score. Not calibrated against usage data.
 */
struct ScoringWeights {
    float profileBoost = 0.30f;
    float domainOverlapWeight = 0.40f;
    float conversationalDomainBonus = 0.35f; ///< "communication" / "personality" cards.
    float lexicalMatchBonus = 0.45f;         ///< Per prompt word found in the card text.
    float lexicalMatchCap = 0.80f;
    float keywordMatchBonus = 0.08f;
    float keywordMatchCap = 0.25f;
    float constraintBonus = 0.20f;
    float hardConstraintBonus = 0.15f;
    float extractedDamping = 0.90f;          ///< Applied to "extracted" cards lacking "profile".
};

/**
 * @class RelevanceScorer
 * @brief Sums independent signals and clamps the result to [0, 1].
 *
 * Signals saturate instead of multiplying: they are heuristics, not
 * independent probabilities.
 */
class RelevanceScorer {
public:
    RelevanceScorer() = default;
    explicit RelevanceScorer(ScoringWeights weights);

    float score(const MemoryCard& card, const PromptAnalysis& analysis, const std::string& promptText) const;

    /** @brief Number of distinct prompt content words present in the card text. */
    static int CountLexicalMatches(const std::string& promptText, const std::string& cardText);

private:
    float domainSignal(const MemoryCard& card, const PromptAnalysis& analysis) const;
    float keywordSignal(const MemoryCard& card, const PromptAnalysis& analysis) const;

    ScoringWeights m_weights;
};

} // namespace contextwallet::domain::selection
