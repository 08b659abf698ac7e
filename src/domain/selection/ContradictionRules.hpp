/**
 * @file ContradictionRules.hpp
 * @brief Declarative phrase-pair tables describing opposing preference axes.
 */

#pragma once

#include <string>
#include <vector>

namespace contextwallet::domain::selection {

/**
 * @struct ContradictionRule
 * @brief Fires when the memory side and the opposing side each contain one of their phrases.
 *
 * Phrases are lowercase and matched as substrings.
 */
struct ContradictionRule {
    std::string axis;                          ///< e.g. "price_quality", for diagnostics.
    std::vector<std::string> memoryPhrases;    ///< Looked up in the stored card text.
    std::vector<std::string> opposingPhrases;  ///< Looked up in the prompt / preference / rival card.

    bool matches(const std::string& memoryLower, const std::string& opposingLower) const;
};

using ContradictionRuleTable = std::vector<ContradictionRule>;

/**
 * @brief Card-versus-prompt table, in evaluation order.
 * Axes: price/quality, curated/many options, health/taste, durability,
 * brand loyalty/variety, planned/spontaneous.
 */
const ContradictionRuleTable& DefaultPromptContradictionRules();

/**
 * @brief Extracted-versus-profile table (price/quality and options quantity only).
 * Memory side is matched against the extracted card, opposing side against the profile card.
 */
const ContradictionRuleTable& DefaultArbitrationRules();

} // namespace contextwallet::domain::selection
