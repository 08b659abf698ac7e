/**
 * @file ContradictionRules.cpp
 * @brief Default rule tables.
 */

#include "domain/selection/ContradictionRules.hpp"
#include "domain/selection/TextTokens.hpp"

namespace contextwallet::domain::selection {

bool ContradictionRule::matches(const std::string& memoryLower, const std::string& opposingLower) const {
    return ContainsAnyPhrase(memoryLower, memoryPhrases) && ContainsAnyPhrase(opposingLower, opposingPhrases);
}

const ContradictionRuleTable& DefaultPromptContradictionRules() {
    static const ContradictionRuleTable rules = {
        // Price
        {"price_quality",
         {"quality over", "prioritizes quality", "not the cheapest"},
         {"cheapest", "lowest price", "budget", "affordable", "cheap"}},
        {"price_quality",
         {"expensive", "premium", "luxury", "high-end"},
         {"cheapest", "budget", "affordable", "cheap", "save money"}},
        {"price_quality",
         {"cheap", "budget", "inexpensive", "affordable", "lowest price"},
         {"premium", "luxury", "best quality", "money is no object", "price doesn't matter"}},

        // Options
        {"options_quantity",
         {"few options", "curated", "best options picked"},
         {"many options", "lots of choices", "browse", "show me everything", "all options"}},
        {"options_quantity",
         {"browsing lots", "many alternatives", "explore options"},
         {"just pick one", "best option", "recommend one", "don't show me many"}},

        // Health / taste
        {"health_taste",
         {"health", "nutrition", "healthy"},
         {"taste", "comfort food", "indulgent", "delicious", "tasty"}},
        {"health_taste",
         {"taste", "comfort", "indulgent"},
         {"healthy", "nutritious", "diet", "low calorie"}},

        {"durability",
         {"durable", "long-lasting", "quality"},
         {"disposable", "temporary", "short-term", "one-time use"}},

        {"brand_loyalty",
         {"brand loyal", "stick to brands", "same brands"},
         {"try new", "different brands", "alternatives", "variety"}},

        {"planning",
         {"plans ahead", "decides before", "planned"},
         {"spontaneous", "browse", "discover", "just looking"}},
    };
    return rules;
}

const ContradictionRuleTable& DefaultArbitrationRules() {
    static const ContradictionRuleTable rules = {
        {"price_quality",
         {"cheapest", "cheap", "budget", "goal cheap"},
         {"quality over", "prioritizes quality", "not the cheapest"}},
        {"options_quantity",
         {"lots", "many"},
         {"few", "curated"}},
    };
    return rules;
}

} // namespace contextwallet::domain::selection
