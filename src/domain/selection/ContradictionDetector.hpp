/**
 * @file ContradictionDetector.hpp
 * @brief Hard veto of cards that contradict what the user is asking for right now.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "domain/selection/ContradictionRules.hpp"

namespace contextwallet::domain::selection {

/**
 * @struct ContradictionMatch
 * @brief First rule that fired, and against which text.
 */
struct ContradictionMatch {
    std::string axis;
    std::size_t ruleIndex = 0;
    bool fromExplicitPreference = false;
    std::string opposingText; ///< The prompt, or the explicit preference that fired.
};

/**
 * @class ContradictionDetector
 * @brief Evaluates a rule table between a card and the prompt / explicit preferences.
 *
 * Rules are evaluated in table order and the first match wins. The prompt is
 * checked before the explicit preferences.
 */
class ContradictionDetector {
public:
    ContradictionDetector();
    explicit ContradictionDetector(ContradictionRuleTable rules);

    bool conflicts(const std::string& cardText,
                   const std::string& promptText,
                   const std::vector<std::string>& explicitPreferences) const;

    std::optional<ContradictionMatch> findConflict(const std::string& cardText,
                                                   const std::string& promptText,
                                                   const std::vector<std::string>& explicitPreferences) const;

    const ContradictionRuleTable& rules() const { return m_rules; }

private:
    std::optional<std::size_t> firstMatchingRule(const std::string& memoryLower,
                                                 const std::string& opposingLower) const;

    ContradictionRuleTable m_rules;
};

} // namespace contextwallet::domain::selection
