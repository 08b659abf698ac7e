/**
 * @file ContradictionDetector.cpp
 * @brief Implementation of ContradictionDetector.
 */

#include "domain/selection/ContradictionDetector.hpp"
#include "domain/selection/TextTokens.hpp"

namespace contextwallet::domain::selection {

ContradictionDetector::ContradictionDetector()
    : m_rules(DefaultPromptContradictionRules()) {}

ContradictionDetector::ContradictionDetector(ContradictionRuleTable rules)
    : m_rules(std::move(rules)) {}

bool ContradictionDetector::conflicts(const std::string& cardText,
                                      const std::string& promptText,
                                      const std::vector<std::string>& explicitPreferences) const {
    return findConflict(cardText, promptText, explicitPreferences).has_value();
}

std::optional<ContradictionMatch> ContradictionDetector::findConflict(
    const std::string& cardText,
    const std::string& promptText,
    const std::vector<std::string>& explicitPreferences) const {
    const std::string memoryLower = ToLower(cardText);

    if (auto index = firstMatchingRule(memoryLower, ToLower(promptText))) {
        return ContradictionMatch{m_rules[*index].axis, *index, false, promptText};
    }

    for (const auto& preference : explicitPreferences) {
        if (auto index = firstMatchingRule(memoryLower, ToLower(preference))) {
            return ContradictionMatch{m_rules[*index].axis, *index, true, preference};
        }
    }
    return std::nullopt;
}

std::optional<std::size_t> ContradictionDetector::firstMatchingRule(const std::string& memoryLower,
                                                                    const std::string& opposingLower) const {
    for (std::size_t i = 0; i < m_rules.size(); ++i) {
        if (m_rules[i].matches(memoryLower, opposingLower)) return i;
    }
    return std::nullopt;
}

} // namespace contextwallet::domain::selection
