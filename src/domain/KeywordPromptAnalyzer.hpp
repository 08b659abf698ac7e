/**
 * @file KeywordPromptAnalyzer.hpp
 * @brief Deterministic keyword-based prompt analysis. Always available.
 */

#pragma once

#include <string>
#include <utility>
#include <vector>
#include "PromptAnalyzer.hpp"

namespace contextwallet::domain {

/**
 * @class KeywordPromptAnalyzer
 * @brief Side-effect-free analyzer used directly or as the fallback of LLM-backed analyzers.
 *
 * Domains come from a fixed keyword map ("general" when nothing matched) and
 * always end with "communication" and "personality". Keywords are the prompt
 * words longer than three characters. Explicit preferences are never
 * produced: recognizing them requires language understanding.
 */
class KeywordPromptAnalyzer : public PromptAnalyzer {
public:
    PromptAnalysis analyze(const std::string& promptText) override;

    /** @brief Same as analyze(), usable without an instance. */
    static PromptAnalysis Analyze(const std::string& promptText);

    /** @brief Domain name and the substrings that select it, in evaluation order. */
    static const std::vector<std::pair<std::string, std::vector<std::string>>>& DomainKeywords();
};

} // namespace contextwallet::domain
