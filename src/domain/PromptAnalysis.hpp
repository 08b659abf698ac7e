/**
 * @file PromptAnalysis.hpp
 * @brief Value Object holding the structured reading of a draft prompt.
 */

#pragma once

#include <string>
#include <vector>

namespace contextwallet::domain {

/**
 * @struct PromptAnalysis
 * @brief Output contract of every prompt analyzer. Owned by a single selection call.
 */
struct PromptAnalysis {
    std::string intent;                           ///< Short description of what the user wants.
    std::vector<std::string> domains;             ///< Topic labels relevant to the prompt.
    std::vector<std::string> explicitPreferences; ///< Statements that locally override stored memory.
    std::vector<std::string> keywords;            ///< Content words used for lexical overlap.
};

} // namespace contextwallet::domain
