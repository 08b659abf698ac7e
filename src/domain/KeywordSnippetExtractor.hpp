/**
 * @file KeywordSnippetExtractor.hpp
 * @brief Deterministic keyword extraction of conversation snippets. Always available.
 */

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace contextwallet::domain {

/**
 * @struct CategorySnippet
 * @brief Sentences of a conversation that mention one life category.
 */
struct CategorySnippet {
    std::string category;    ///< "Shopping", "Eating", "Health" or "Work".
    std::string subcategory; ///< Work only: "Finance", "Coding", "Projects" or "Meetings".
    std::string text;
    float confidence = 0.7f;
};

/**
 * @class KeywordSnippetExtractor
 * @brief Fallback of the tuple extractor when no language model answers.
 *
 * Each category whose keywords occur anywhere in the lowercased text yields
 * one snippet made of the first two sentences (split on '.') that mention it.
 */
class KeywordSnippetExtractor {
public:
    static std::vector<CategorySnippet> Extract(const std::string& conversationText);

    /**
     * @brief Up to two trimmed sentences containing a keyword, joined by ". ".
     * Falls back to the first 200 characters when no sentence matches.
     */
    static std::string RelevantSnippet(const std::string& text, const std::vector<std::string>& keywords);

    static std::string WorkSubcategoryFor(const std::string& snippet);

    /** @brief Category name and its keywords, in evaluation order. */
    static const std::vector<std::pair<std::string, std::vector<std::string>>>& CategoryKeywords();
};

} // namespace contextwallet::domain
