/**
 * @file KeywordSnippetExtractor.cpp
 * @brief Implementation of KeywordSnippetExtractor.
 */

#include "domain/KeywordSnippetExtractor.hpp"
#include "domain/selection/TextTokens.hpp"

namespace contextwallet::domain {

namespace {

constexpr std::size_t kMaxSnippetSentences = 2;
constexpr std::size_t kUnmatchedSnippetLength = 200;
constexpr const char* kWorkCategory = "Work";

std::string Trim(const std::string& text) {
    const char* whitespace = " \t\n\r\f\v";
    const auto first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) return "";
    const auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

} // namespace

const std::vector<std::pair<std::string, std::vector<std::string>>>& KeywordSnippetExtractor::CategoryKeywords() {
    static const std::vector<std::pair<std::string, std::vector<std::string>>> table = {
        {"Shopping", {"buy", "purchase", "shop", "order", "product", "price", "cost", "budget", "shopping"}},
        {"Eating", {"restaurant", "food", "meal", "dinner", "lunch", "breakfast", "eat", "dining", "cuisine",
                    "diet"}},
        {"Health", {"health", "fitness", "exercise", "workout", "medical", "doctor", "symptom", "medication",
                    "supplement"}},
        {kWorkCategory, {"work", "project", "code", "programming", "meeting", "finance", "budget", "deadline",
                         "task"}},
    };
    return table;
}

std::string KeywordSnippetExtractor::RelevantSnippet(const std::string& text, const std::vector<std::string>& keywords) {
    std::vector<std::string> sentences;
    std::size_t start = 0;
    while (start <= text.size() && sentences.size() < kMaxSnippetSentences) {
        std::size_t end = text.find('.', start);
        if (end == std::string::npos) end = text.size();
        const std::string sentence = text.substr(start, end - start);
        if (selection::ContainsAnyPhrase(selection::ToLower(sentence), keywords)) {
            sentences.push_back(Trim(sentence));
        }
        start = end + 1;
    }

    if (sentences.empty()) {
        return text.substr(0, kUnmatchedSnippetLength);
    }
    std::string joined = sentences.front();
    for (std::size_t i = 1; i < sentences.size(); ++i) {
        joined += ". " + sentences[i];
    }
    return joined;
}

std::string KeywordSnippetExtractor::WorkSubcategoryFor(const std::string& snippet) {
    const std::string lower = selection::ToLower(snippet);
    if (selection::ContainsAnyPhrase(lower, {"finance", "budget", "money", "cost", "expense"})) return "Finance";
    if (selection::ContainsAnyPhrase(lower, {"code", "programming", "language", "function", "algorithm"})) return "Coding";
    if (selection::ContainsAnyPhrase(lower, {"project", "task", "deadline", "deliverable"})) return "Projects";
    if (selection::ContainsAnyPhrase(lower, {"meeting", "call", "schedule", "calendar"})) return "Meetings";
    return "Projects";
}

std::vector<CategorySnippet> KeywordSnippetExtractor::Extract(const std::string& conversationText) {
    const std::string lower = selection::ToLower(conversationText);

    std::vector<CategorySnippet> snippets;
    for (const auto& [category, keywords] : CategoryKeywords()) {
        if (!selection::ContainsAnyPhrase(lower, keywords)) continue;

        CategorySnippet snippet;
        snippet.category = category;
        snippet.text = RelevantSnippet(conversationText, keywords);
        if (category == kWorkCategory) {
            snippet.subcategory = WorkSubcategoryFor(snippet.text);
        }
        snippets.push_back(std::move(snippet));
    }
    return snippets;
}

} // namespace contextwallet::domain
