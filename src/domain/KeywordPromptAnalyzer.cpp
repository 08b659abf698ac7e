/**
 * @file KeywordPromptAnalyzer.cpp
 * @brief Implementation of KeywordPromptAnalyzer.
 */

#include "domain/KeywordPromptAnalyzer.hpp"
#include "domain/selection/TextTokens.hpp"

#include <unordered_set>

namespace contextwallet::domain {

namespace {
constexpr std::size_t kMinKeywordLength = 4;
constexpr const char* kFallbackIntent = "user request";
}

const std::vector<std::pair<std::string, std::vector<std::string>>>& KeywordPromptAnalyzer::DomainKeywords() {
    static const std::vector<std::pair<std::string, std::vector<std::string>>> table = {
        {"shopping", {"buy", "purchase", "price", "cost", "store", "shop", "product", "brand", "deal",
                      "discount", "order", "amazon", "review", "rating", "cheap", "expensive", "quality",
                      "return", "refund"}},
        {"eating", {"eat", "food", "restaurant", "meal", "cook", "recipe", "dinner", "lunch", "breakfast",
                    "snack", "hungry", "cuisine", "diet", "taste", "delicious"}},
        {"health", {"health", "fitness", "exercise", "workout", "gym", "doctor", "medical", "symptom",
                    "medicine", "sleep", "weight", "nutrition", "vitamin", "supplement"}},
        {"work", {"work", "job", "project", "meeting", "deadline", "email", "colleague", "office", "code",
                  "programming", "finance", "budget", "career", "boss", "salary"}},
    };
    return table;
}

PromptAnalysis KeywordPromptAnalyzer::analyze(const std::string& promptText) {
    return Analyze(promptText);
}

PromptAnalysis KeywordPromptAnalyzer::Analyze(const std::string& promptText) {
    const std::string promptLower = selection::ToLower(promptText);

    PromptAnalysis analysis;
    analysis.intent = kFallbackIntent;

    for (const auto& [domainName, keywords] : DomainKeywords()) {
        if (selection::ContainsAnyPhrase(promptLower, keywords)) {
            analysis.domains.push_back(domainName);
        }
    }
    if (analysis.domains.empty()) {
        analysis.domains.push_back("general");
    }
    // Response style applies to every prompt.
    analysis.domains.push_back("communication");
    analysis.domains.push_back("personality");

    std::unordered_set<std::string> seen;
    for (const auto& word : selection::Tokenize(promptText)) {
        if (word.size() < kMinKeywordLength) continue;
        if (seen.insert(word).second) {
            analysis.keywords.push_back(word);
        }
    }
    return analysis;
}

} // namespace contextwallet::domain
