/**
 * @file RelevanceScorer.cpp
 * @brief Implementation of RelevanceScorer.
 */

#include "domain/selection/RelevanceScorer.hpp"
#include "domain/selection/TextTokens.hpp"

#include <algorithm>
#include <unordered_set>

namespace contextwallet::domain::selection {

namespace {

constexpr std::size_t kMinPromptWordLength = 3;

const std::unordered_set<std::string>& PromptStopwords() {
    static const std::unordered_set<std::string> stopwords = {
        "the", "a", "an", "is", "are", "to", "for", "of", "in", "on", "and", "or",
        "find", "me", "some", "get", "best", "good", "how", "what", "why", "when",
        "where", "can", "should", "would", "could"
    };
    return stopwords;
}

std::unordered_set<std::string> LowercaseSet(const std::vector<std::string>& values) {
    std::unordered_set<std::string> out;
    for (const auto& value : values) {
        std::string lowered = ToLower(value);
        if (!lowered.empty()) out.insert(lowered);
    }
    return out;
}

} // namespace

RelevanceScorer::RelevanceScorer(ScoringWeights weights)
    : m_weights(weights) {}

float RelevanceScorer::score(const MemoryCard& card,
                             const PromptAnalysis& analysis,
                             const std::string& promptText) const {
    float total = 0.0f;

    if (card.isProfile()) {
        total += m_weights.profileBoost;
    }

    total += domainSignal(card, analysis);

    const int lexicalMatches = CountLexicalMatches(promptText, card.text);
    if (lexicalMatches > 0) {
        total += std::min(m_weights.lexicalMatchCap, m_weights.lexicalMatchBonus * lexicalMatches);
    }

    total += keywordSignal(card, analysis);

    if (card.type == CardType::Constraint) {
        total += m_weights.constraintBonus;
        if (card.priority == CardPriority::Hard) {
            total += m_weights.hardConstraintBonus;
        }
    }

    if (card.isExtractedOnly()) {
        total *= m_weights.extractedDamping;
    }

    return std::clamp(total, 0.0f, 1.0f);
}

int RelevanceScorer::CountLexicalMatches(const std::string& promptText, const std::string& cardText) {
    const auto cardWords = WordSet(cardText);
    const auto& stopwords = PromptStopwords();

    std::unordered_set<std::string> matched;
    for (const auto& word : Tokenize(promptText)) {
        if (word.size() < kMinPromptWordLength) continue;
        if (stopwords.count(word)) continue;
        if (cardWords.count(word)) matched.insert(word);
    }
    return static_cast<int>(matched.size());
}

float RelevanceScorer::domainSignal(const MemoryCard& card, const PromptAnalysis& analysis) const {
    const auto cardDomains = LowercaseSet(card.domain);
    if (cardDomains.empty()) return 0.0f;

    const auto promptDomains = LowercaseSet(analysis.domains);
    std::size_t overlap = 0;
    for (const auto& d : cardDomains) {
        if (promptDomains.count(d)) ++overlap;
    }

    float signal = 0.0f;
    if (overlap > 0) {
        signal += m_weights.domainOverlapWeight * (static_cast<float>(overlap) / static_cast<float>(cardDomains.size()));
    }
    if (cardDomains.count("communication") || cardDomains.count("personality")) {
        signal += m_weights.conversationalDomainBonus;
    }
    return signal;
}

float RelevanceScorer::keywordSignal(const MemoryCard& card, const PromptAnalysis& analysis) const {
    if (analysis.keywords.empty()) return 0.0f;

    const auto cardWords = WordSet(card.text);
    int matches = 0;
    for (const auto& keyword : LowercaseSet(analysis.keywords)) {
        if (cardWords.count(keyword)) ++matches;
    }
    if (matches == 0) return 0.0f;
    return std::min(m_weights.keywordMatchCap, m_weights.keywordMatchBonus * matches);
}

} // namespace contextwallet::domain::selection
