/**
 * @file CardExtractionService.cpp
 * @brief Implementation of CardExtractionService.
 */

#include "application/CardExtractionService.hpp"
#include "domain/selection/TextTokens.hpp"
#include "infrastructure/TimeUtils.hpp"

#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unordered_set>

namespace contextwallet::application {

using domain::CardType;
using domain::MemoryCard;
using domain::SemanticTuple;
using domain::TuplePredicate;

namespace {

constexpr std::size_t kMaxContentTags = 5;
constexpr std::size_t kMinTagWordLength = 4;

const std::unordered_set<std::string>& TagStopwords() {
    static const std::unordered_set<std::string> words = {
        "user", "that", "this", "with", "from", "have", "will", "would", "should", "could",
        "about", "their", "there", "they", "them", "than", "then", "into", "over", "under",
        "very", "more", "most", "some", "such", "only", "also", "just", "like", "want",
        "prefers", "has_goal", "has_constraint", "likes", "dislikes", "wants", "avoids",
        "interested_in", "relates_to"
    };
    return words;
}

std::string TupleText(const SemanticTuple& tuple) {
    return domain::selection::ToLower(tuple.object + " " + domain::PredicateToString(tuple.predicate));
}

bool Mentions(const SemanticTuple& tuple, const std::vector<std::string>& keywords) {
    const std::string objectType = domain::selection::ToLower(tuple.objectType);
    const std::string text = TupleText(tuple);
    return domain::selection::ContainsAnyPhrase(objectType, keywords) ||
           domain::selection::ContainsAnyPhrase(text, keywords);
}

void AppendUnique(std::vector<std::string>& tags, std::unordered_set<std::string>& seen, const std::string& tag) {
    if (tag.empty()) return;
    if (seen.insert(tag).second) {
        tags.push_back(tag);
    }
}

bool IsTagWord(const std::string& word) {
    return word.size() >= kMinTagWordLength && TagStopwords().count(word) == 0;
}

/** Provenance, category and sub-category tags followed by up to five content words. */
std::vector<std::string> BaseTags(const std::string& category, const std::string& subcategory,
                                  const std::string& content, std::unordered_set<std::string>& seen) {
    std::vector<std::string> tags;
    AppendUnique(tags, seen, domain::kExtractedTag);
    AppendUnique(tags, seen, domain::selection::ToLower(category));
    AppendUnique(tags, seen, domain::selection::ToLower(subcategory));

    std::size_t contentTags = 0;
    for (const auto& word : domain::selection::Tokenize(content)) {
        if (contentTags >= kMaxContentTags) break;
        if (!IsTagWord(word) || seen.count(word) > 0) continue;
        AppendUnique(tags, seen, word);
        ++contentTags;
    }
    return tags;
}

std::vector<std::string> CategoryDomains(const std::string& category, const std::string& subcategory) {
    std::vector<std::string> domains{domain::selection::ToLower(category)};
    if (!subcategory.empty()) {
        domains.push_back(domain::selection::ToLower(subcategory));
    }
    return domains;
}

} // namespace

CardExtractionService::CardExtractionService(std::shared_ptr<domain::TupleExtractor> extractor,
                                             std::shared_ptr<domain::CardWriter> writer)
    : m_extractor(std::move(extractor)),
      m_writer(std::move(writer)),
      m_rng(std::random_device{}()) {}

CardType CardExtractionService::CardTypeForPredicate(TuplePredicate predicate) {
    switch (predicate) {
        case TuplePredicate::HasConstraint: return CardType::Constraint;
        case TuplePredicate::HasGoal: return CardType::Goal;
        default: return CardType::Preference;
    }
}

std::string CardExtractionService::CategoryFor(const SemanticTuple& tuple) {
    if (Mentions(tuple, {"shop", "purchase", "buy", "product", "shopping"})) return "Shopping";
    if (Mentions(tuple, {"food", "restaurant", "meal", "dining", "diet", "eating", "cuisine"})) return "Eating";
    if (Mentions(tuple, {"health", "fitness", "medical", "exercise", "wellness"})) return "Health";
    if (Mentions(tuple, {"work", "project", "code", "finance", "meeting", "professional"})) return "Work";
    return "Shopping";
}

std::string CardExtractionService::WorkSubcategoryFor(const SemanticTuple& tuple) {
    const std::string text = TupleText(tuple);
    using domain::selection::ContainsAnyPhrase;
    if (ContainsAnyPhrase(text, {"finance", "budget", "money", "cost", "expense", "financial"})) return "Finance";
    if (ContainsAnyPhrase(text, {"code", "programming", "language", "function", "algorithm", "coding", "developer"})) {
        return "Coding";
    }
    if (ContainsAnyPhrase(text, {"meeting", "call", "schedule", "calendar", "appointment"})) return "Meetings";
    return "Projects";
}

std::string CardExtractionService::generateCardId() {
    std::uniform_int_distribution<unsigned int> dist(0, 0xFFFFFFFFu);
    std::ostringstream oss;
    oss << "card_" << std::hex << std::setw(8) << std::setfill('0') << dist(m_rng);
    return oss.str();
}

std::vector<MemoryCard> CardExtractionService::cardsFromTuples(const std::vector<SemanticTuple>& tuples,
                                                               const std::string& persona) {
    const std::string createdAt = infrastructure::TimeUtils::NowIso();

    std::vector<MemoryCard> cards;
    for (const auto& tuple : tuples) {
        if (tuple.object.empty()) continue;

        const std::string category = CategoryFor(tuple);
        const std::string subcategory = category == "Work" ? WorkSubcategoryFor(tuple) : "";

        MemoryCard card;
        card.id = generateCardId();
        card.type = CardTypeForPredicate(tuple.predicate);
        card.text = tuple.subject + " " + domain::PredicateToString(tuple.predicate) + " " + tuple.object;
        card.priority = domain::CardPriority::Soft;
        card.persona = persona;
        card.createdAt = createdAt;

        card.domain = CategoryDomains(category, subcategory);

        std::unordered_set<std::string> seen;
        card.tags = BaseTags(category, subcategory, tuple.object, seen);

        for (const auto& [key, values] : tuple.properties) {
            for (const auto& value : values) {
                for (const auto& word : domain::selection::Tokenize(value)) {
                    if (!IsTagWord(word)) continue;
                    AppendUnique(card.tags, seen, word);
                }
            }
        }

        cards.push_back(std::move(card));
    }
    return cards;
}

std::vector<MemoryCard> CardExtractionService::cardsFromSnippets(const std::vector<domain::CategorySnippet>& snippets,
                                                                 const std::string& persona) {
    const std::string createdAt = infrastructure::TimeUtils::NowIso();

    std::vector<MemoryCard> cards;
    for (const auto& snippet : snippets) {
        if (snippet.text.empty()) continue;

        MemoryCard card;
        card.id = generateCardId();
        card.type = CardType::Preference;
        card.text = snippet.text;
        card.priority = domain::CardPriority::Soft;
        card.persona = persona;
        card.createdAt = createdAt;
        card.domain = CategoryDomains(snippet.category, snippet.subcategory);

        std::unordered_set<std::string> seen;
        card.tags = BaseTags(snippet.category, snippet.subcategory, snippet.text, seen);
        cards.push_back(std::move(card));
    }
    return cards;
}

std::vector<SemanticTuple> CardExtractionService::extractTuples(const std::string& conversationText) {
    if (!m_extractor) return {};
    try {
        return m_extractor->extract(conversationText, "conversation");
    } catch (const std::exception& e) {
        std::cerr << "[CardExtractionService] Tuple extraction failed: " << e.what() << std::endl;
        return {};
    }
}

int CardExtractionService::extractAndStore(const std::string& conversationText, const std::string& persona) {
    if (!m_writer) {
        std::cerr << "[CardExtractionService] No card writer configured." << std::endl;
        return 0;
    }

    std::vector<MemoryCard> cards;
    auto tuples = extractTuples(conversationText);
    if (!tuples.empty()) {
        cards = cardsFromTuples(tuples, persona);
    } else {
        std::clog << "[CardExtractionService] No tuples extracted, using keyword snippets." << std::endl;
        cards = cardsFromSnippets(domain::KeywordSnippetExtractor::Extract(conversationText), persona);
    }
    if (cards.empty()) {
        std::clog << "[CardExtractionService] Nothing to store." << std::endl;
        return 0;
    }

    const int stored = m_writer->addCards(cards);
    std::clog << "[CardExtractionService] Stored " << stored << " of " << cards.size()
              << " extracted cards for persona '" << persona << "'" << std::endl;
    return stored;
}

} // namespace contextwallet::application
