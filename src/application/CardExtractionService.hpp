/**
 * @file CardExtractionService.hpp
 * @brief Ingestion path: conversation text to semantic tuples to stored memory cards.
 */

#pragma once

#include <memory>
#include <random>
#include <string>
#include <vector>
#include "domain/CardRepository.hpp"
#include "domain/KeywordSnippetExtractor.hpp"
#include "domain/MemoryCard.hpp"
#include "domain/SemanticTuple.hpp"
#include "domain/TupleExtractor.hpp"

namespace contextwallet::application {

/**
 * @class CardExtractionService
 * @brief Maps mined tuples to soft "extracted" cards and hands them to the card writer.
 *
 * Cards produced here never carry the "profile" tag, so the arbiter drops
 * them whenever a questionnaire answer says otherwise. When the tuple
 * extractor is missing, fails or finds nothing, keyword snippets are stored
 * as preference cards instead.
 */
class CardExtractionService {
public:
    CardExtractionService(std::shared_ptr<domain::TupleExtractor> extractor,
                          std::shared_ptr<domain::CardWriter> writer);

    /** @brief Pure mapping, one card per tuple with a non-empty object. */
    std::vector<domain::MemoryCard> cardsFromTuples(const std::vector<domain::SemanticTuple>& tuples,
                                                    const std::string& persona);

    /** @brief One soft preference card per snippet, the snippet being the card text. */
    std::vector<domain::MemoryCard> cardsFromSnippets(const std::vector<domain::CategorySnippet>& snippets,
                                                      const std::string& persona);

    /**
     * @brief Extracts, maps and appends cards.
     * @return Number of cards stored; 0 when nothing was extracted or no writer is set.
     */
    int extractAndStore(const std::string& conversationText, const std::string& persona);

    static domain::CardType CardTypeForPredicate(domain::TuplePredicate predicate);
    static std::string CategoryFor(const domain::SemanticTuple& tuple);
    static std::string WorkSubcategoryFor(const domain::SemanticTuple& tuple);

private:
    std::vector<domain::SemanticTuple> extractTuples(const std::string& conversationText);
    std::string generateCardId();

    std::shared_ptr<domain::TupleExtractor> m_extractor;
    std::shared_ptr<domain::CardWriter> m_writer;
    std::mt19937 m_rng;
};

} // namespace contextwallet::application
