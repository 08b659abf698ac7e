/**
 * @file CardRepository.hpp
 * @brief Interfaces for reading and writing memory cards.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "MemoryCard.hpp"

namespace contextwallet::domain {

/**
 * @class CardRepository
 * @brief Read-only source of truth for candidate cards.
 */
class CardRepository {
public:
    virtual ~CardRepository() = default;

    /**
     * @brief Returns all cards of a persona in a stable, reproducible order.
     * @param persona Namespace to read.
     * @param domainFilter When set, keeps cards with a domain entry containing this substring.
     */
    virtual std::vector<MemoryCard> getCards(const std::string& persona,
                                             const std::optional<std::string>& domainFilter = std::nullopt) = 0;
};

/**
 * @class CardWriter
 * @brief Write side used by the ingestion path only.
 */
class CardWriter {
public:
    virtual ~CardWriter() = default;

    /** @brief Appends cards. Returns the number actually stored. */
    virtual int addCards(const std::vector<MemoryCard>& cards) = 0;

    /** @brief Removes a card. Replacement is delete-then-recreate. */
    virtual bool deleteCard(const std::string& cardId) = 0;
};

} // namespace contextwallet::domain
