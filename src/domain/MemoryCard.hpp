/**
 * @file MemoryCard.hpp
 * @brief Domain entity for an atomic stored fact about the user.
 */

#pragma once

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace contextwallet::domain {

/**
 * @enum CardType
 * @brief Category of the stored fact. Also defines the rendering order of a pack.
 */
enum class CardType {
    Constraint,
    Preference,
    Goal,
    Capability
};

/**
 * @enum CardPriority
 * @brief Hard constraints are never overridden by soft preferences.
 */
enum class CardPriority {
    Hard,
    Soft
};

inline std::string CardTypeToString(CardType type) {
    switch (type) {
        case CardType::Constraint: return "constraint";
        case CardType::Preference: return "preference";
        case CardType::Goal: return "goal";
        case CardType::Capability: return "capability";
    }
    return "preference";
}

inline std::optional<CardType> CardTypeFromString(const std::string& value) {
    if (value == "constraint") return CardType::Constraint;
    if (value == "preference") return CardType::Preference;
    if (value == "goal") return CardType::Goal;
    if (value == "capability") return CardType::Capability;
    return std::nullopt;
}

inline std::string PriorityToString(CardPriority priority) {
    return priority == CardPriority::Hard ? "hard" : "soft";
}

inline std::optional<CardPriority> PriorityFromString(const std::string& value) {
    if (value == "hard") return CardPriority::Hard;
    if (value == "soft") return CardPriority::Soft;
    return std::nullopt;
}

/// Provenance tag of cards created from an answered questionnaire.
inline constexpr const char* kProfileTag = "profile";
/// Provenance tag of cards mined from conversation text.
inline constexpr const char* kExtractedTag = "extracted";
inline constexpr const char* kDefaultPersona = "Personal";

/**
 * @class MemoryCard
 * @brief An atomic memory card stored in the user's wallet.
 *
 * Invariant: id, text and persona must not be empty.
 * Cards are read-only for the selection engine.
 */
class MemoryCard {
public:
    std::string id;                       ///< Opaque identifier, immutable once assigned.
    CardType type = CardType::Preference;
    std::string text;                     ///< Natural-language statement, the unit of matching.
    std::vector<std::string> domain;      ///< Topical tags ("shopping", "health"...).
    CardPriority priority = CardPriority::Soft;
    std::vector<std::string> tags;        ///< Informational and provenance labels.
    std::string persona = kDefaultPersona;
    std::string createdAt;                ///< ISO-8601, informational only.

    MemoryCard() = default;

    MemoryCard(std::string cardId, CardType cardType, std::string cardText,
               std::vector<std::string> domains = {}, CardPriority cardPriority = CardPriority::Soft,
               std::vector<std::string> cardTags = {}, std::string cardPersona = kDefaultPersona)
        : id(std::move(cardId)), type(cardType), text(std::move(cardText)), domain(std::move(domains)),
          priority(cardPriority), tags(std::move(cardTags)), persona(std::move(cardPersona)) {
        validate();
    }

    void validate() const {
        if (id.empty()) {
            throw std::invalid_argument("MemoryCard: id cannot be empty.");
        }
        if (text.empty()) {
            throw std::invalid_argument("MemoryCard: text cannot be empty.");
        }
        if (persona.empty()) {
            throw std::invalid_argument("MemoryCard: persona cannot be empty.");
        }
    }

    bool isValid() const {
        return !id.empty() && !text.empty() && !persona.empty();
    }

    bool hasTag(const std::string& tag) const {
        return std::find(tags.begin(), tags.end(), tag) != tags.end();
    }

    bool isProfile() const { return hasTag(kProfileTag); }

    /** @brief True for mined cards that no questionnaire answer confirms. */
    bool isExtractedOnly() const { return hasTag(kExtractedTag) && !isProfile(); }

    bool isHardConstraint() const {
        return type == CardType::Constraint && priority == CardPriority::Hard;
    }
};

} // namespace contextwallet::domain
