/**
 * @file ContextPack.hpp
 * @brief Domain entities produced by the context selection pipeline.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "domain/MemoryCard.hpp"

namespace contextwallet::domain {

/**
 * @struct ScoredCard
 * @brief Transient pairing of a card with its relevance in [0, 1].
 */
struct ScoredCard {
    MemoryCard card;
    float relevanceScore = 0.0f;
};

/**
 * @enum SensitivityMode
 * @brief How much context the caller wants to show. Advisory only.
 */
enum class SensitivityMode {
    Quiet,
    Normal,
    Verbose
};

inline std::string SensitivityModeToString(SensitivityMode mode) {
    switch (mode) {
        case SensitivityMode::Quiet: return "quiet";
        case SensitivityMode::Normal: return "normal";
        case SensitivityMode::Verbose: return "verbose";
    }
    return "quiet";
}

inline std::optional<SensitivityMode> SensitivityModeFromString(const std::string& value) {
    if (value == "quiet") return SensitivityMode::Quiet;
    if (value == "normal") return SensitivityMode::Normal;
    if (value == "verbose") return SensitivityMode::Verbose;
    return std::nullopt;
}

/**
 * @enum ExclusionReason
 * @brief Why a candidate card did not make it into the pack.
 */
enum class ExclusionReason {
    Malformed,       ///< Failed validation or belongs to another persona.
    PromptConflict,  ///< Vetoed by the contradiction detector.
    BelowThreshold,  ///< Score under the caller's minimum relevance.
    ProfileConflict, ///< Extracted card dropped in favour of a profile card.
    OverCap          ///< Eligible but cut by max_cards.
};

inline std::string ExclusionReasonToString(ExclusionReason reason) {
    switch (reason) {
        case ExclusionReason::Malformed: return "malformed";
        case ExclusionReason::PromptConflict: return "prompt_conflict";
        case ExclusionReason::BelowThreshold: return "below_threshold";
        case ExclusionReason::ProfileConflict: return "profile_conflict";
        case ExclusionReason::OverCap: return "over_cap";
    }
    return "malformed";
}

struct CardExclusion {
    std::string cardId;
    ExclusionReason reason;
    std::string detail; ///< e.g. the rule axis or the winning profile card id.
};

/**
 * @struct UsedCard
 * @brief A memory card as reported back to the caller of a pack.
 */
struct UsedCard {
    std::string id;
    CardType type = CardType::Preference;
    std::string text;
    std::vector<std::string> domain;
    float relevanceScore = 1.0f;
};

/**
 * @struct ContextPackRequest
 * @brief Input of a single BuildContextPack call.
 */
struct ContextPackRequest {
    std::string persona = kDefaultPersona;
    std::string draftPrompt;
    std::string siteId;
    SensitivityMode sensitivityMode = SensitivityMode::Quiet;
    int maxCards = 12;
    float minRelevance = 0.5f;
};

/**
 * @struct ContextPack
 * @brief The rendered, bounded context block plus its provenance.
 *
 * An empty packText means "nothing to inject", never an error.
 */
struct ContextPack {
    std::string packText;
    std::vector<UsedCard> usedCards;
    int cardCount = 0;
    std::string persona;
    SensitivityMode sensitivityMode = SensitivityMode::Quiet;
    std::string generatedAt;
    std::vector<CardExclusion> exclusions;
    int graphHintCount = 0;

    bool isEmpty() const { return usedCards.empty(); }
};

} // namespace contextwallet::domain
