/**
 * @file JsonMapping.hpp
 * @brief nlohmann::json conversions for cards and packs.
 */

#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/ContextPack.hpp"
#include "domain/MemoryCard.hpp"

namespace contextwallet::infrastructure {

/** @brief Card file record: id, type, domain, priority, text, tags, persona, created_at. */
nlohmann::json CardToJson(const domain::MemoryCard& card);

/**
 * @brief Reads a card file record.
 * @param error Set to a short description when the record is rejected.
 * @return nullopt for non-objects, missing id/text or an unknown type/priority.
 */
std::optional<domain::MemoryCard> CardFromJson(const nlohmann::json& record, std::string& error);

nlohmann::json UsedCardToJson(const domain::UsedCard& card);

/** @brief Caller-facing pack: pack_text, used_cards, card_count, persona, sensitivity_mode, generated_at... */
nlohmann::json PackToJson(const domain::ContextPack& pack);

} // namespace contextwallet::infrastructure
