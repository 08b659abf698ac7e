/**
 * @file JsonMapping.cpp
 * @brief Implementation of the JSON conversions.
 */

#include "infrastructure/JsonMapping.hpp"

namespace contextwallet::infrastructure {

using json = nlohmann::json;

namespace {

std::vector<std::string> StringArray(const json& record, const char* key) {
    std::vector<std::string> values;
    if (!record.contains(key)) return values;
    const auto& field = record[key];
    if (field.is_string()) {
        values.push_back(field.get<std::string>());
    } else if (field.is_array()) {
        for (const auto& item : field) {
            if (item.is_string()) values.push_back(item.get<std::string>());
        }
    }
    return values;
}

} // namespace

json CardToJson(const domain::MemoryCard& card) {
    return {
        {"id", card.id},
        {"type", domain::CardTypeToString(card.type)},
        {"domain", card.domain},
        {"priority", domain::PriorityToString(card.priority)},
        {"text", card.text},
        {"tags", card.tags},
        {"persona", card.persona},
        {"created_at", card.createdAt}
    };
}

std::optional<domain::MemoryCard> CardFromJson(const json& record, std::string& error) {
    if (!record.is_object()) {
        error = "record is not an object";
        return std::nullopt;
    }
    if (!record.contains("id") || !record["id"].is_string()) {
        error = "missing id";
        return std::nullopt;
    }
    if (!record.contains("text") || !record["text"].is_string()) {
        error = "missing text";
        return std::nullopt;
    }

    domain::MemoryCard card;
    card.id = record["id"].get<std::string>();
    card.text = record["text"].get<std::string>();

    const std::string typeName = record.value("type", std::string("preference"));
    auto type = domain::CardTypeFromString(typeName);
    if (!type) {
        error = "unknown type '" + typeName + "'";
        return std::nullopt;
    }
    card.type = *type;

    const std::string priorityName = record.value("priority", std::string("soft"));
    auto priority = domain::PriorityFromString(priorityName);
    if (!priority) {
        error = "unknown priority '" + priorityName + "'";
        return std::nullopt;
    }
    card.priority = *priority;

    card.domain = StringArray(record, "domain");
    card.tags = StringArray(record, "tags");
    card.persona = record.value("persona", std::string(domain::kDefaultPersona));
    card.createdAt = record.value("created_at", std::string());
    return card;
}

json UsedCardToJson(const domain::UsedCard& card) {
    return {
        {"id", card.id},
        {"type", domain::CardTypeToString(card.type)},
        {"text", card.text},
        {"domain", card.domain},
        {"relevance_score", card.relevanceScore}
    };
}

json PackToJson(const domain::ContextPack& pack) {
    json usedCards = json::array();
    for (const auto& card : pack.usedCards) {
        usedCards.push_back(UsedCardToJson(card));
    }

    json exclusions = json::array();
    for (const auto& exclusion : pack.exclusions) {
        exclusions.push_back({
            {"card_id", exclusion.cardId},
            {"reason", domain::ExclusionReasonToString(exclusion.reason)},
            {"detail", exclusion.detail}
        });
    }

    return {
        {"pack_text", pack.packText},
        {"used_cards", usedCards},
        {"card_count", pack.cardCount},
        {"persona", pack.persona},
        {"sensitivity_mode", domain::SensitivityModeToString(pack.sensitivityMode)},
        {"generated_at", pack.generatedAt},
        {"graph_hint_count", pack.graphHintCount},
        {"exclusions", exclusions}
    };
}

} // namespace contextwallet::infrastructure
