/**
 * @file OllamaTupleExtractor.cpp
 * @brief Implementation of OllamaTupleExtractor.
 */

#include "infrastructure/OllamaTupleExtractor.hpp"
#include "infrastructure/LlmResponseParser.hpp"
#include "infrastructure/PromptCatalog.hpp"

#include <algorithm>
#include <iostream>

namespace contextwallet::infrastructure {

using json = nlohmann::json;

namespace {

std::string StringField(const json& item, const char* key, const std::string& fallback) {
    if (item.contains(key) && item[key].is_string()) {
        return item[key].get<std::string>();
    }
    return fallback;
}

std::string ScalarToString(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

} // namespace

OllamaTupleExtractor::OllamaTupleExtractor(std::shared_ptr<OllamaClient> client, std::string model)
    : m_client(std::move(client)), m_model(std::move(model)) {}

std::vector<domain::SemanticTuple> OllamaTupleExtractor::FromJson(const json& items, const std::string& source) {
    std::vector<domain::SemanticTuple> tuples;
    if (!items.is_array()) return tuples;

    for (std::size_t i = 0; i < items.size(); ++i) {
        const auto& item = items[i];
        if (!item.is_object()) {
            std::cerr << "[OllamaTupleExtractor] Tuple " << i << " is not an object, skipping." << std::endl;
            continue;
        }

        domain::SemanticTuple tuple;
        tuple.subject = StringField(item, "subject", "User");
        tuple.subjectType = StringField(item, "subject_type", "Person");
        tuple.predicate = domain::PredicateFromString(StringField(item, "predicate", "RELATES_TO"));
        tuple.object = StringField(item, "object", "");
        tuple.objectType = StringField(item, "object_type", "Entity");
        tuple.source = source;

        if (item.contains("confidence") && item["confidence"].is_number()) {
            tuple.confidence = std::clamp(item["confidence"].get<float>(), 0.0f, 1.0f);
        }

        if (item.contains("properties") && item["properties"].is_object()) {
            for (const auto& [key, value] : item["properties"].items()) {
                if (value.is_null()) continue;
                auto& list = tuple.properties[key];
                if (value.is_array()) {
                    for (const auto& entry : value) {
                        if (!entry.is_null()) list.push_back(ScalarToString(entry));
                    }
                } else {
                    list.push_back(ScalarToString(value));
                }
            }
        }

        tuples.push_back(std::move(tuple));
    }
    return tuples;
}

std::vector<domain::SemanticTuple> OllamaTupleExtractor::extract(const std::string& rawContext,
                                                                 const std::string& source) {
    if (!m_client) return {};

    auto response = m_client->generate(m_model, PromptCatalog::GetTupleExtractionPrompt(rawContext), true);
    if (!response) {
        std::cerr << "[OllamaTupleExtractor] Extraction failed: no response from " << m_model << std::endl;
        return {};
    }

    auto tuples = FromJson(LlmResponseParser::ParseList(*response), source);
    std::clog << "[OllamaTupleExtractor] Extracted " << tuples.size() << " tuples" << std::endl;
    return tuples;
}

} // namespace contextwallet::infrastructure
