/**
 * @file OllamaTupleExtractor.hpp
 * @brief TupleExtractor backed by a local Ollama model.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/TupleExtractor.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace contextwallet::infrastructure {

class OllamaTupleExtractor : public domain::TupleExtractor {
public:
    OllamaTupleExtractor(std::shared_ptr<OllamaClient> client, std::string model);

    std::vector<domain::SemanticTuple> extract(const std::string& rawContext, const std::string& source) override;

    /**
     * @brief Converts parsed tuple objects, skipping entries that are not objects.
     * Scalar property values become one-element lists; confidence is clamped to [0, 1].
     */
    static std::vector<domain::SemanticTuple> FromJson(const nlohmann::json& items, const std::string& source);

private:
    std::shared_ptr<OllamaClient> m_client;
    std::string m_model;
};

} // namespace contextwallet::infrastructure
