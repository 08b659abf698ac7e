/**
 * @file OllamaPromptAnalyzer.hpp
 * @brief PromptAnalyzer backed by a local Ollama model, with keyword fallback.
 */

#pragma once

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/KeywordPromptAnalyzer.hpp"
#include "domain/PromptAnalyzer.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace contextwallet::infrastructure {

class OllamaPromptAnalyzer : public domain::PromptAnalyzer {
public:
    /**
     * @param client Shared HTTP client; null behaves like a disabled analyzer.
     * @param model Ollama model name.
     * @param enabled When false only the keyword analysis is used.
     */
    OllamaPromptAnalyzer(std::shared_ptr<OllamaClient> client, std::string model, bool enabled = true);

    domain::PromptAnalysis analyze(const std::string& promptText) override;

    /**
     * @brief Normalizes a model reply object into a PromptAnalysis.
     * Missing or non-list "domains" become general/communication/personality.
     */
    static domain::PromptAnalysis FromJson(const nlohmann::json& reply);

private:
    std::shared_ptr<OllamaClient> m_client;
    std::string m_model;
    bool m_enabled;
    domain::KeywordPromptAnalyzer m_fallback;
};

} // namespace contextwallet::infrastructure
