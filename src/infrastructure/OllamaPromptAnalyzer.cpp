/**
 * @file OllamaPromptAnalyzer.cpp
 * @brief Implementation of OllamaPromptAnalyzer.
 */

#include "infrastructure/OllamaPromptAnalyzer.hpp"
#include "infrastructure/LlmResponseParser.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include "domain/selection/TextTokens.hpp"

#include <iostream>

namespace contextwallet::infrastructure {

using json = nlohmann::json;

namespace {

std::vector<std::string> StringList(const json& reply, const char* key, bool lowercase) {
    std::vector<std::string> values;
    if (!reply.contains(key) || !reply[key].is_array()) return values;
    for (const auto& item : reply[key]) {
        if (!item.is_string()) continue;
        auto value = item.get<std::string>();
        if (value.empty()) continue;
        values.push_back(lowercase ? domain::selection::ToLower(value) : value);
    }
    return values;
}

} // namespace

OllamaPromptAnalyzer::OllamaPromptAnalyzer(std::shared_ptr<OllamaClient> client, std::string model, bool enabled)
    : m_client(std::move(client)), m_model(std::move(model)), m_enabled(enabled) {}

domain::PromptAnalysis OllamaPromptAnalyzer::FromJson(const json& reply) {
    domain::PromptAnalysis analysis;
    analysis.intent = "user request";
    if (reply.contains("intent") && reply["intent"].is_string()) {
        analysis.intent = reply["intent"].get<std::string>();
    }

    if (reply.contains("domains") && reply["domains"].is_array()) {
        analysis.domains = StringList(reply, "domains", true);
    } else {
        analysis.domains = {"general", "communication", "personality"};
    }

    analysis.explicitPreferences = StringList(reply, "explicit_preferences", false);
    analysis.keywords = StringList(reply, "keywords", true);
    return analysis;
}

domain::PromptAnalysis OllamaPromptAnalyzer::analyze(const std::string& promptText) {
    if (!m_enabled || !m_client) {
        return m_fallback.analyze(promptText);
    }

    try {
        auto response = m_client->generate(m_model, PromptCatalog::GetPromptAnalysisPrompt(promptText), true);
        if (!response) {
            std::cerr << "[OllamaPromptAnalyzer] No response, using keyword analysis." << std::endl;
            return m_fallback.analyze(promptText);
        }

        auto reply = LlmResponseParser::ParseObject(*response);
        if (!reply) {
            std::cerr << "[OllamaPromptAnalyzer] Reply is not a JSON object, using keyword analysis." << std::endl;
            return m_fallback.analyze(promptText);
        }

        auto analysis = FromJson(*reply);
        std::clog << "[OllamaPromptAnalyzer] Intent: " << analysis.intent << std::endl;
        return analysis;
    } catch (const std::exception& e) {
        std::cerr << "[OllamaPromptAnalyzer] Analysis failed: " << e.what() << ", using keyword analysis." << std::endl;
        return m_fallback.analyze(promptText);
    }
}

} // namespace contextwallet::infrastructure
