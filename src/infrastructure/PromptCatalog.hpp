/**
 * @file PromptCatalog.hpp
 * @brief Central storage for the LLM instructions used by the Ollama adapters.
 */

#pragma once

#include <string>

namespace contextwallet::infrastructure {

class PromptCatalog {
public:
    /** @brief Instruction asking for intent, domains, explicit preferences and keywords as JSON. */
    static std::string GetPromptAnalysisPrompt(const std::string& userPrompt);

    /** @brief Instruction asking for a JSON array of semantic tuples. */
    static std::string GetTupleExtractionPrompt(const std::string& rawContext);
};

} // namespace contextwallet::infrastructure
