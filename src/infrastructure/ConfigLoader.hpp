/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving application configuration (settings.json).
 *
 * Keeps JSON parsing of the configuration in one place. Missing keys keep
 * their defaults; a missing or unreadable file yields all defaults.
 */

#pragma once

#include <string>

namespace contextwallet::infrastructure {

struct OllamaSettings {
    std::string host = "localhost";
    int port = 11434;
    std::string model = "qwen2.5:7b";
    int timeoutSeconds = 30;
    bool enabled = true;
};

struct Settings {
    std::string cardsPath = "cards.json";   ///< Relative paths resolve against the project root.
    std::string defaultPersona = "Personal";
    int maxCards = 12;
    float minRelevance = 0.5f;
    std::string sensitivityMode = "quiet";
    bool graphRetrieval = true;
    int graphLimit = 20;
    OllamaSettings ollama;
};

class ConfigLoader {
public:
    /**
     * @brief Reads <projectRoot>/settings.json.
     * @param projectRoot Directory holding settings.json.
     */
    static Settings Load(const std::string& projectRoot);

    /**
     * @brief Writes settings.json, preserving keys this loader does not know about.
     * @return false if the file could not be written.
     */
    static bool Save(const std::string& projectRoot, const Settings& settings);
};

} // namespace contextwallet::infrastructure
