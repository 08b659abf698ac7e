/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace contextwallet::infrastructure {

namespace {

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& target) {
    if (!j.contains(key)) return;
    try {
        target = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring invalid '" << key << "': " << e.what() << std::endl;
    }
}

} // namespace

Settings ConfigLoader::Load(const std::string& projectRoot) {
    Settings settings;
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / "settings.json";
    if (!std::filesystem::exists(configPath)) {
        return settings;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;
        if (!j.is_object()) {
            std::cerr << "[ConfigLoader] settings.json is not an object, using defaults." << std::endl;
            return settings;
        }

        ReadKey(j, "cards_path", settings.cardsPath);
        ReadKey(j, "default_persona", settings.defaultPersona);
        ReadKey(j, "max_cards", settings.maxCards);
        ReadKey(j, "min_relevance", settings.minRelevance);
        ReadKey(j, "sensitivity_mode", settings.sensitivityMode);
        ReadKey(j, "graph_retrieval", settings.graphRetrieval);
        ReadKey(j, "graph_limit", settings.graphLimit);

        if (j.contains("ollama") && j["ollama"].is_object()) {
            const auto& o = j["ollama"];
            ReadKey(o, "host", settings.ollama.host);
            ReadKey(o, "port", settings.ollama.port);
            ReadKey(o, "model", settings.ollama.model);
            ReadKey(o, "timeout_seconds", settings.ollama.timeoutSeconds);
            ReadKey(o, "enabled", settings.ollama.enabled);
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        return Settings{};
    }

    return settings;
}

bool ConfigLoader::Save(const std::string& projectRoot, const Settings& settings) {
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / "settings.json";
    nlohmann::json j = nlohmann::json::object();

    // Try to load existing to preserve other settings
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
            if (!j.is_object()) j = nlohmann::json::object();
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable settings.json: " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
    }

    j["cards_path"] = settings.cardsPath;
    j["default_persona"] = settings.defaultPersona;
    j["max_cards"] = settings.maxCards;
    j["min_relevance"] = settings.minRelevance;
    j["sensitivity_mode"] = settings.sensitivityMode;
    j["graph_retrieval"] = settings.graphRetrieval;
    j["graph_limit"] = settings.graphLimit;
    j["ollama"] = {
        {"host", settings.ollama.host},
        {"port", settings.ollama.port},
        {"model", settings.ollama.model},
        {"timeout_seconds", settings.ollama.timeoutSeconds},
        {"enabled", settings.ollama.enabled}
    };

    std::ofstream f(configPath);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Error writing settings.json: cannot open " << configPath << std::endl;
        return false;
    }
    f << j.dump(4);
    return !f.fail();
}

} // namespace contextwallet::infrastructure
