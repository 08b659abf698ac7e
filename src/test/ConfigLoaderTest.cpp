#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

#include "infrastructure/ConfigLoader.hpp"

using namespace contextwallet::infrastructure;
namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    const fs::path testRoot = "test_project_root_config";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);

    // Defaults without a settings file
    {
        Settings settings = ConfigLoader::Load(testRoot.string());
        assert(settings.cardsPath == "cards.json");
        assert(settings.defaultPersona == "Personal");
        assert(settings.maxCards == 12);
        assert(settings.minRelevance == 0.5f);
        assert(settings.sensitivityMode == "quiet");
        assert(settings.graphRetrieval);
        assert(settings.graphLimit == 20);
        assert(settings.ollama.host == "localhost");
        assert(settings.ollama.port == 11434);
        assert(settings.ollama.model == "qwen2.5:7b");
        assert(settings.ollama.timeoutSeconds == 30);
        assert(settings.ollama.enabled);
    }

    // Partial file with one bad value
    {
        std::ofstream out(testRoot / "settings.json");
        out << R"({"default_persona": "Work", "max_cards": "ten", "min_relevance": 0.25,
                   "ollama": {"enabled": false, "port": 8080}, "theme": "dark"})";
    }
    {
        Settings settings = ConfigLoader::Load(testRoot.string());
        assert(settings.defaultPersona == "Work");
        assert(settings.maxCards == 12);
        assert(settings.minRelevance == 0.25f);
        assert(!settings.ollama.enabled);
        assert(settings.ollama.port == 8080);
        assert(settings.ollama.host == "localhost");
    }

    // Save keeps unknown keys
    {
        Settings settings;
        settings.defaultPersona = "Travel";
        settings.graphRetrieval = false;
        assert(ConfigLoader::Save(testRoot.string(), settings));

        Settings reloaded = ConfigLoader::Load(testRoot.string());
        assert(reloaded.defaultPersona == "Travel");
        assert(!reloaded.graphRetrieval);
        assert(reloaded.ollama.enabled);

        std::ifstream in(testRoot / "settings.json");
        nlohmann::json j;
        in >> j;
        assert(j["theme"] == "dark");
    }

    // Unparsable file falls back to defaults
    {
        std::ofstream out(testRoot / "settings.json");
        out << "{ broken";
    }
    {
        Settings settings = ConfigLoader::Load(testRoot.string());
        assert(settings.defaultPersona == "Personal");
    }

    fs::remove_all(testRoot);
    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
