/**
 * @file ContextWalletApp.cpp
 * @brief Implementation of the ContextWalletApp class.
 */
#include "app/ContextWalletApp.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "infrastructure/JsonMapping.hpp"
#include "infrastructure/OllamaPromptAnalyzer.hpp"
#include "infrastructure/OllamaTupleExtractor.hpp"
#include "infrastructure/TagIndexGraphSearch.hpp"

namespace contextwallet::app {

namespace {

constexpr int kExitUsage = 2;

struct ParsedArgs {
    std::map<std::string, std::string> options;
    std::vector<std::string> positional;
};

/** Splits "--name value" pairs from positional words. Unknown options are an error. */
ParsedArgs ParseArgs(const std::vector<std::string>& args, const std::vector<std::string>& known) {
    ParsedArgs parsed;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.rfind("--", 0) != 0) {
            parsed.positional.push_back(arg);
            continue;
        }
        const std::string name = arg.substr(2);
        bool isKnown = false;
        for (const auto& k : known) isKnown = isKnown || k == name;
        if (!isKnown) {
            throw std::invalid_argument("unknown option " + arg);
        }
        if (i + 1 >= args.size()) {
            throw std::invalid_argument("missing value for " + arg);
        }
        parsed.options[name] = args[++i];
    }
    return parsed;
}

std::string Join(const std::vector<std::string>& words) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < words.size(); ++i) {
        if (i > 0) oss << " ";
        oss << words[i];
    }
    return oss.str();
}

std::string OptionOr(const ParsedArgs& parsed, const std::string& name, const std::string& fallback) {
    auto it = parsed.options.find(name);
    return it == parsed.options.end() ? fallback : it->second;
}

} // namespace

void ContextWalletApp::PrintUsage() {
    std::cerr << "Usage: contextwallet [--root DIR] <command>\n"
              << "  pack [--persona P] [--max N] [--min X] [--mode quiet|normal|verbose] <prompt...>\n"
              << "  preview [--persona P] [--max N]\n"
              << "  extract [--persona P] <conversation-file>\n"
              << "  status" << std::endl;
}

bool ContextWalletApp::Init(const std::string& projectRoot) {
    if (!std::filesystem::is_directory(projectRoot)) {
        std::cerr << "Project root is not a directory: " << projectRoot << std::endl;
        return false;
    }
    m_projectRoot = projectRoot;
    m_services.settings = infrastructure::ConfigLoader::Load(projectRoot);
    const auto& settings = m_services.settings;

    std::filesystem::path cardsPath = settings.cardsPath;
    if (cardsPath.is_relative()) {
        cardsPath = std::filesystem::path(projectRoot) / cardsPath;
    }

    m_services.cardRepository = std::make_shared<infrastructure::JsonCardRepository>(cardsPath);
    m_services.ollamaClient = std::make_shared<infrastructure::OllamaClient>(
        settings.ollama.host, settings.ollama.port, settings.ollama.timeoutSeconds);

    auto analyzer = std::make_shared<infrastructure::OllamaPromptAnalyzer>(
        m_services.ollamaClient, settings.ollama.model, settings.ollama.enabled);
    auto graphSearch = std::make_shared<infrastructure::TagIndexGraphSearch>(m_services.cardRepository);

    application::ContextPackService::Options options;
    options.graphRetrieval = settings.graphRetrieval;
    options.graphLimit = settings.graphLimit;
    m_services.contextPackService = std::make_unique<application::ContextPackService>(
        m_services.cardRepository, analyzer, graphSearch, options);

    std::shared_ptr<domain::TupleExtractor> extractor;
    if (settings.ollama.enabled) {
        extractor = std::make_shared<infrastructure::OllamaTupleExtractor>(m_services.ollamaClient, settings.ollama.model);
    }
    m_services.extractionService = std::make_unique<application::CardExtractionService>(
        extractor, m_services.cardRepository);
    return true;
}

int ContextWalletApp::RunPack(const std::vector<std::string>& args) {
    const auto parsed = ParseArgs(args, {"persona", "max", "min", "mode"});
    const auto& settings = m_services.settings;

    domain::ContextPackRequest request;
    request.persona = OptionOr(parsed, "persona", settings.defaultPersona);
    request.draftPrompt = Join(parsed.positional);
    request.siteId = "cli";
    request.maxCards = std::stoi(OptionOr(parsed, "max", std::to_string(settings.maxCards)));
    request.minRelevance = parsed.options.count("min") ? std::stof(parsed.options.at("min")) : settings.minRelevance;

    const std::string modeName = OptionOr(parsed, "mode", settings.sensitivityMode);
    auto mode = domain::SensitivityModeFromString(modeName);
    if (!mode) {
        std::cerr << "Unknown sensitivity mode: " << modeName << std::endl;
        return kExitUsage;
    }
    request.sensitivityMode = *mode;

    if (request.draftPrompt.empty()) {
        std::cerr << "pack: a prompt is required" << std::endl;
        return kExitUsage;
    }

    auto pack = m_services.contextPackService->build(request);
    std::cout << infrastructure::PackToJson(pack).dump(4) << std::endl;
    return 0;
}

int ContextWalletApp::RunPreview(const std::vector<std::string>& args) {
    const auto parsed = ParseArgs(args, {"persona", "max"});
    const auto& settings = m_services.settings;

    const std::string persona = OptionOr(parsed, "persona", settings.defaultPersona);
    const int maxCards = std::stoi(OptionOr(parsed, "max", std::to_string(settings.maxCards)));

    auto pack = m_services.contextPackService->preview(persona, maxCards);
    std::cout << infrastructure::PackToJson(pack).dump(4) << std::endl;
    return 0;
}

int ContextWalletApp::RunExtract(const std::vector<std::string>& args) {
    const auto parsed = ParseArgs(args, {"persona"});
    if (parsed.positional.size() != 1) {
        std::cerr << "extract: exactly one conversation file is required" << std::endl;
        return kExitUsage;
    }

    std::ifstream file(parsed.positional.front());
    if (!file.is_open()) {
        std::cerr << "extract: cannot open " << parsed.positional.front() << std::endl;
        return 1;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    const std::string persona = OptionOr(parsed, "persona", m_services.settings.defaultPersona);
    const int stored = m_services.extractionService->extractAndStore(buffer.str(), persona);

    nlohmann::json result = {
        {"persona", persona},
        {"cards_stored", stored},
        {"cards_path", m_services.cardRepository->path().string()}
    };
    std::cout << result.dump(4) << std::endl;
    return 0;
}

int ContextWalletApp::RunStatus() {
    const auto& settings = m_services.settings;
    const bool ollamaUp = settings.ollama.enabled && m_services.ollamaClient->isAvailable();

    nlohmann::json models = nlohmann::json::array();
    if (ollamaUp) {
        for (const auto& name : m_services.ollamaClient->getAvailableModels()) models.push_back(name);
    }

    std::size_t cardCount = 0;
    std::string cardError;
    try {
        cardCount = m_services.cardRepository->loadAll().size();
    } catch (const std::exception& e) {
        cardError = e.what();
    }

    nlohmann::json status = {
        {"project_root", m_projectRoot},
        {"cards_path", m_services.cardRepository->path().string()},
        {"card_count", cardCount},
        {"default_persona", settings.defaultPersona},
        {"max_cards", settings.maxCards},
        {"min_relevance", settings.minRelevance},
        {"graph_retrieval", settings.graphRetrieval},
        {"ollama", {
            {"enabled", settings.ollama.enabled},
            {"available", ollamaUp},
            {"model", settings.ollama.model},
            {"models", models}
        }}
    };
    if (!cardError.empty()) status["card_error"] = cardError;

    std::cout << status.dump(4) << std::endl;
    return 0;
}

int ContextWalletApp::Run(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::string root = std::filesystem::current_path().string();
    if (args.size() >= 2 && args[0] == "--root") {
        root = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty()) {
        PrintUsage();
        return kExitUsage;
    }

    if (!Init(root)) {
        return 1;
    }

    const std::string command = args.front();
    const std::vector<std::string> rest(args.begin() + 1, args.end());

    try {
        if (command == "pack") return RunPack(rest);
        if (command == "preview") return RunPreview(rest);
        if (command == "extract") return RunExtract(rest);
        if (command == "status") return RunStatus();
    } catch (const std::invalid_argument& e) {
        std::cerr << command << ": " << e.what() << std::endl;
        return kExitUsage;
    } catch (const std::out_of_range& e) {
        std::cerr << command << ": value out of range: " << e.what() << std::endl;
        return kExitUsage;
    }

    std::cerr << "Unknown command: " << command << std::endl;
    PrintUsage();
    return kExitUsage;
}

} // namespace contextwallet::app
