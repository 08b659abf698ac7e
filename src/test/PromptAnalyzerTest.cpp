#include <cassert>
#include <iostream>

#include "domain/KeywordPromptAnalyzer.hpp"
#include "infrastructure/LlmResponseParser.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/OllamaPromptAnalyzer.hpp"

using namespace contextwallet::domain;
using namespace contextwallet::infrastructure;
using json = nlohmann::json;

namespace {

void TestKeywordAnalysis() {
    KeywordPromptAnalyzer analyzer;

    auto shopping = analyzer.analyze("find me the cheapest pans");
    assert(shopping.intent == "user request");
    assert((shopping.domains == std::vector<std::string>{"shopping", "communication", "personality"}));
    assert((shopping.keywords == std::vector<std::string>{"find", "cheapest", "pans"}));
    assert(shopping.explicitPreferences.empty());

    auto general = analyzer.analyze("hello there");
    assert((general.domains == std::vector<std::string>{"general", "communication", "personality"}));

    // Substring matching: "workout" selects both health and work
    auto mixed = analyzer.analyze("Cook dinner after my workout");
    assert((mixed.domains ==
            std::vector<std::string>{"eating", "health", "work", "communication", "personality"}));

    auto repeated = analyzer.analyze("pans PANS pans, and pots?");
    assert((repeated.keywords == std::vector<std::string>{"pans", "pots"}));

    auto empty = KeywordPromptAnalyzer::Analyze("");
    assert(empty.keywords.empty());
    assert(empty.domains.size() == 3);
}

void TestOllamaAnalyzerFallsBackWhenDisabled() {
    OllamaPromptAnalyzer disabled(nullptr, "qwen2.5:7b", false);
    auto analysis = disabled.analyze("find me the cheapest pans");
    auto expected = KeywordPromptAnalyzer::Analyze("find me the cheapest pans");
    assert(analysis.domains == expected.domains);
    assert(analysis.keywords == expected.keywords);

    OllamaPromptAnalyzer noClient(nullptr, "qwen2.5:7b", true);
    assert(noClient.analyze("budget for lunch").intent == "user request");
}

void TestReplyNormalization() {
    auto minimal = OllamaPromptAnalyzer::FromJson(json{{"intent", "buy pans"}});
    assert(minimal.intent == "buy pans");
    assert((minimal.domains == std::vector<std::string>{"general", "communication", "personality"}));
    assert(minimal.keywords.empty());

    auto full = OllamaPromptAnalyzer::FromJson(json{
        {"intent", "buy pans"},
        {"domains", json::array({"Shopping", 3, ""})},
        {"explicit_preferences", json::array({"I want the cheapest"})},
        {"keywords", json::array({"Pans"})}
    });
    assert((full.domains == std::vector<std::string>{"shopping"}));
    assert((full.explicitPreferences == std::vector<std::string>{"I want the cheapest"}));
    assert((full.keywords == std::vector<std::string>{"pans"}));

    auto badDomains = OllamaPromptAnalyzer::FromJson(json{{"domains", "shopping"}});
    assert(badDomains.intent == "user request");
    assert(badDomains.domains.size() == 3);
}

void TestResponseParsing() {
    assert(LlmResponseParser::StripCodeFence("```json\n{\"a\": 1}\n```") == "{\"a\": 1}");
    assert(LlmResponseParser::StripCodeFence("```\n[1]\n```") == "[1]");
    assert(LlmResponseParser::StripCodeFence("  plain  ") == "plain");

    auto object = LlmResponseParser::ParseObject("Sure! {\"intent\": \"x\"} hope it helps");
    assert(object && (*object)["intent"] == "x");

    auto nested = LlmResponseParser::ParseObject("Here: {\"domains\": [\"work\"]}");
    assert(nested && nested->contains("domains"));

    assert(!LlmResponseParser::ParseObject("[1, 2]"));
    assert(!LlmResponseParser::ParseObject("no json here"));

    assert(LlmResponseParser::ParseList("[{\"object\": \"a\"}, {\"object\": \"b\"}]").size() == 2);
    assert(LlmResponseParser::ParseList("{\"tuples\": [{\"object\": \"a\"}]}").size() == 1);
    assert(LlmResponseParser::ParseList("{\"object\": \"Vegan Diet\"}").size() == 1);
    assert(LlmResponseParser::ParseList("```json\n[{\"object\": \"a\"}]\n```").size() == 1);
    assert(LlmResponseParser::ParseList("nothing useful").empty());
    assert(LlmResponseParser::ParseList("42").empty());
}

void TestOllamaPayloads() {
    auto request = OllamaClient::BuildGenerateRequest("qwen2.5:7b", "hello", true);
    assert(request["model"] == "qwen2.5:7b");
    assert(request["stream"] == false);
    assert(request["format"] == "json");
    assert(request["options"]["temperature"] == 0.0);
    assert(request["options"]["seed"] == 42);
    assert(!OllamaClient::BuildGenerateRequest("m", "p", false).contains("format"));

    auto reply = OllamaClient::ReadGenerateResponse(R"({"model": "m", "response": "{\"intent\": \"x\"}", "done": true})");
    assert(reply && *reply == "{\"intent\": \"x\"}");
    assert(!OllamaClient::ReadGenerateResponse(R"({"done": true})"));
    assert(!OllamaClient::ReadGenerateResponse("<html>"));

    auto names = OllamaClient::ReadModelNames(R"({"models": [{"name": "qwen2.5:7b"}, {"size": 1}, {"name": "llama3"}]})");
    assert((names == std::vector<std::string>{"qwen2.5:7b", "llama3"}));
    assert(OllamaClient::ReadModelNames("{}").empty());
}

} // namespace

int main() {
    std::cout << "[Test] Starting PromptAnalyzer Test..." << std::endl;

    TestKeywordAnalysis();
    TestOllamaAnalyzerFallsBackWhenDisabled();
    TestReplyNormalization();
    TestResponseParsing();
    TestOllamaPayloads();

    std::cout << "[PASS] PromptAnalyzer Test." << std::endl;
    return 0;
}
