#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <iostream>

namespace contextwallet::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kDeterministicTemperature = 0.0;
constexpr double kDeterministicTopP = 1.0;
constexpr int kDeterministicSeed = 42;
constexpr int kProbeTimeoutSeconds = 5;
}

OllamaClient::OllamaClient(const std::string& host, int port, int timeoutSeconds)
    : m_host(host), m_port(port), m_timeoutSeconds(timeoutSeconds) {}

std::unique_ptr<httplib::Client> OllamaClient::makeClient(int readTimeoutSeconds) const {
    auto cli = std::make_unique<httplib::Client>(m_host, m_port);
    cli->set_connection_timeout(kProbeTimeoutSeconds);
    cli->set_read_timeout(readTimeoutSeconds);
    return cli;
}

json OllamaClient::BuildGenerateRequest(const std::string& model, const std::string& prompt, bool forceJson) {
    json request = {
        {"model", model},
        {"prompt", prompt},
        {"stream", false},
        {"options", {
            {"temperature", kDeterministicTemperature},
            {"top_p", kDeterministicTopP},
            {"seed", kDeterministicSeed}
        }}
    };
    if (forceJson) {
        request["format"] = "json";
    }
    return request;
}

std::optional<std::string> OllamaClient::ReadGenerateResponse(const std::string& body) {
    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        std::cerr << "[OllamaClient] Reply is not JSON (" << body.size() << " bytes)" << std::endl;
        return std::nullopt;
    }
    auto it = parsed.find("response");
    if (it == parsed.end() || !it->is_string()) {
        std::cerr << "[OllamaClient] Reply has no 'response' string" << std::endl;
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::vector<std::string> OllamaClient::ReadModelNames(const std::string& body) {
    std::vector<std::string> names;
    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.contains("models") || !parsed["models"].is_array()) {
        return names;
    }
    for (const auto& model : parsed["models"]) {
        if (model.is_object() && model.contains("name") && model["name"].is_string()) {
            names.push_back(model["name"].get<std::string>());
        }
    }
    return names;
}

std::optional<std::string> OllamaClient::generate(const std::string& model,
                                                  const std::string& prompt,
                                                  bool forceJson) {
    auto cli = makeClient(m_timeoutSeconds);
    const json request = BuildGenerateRequest(model, prompt, forceJson);

    auto res = cli->Post("/api/generate", request.dump(), "application/json");
    if (!res) {
        std::cerr << "[OllamaClient] Cannot reach " << m_host << ":" << m_port
                  << " (error " << static_cast<int>(res.error()) << ")" << std::endl;
        return std::nullopt;
    }
    if (res->status != 200) {
        std::cerr << "[OllamaClient] /api/generate returned HTTP " << res->status << " for model '"
                  << model << "'" << std::endl;
        return std::nullopt;
    }
    return ReadGenerateResponse(res->body);
}

std::optional<std::string> OllamaClient::getBody(const std::string& path) {
    auto cli = makeClient(kProbeTimeoutSeconds);
    auto res = cli->Get(path);
    if (!res || res->status != 200) {
        return std::nullopt;
    }
    return res->body;
}

std::vector<std::string> OllamaClient::getAvailableModels() {
    auto body = getBody("/api/tags");
    if (!body) return {};
    return ReadModelNames(*body);
}

bool OllamaClient::isAvailable() {
    return getBody("/api/tags").has_value();
}

} // namespace contextwallet::infrastructure
