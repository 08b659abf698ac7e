/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace httplib {
class Client;
}

namespace contextwallet::infrastructure {

/**
 * @class OllamaClient
 * @brief Blocking client for /api/generate and /api/tags.
 *
 * Every call opens its own connection, so one instance may be shared by the
 * prompt analyzer and the tuple extractor. Failures are logged and reported
 * as an empty result.
 */
class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434, int timeoutSeconds = 30);

    /** @brief Sends a prompt to /api/generate. Sampling is pinned for reproducible output. */
    std::optional<std::string> generate(const std::string& model,
                                        const std::string& prompt,
                                        bool forceJson = false);

    /** @brief Names of the locally installed models. */
    std::vector<std::string> getAvailableModels();

    bool isAvailable();

    /** @brief Non-streaming /api/generate body with temperature 0, top_p 1 and a fixed seed. */
    static nlohmann::json BuildGenerateRequest(const std::string& model, const std::string& prompt, bool forceJson);

    /** @brief Extracts the "response" string of a /api/generate reply body. */
    static std::optional<std::string> ReadGenerateResponse(const std::string& body);

    /** @brief Extracts model names from a /api/tags reply body. Invalid entries are skipped. */
    static std::vector<std::string> ReadModelNames(const std::string& body);

    const std::string& host() const { return m_host; }
    int port() const { return m_port; }

private:
    std::unique_ptr<httplib::Client> makeClient(int readTimeoutSeconds) const;
    std::optional<std::string> getBody(const std::string& path);

    std::string m_host;
    int m_port;
    int m_timeoutSeconds;
};

} // namespace contextwallet::infrastructure
