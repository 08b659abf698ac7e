/**
 * @file LlmResponseParser.hpp
 * @brief Tolerant JSON recovery from free-form model replies.
 */

#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace contextwallet::infrastructure {

class LlmResponseParser {
public:
    /** @brief Removes surrounding whitespace and a ```json / ``` fence, if any. */
    static std::string StripCodeFence(const std::string& content);

    /**
     * @brief Parses the reply as JSON, falling back to the outermost [...] and then {...} span.
     * @return nullopt if no JSON value could be recovered.
     */
    static std::optional<nlohmann::json> Parse(const std::string& content);

    /** @brief Parse() restricted to objects. */
    static std::optional<nlohmann::json> ParseObject(const std::string& content);

    /**
     * @brief Always returns an array: a single object is wrapped, {"tuples": [...]} is unwrapped.
     * Anything unrecoverable yields an empty array.
     */
    static nlohmann::json ParseList(const std::string& content);
};

} // namespace contextwallet::infrastructure
