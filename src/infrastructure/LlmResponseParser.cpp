/**
 * @file LlmResponseParser.cpp
 * @brief Implementation of LlmResponseParser.
 */

#include "infrastructure/LlmResponseParser.hpp"

namespace contextwallet::infrastructure {

using json = nlohmann::json;

namespace {

std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::optional<json> ParseSpan(const std::string& content, char open, char close) {
    const auto start = content.find(open);
    const auto end = content.rfind(close);
    if (start == std::string::npos || end == std::string::npos || end <= start) {
        return std::nullopt;
    }
    json parsed = json::parse(content.substr(start, end - start + 1), nullptr, false);
    if (parsed.is_discarded()) return std::nullopt;
    return parsed;
}

} // namespace

std::string LlmResponseParser::StripCodeFence(const std::string& content) {
    std::string text = Trim(content);

    const std::string jsonFence = "```json";
    const std::string fence = "```";

    auto start = text.find(jsonFence);
    std::size_t bodyStart = std::string::npos;
    if (start != std::string::npos) {
        bodyStart = start + jsonFence.size();
    } else {
        start = text.find(fence);
        if (start != std::string::npos) bodyStart = start + fence.size();
    }
    if (bodyStart == std::string::npos) return text;

    const auto end = text.find(fence, bodyStart);
    return Trim(text.substr(bodyStart, end == std::string::npos ? std::string::npos : end - bodyStart));
}

std::optional<json> LlmResponseParser::Parse(const std::string& content) {
    const std::string text = StripCodeFence(content);
    if (text.empty()) return std::nullopt;

    json parsed = json::parse(text, nullptr, false);
    if (!parsed.is_discarded()) return parsed;

    if (auto array = ParseSpan(text, '[', ']')) return array;
    return ParseSpan(text, '{', '}');
}

std::optional<json> LlmResponseParser::ParseObject(const std::string& content) {
    auto parsed = Parse(content);
    if (parsed && parsed->is_object()) return parsed;

    // A reply like "Sure: {...}" parses as nothing above; retry on the braces.
    auto object = ParseSpan(StripCodeFence(content), '{', '}');
    if (object && object->is_object()) return object;
    return std::nullopt;
}

json LlmResponseParser::ParseList(const std::string& content) {
    auto parsed = Parse(content);
    if (!parsed) return json::array();

    if (parsed->is_array()) return *parsed;
    if (parsed->is_object()) {
        if (parsed->contains("tuples") && (*parsed)["tuples"].is_array()) {
            return (*parsed)["tuples"];
        }
        return json::array({*parsed});
    }
    return json::array();
}

} // namespace contextwallet::infrastructure
