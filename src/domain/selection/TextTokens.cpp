#include "domain/selection/TextTokens.hpp"

#include <cctype>

namespace contextwallet::domain::selection {

std::string ToLower(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

std::vector<std::string> Tokenize(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            words.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        words.push_back(current);
    }
    return words;
}

std::unordered_set<std::string> WordSet(const std::string& text) {
    auto words = Tokenize(text);
    return std::unordered_set<std::string>(words.begin(), words.end());
}

bool ContainsAnyPhrase(const std::string& haystackLower, const std::vector<std::string>& phrases) {
    for (const auto& phrase : phrases) {
        if (!phrase.empty() && haystackLower.find(phrase) != std::string::npos) return true;
    }
    return false;
}

} // namespace contextwallet::domain::selection
