/**
 * @file TextTokens.hpp
 * @brief Lowercasing, tokenization and phrase lookup shared by the selection services.
 */

#pragma once

#include <string>
#include <unordered_set>
#include <vector>

namespace contextwallet::domain::selection {

/** @brief ASCII lowercase copy. */
std::string ToLower(const std::string& input);

/**
 * @brief Splits text into lowercase alphanumeric words, in order of appearance.
 * Everything that is not a letter or digit is a separator.
 */
std::vector<std::string> Tokenize(const std::string& text);

/** @brief Tokenize() collected into a set. */
std::unordered_set<std::string> WordSet(const std::string& text);

/**
 * @brief True if any phrase is a substring of the haystack.
 * @param haystackLower Already lowercased text.
 * @param phrases Lowercase phrases.
 */
bool ContainsAnyPhrase(const std::string& haystackLower, const std::vector<std::string>& phrases);

} // namespace contextwallet::domain::selection
