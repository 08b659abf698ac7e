#include "infrastructure/TagIndexGraphSearch.hpp"
#include "domain/selection/TextTokens.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace contextwallet::infrastructure {

TagIndexGraphSearch::TagIndexGraphSearch(std::shared_ptr<domain::CardRepository> repository)
    : m_repository(std::move(repository)) {}

std::vector<std::string> TagIndexGraphSearch::relatedCardIdsByTags(const std::vector<std::string>& tags,
                                                                   const std::string& persona,
                                                                   int limit) {
    if (!m_repository || tags.empty() || limit <= 0) return {};

    std::unordered_set<std::string> wanted;
    for (const auto& tag : tags) {
        if (!tag.empty()) wanted.insert(domain::selection::ToLower(tag));
    }

    // tag -> positions of the cards carrying it
    const auto cards = m_repository->getCards(persona);
    std::unordered_map<std::string, std::vector<std::size_t>> index;
    for (std::size_t i = 0; i < cards.size(); ++i) {
        std::unordered_set<std::string> labels;
        for (const auto& tag : cards[i].tags) labels.insert(domain::selection::ToLower(tag));
        for (const auto& d : cards[i].domain) labels.insert(domain::selection::ToLower(d));
        for (const auto& label : labels) index[label].push_back(i);
    }

    std::vector<int> matchCount(cards.size(), 0);
    for (const auto& tag : wanted) {
        auto it = index.find(tag);
        if (it == index.end()) continue;
        for (std::size_t position : it->second) ++matchCount[position];
    }

    std::vector<std::size_t> ranked;
    for (std::size_t i = 0; i < cards.size(); ++i) {
        if (matchCount[i] > 0) ranked.push_back(i);
    }
    std::stable_sort(ranked.begin(), ranked.end(), [&](std::size_t a, std::size_t b) {
        return matchCount[a] > matchCount[b];
    });
    if (ranked.size() > static_cast<std::size_t>(limit)) {
        ranked.resize(static_cast<std::size_t>(limit));
    }

    std::vector<std::string> ids;
    ids.reserve(ranked.size());
    for (std::size_t position : ranked) ids.push_back(cards[position].id);
    return ids;
}

} // namespace contextwallet::infrastructure
