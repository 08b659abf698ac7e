/**
 * @file GraphTagSearch.hpp
 * @brief Optional supplementary lookup of cards related by tags.
 */

#pragma once

#include <string>
#include <vector>

namespace contextwallet::domain {

/**
 * @class GraphTagSearch
 * @brief Returns ids of cards sharing tags with the search set.
 *
 * May throw on backend failure; callers treat a failure as an empty result.
 */
class GraphTagSearch {
public:
    virtual ~GraphTagSearch() = default;

    virtual std::vector<std::string> relatedCardIdsByTags(const std::vector<std::string>& tags,
                                                          const std::string& persona,
                                                          int limit) = 0;
};

} // namespace contextwallet::domain
