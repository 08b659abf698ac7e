/**
 * @file TagIndexGraphSearch.hpp
 * @brief In-process GraphTagSearch over card tags and domains.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "domain/CardRepository.hpp"
#include "domain/GraphTagSearch.hpp"

namespace contextwallet::infrastructure {

/**
 * @class TagIndexGraphSearch
 * @brief Treats cards and their tags/domains as a bipartite graph and ranks cards by shared tags.
 *
 * The index is rebuilt from the repository on every query.
 */
class TagIndexGraphSearch : public domain::GraphTagSearch {
public:
    explicit TagIndexGraphSearch(std::shared_ptr<domain::CardRepository> repository);

    /** @return Ids ordered by matched tag count (descending), then repository order. */
    std::vector<std::string> relatedCardIdsByTags(const std::vector<std::string>& tags,
                                                  const std::string& persona,
                                                  int limit) override;

private:
    std::shared_ptr<domain::CardRepository> m_repository;
};

} // namespace contextwallet::infrastructure
