/**
 * @file JsonCardRepository.hpp
 * @brief Card store backed by a single JSON array file.
 */

#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>
#include "domain/CardRepository.hpp"

namespace contextwallet::infrastructure {

/**
 * @class JsonCardRepository
 * @brief Reads the card file on every call; writes go through a temp file and a rename.
 *
 * A missing file is an empty wallet. Records that cannot be read are skipped
 * with a warning. A file that is not a JSON array makes getCards() throw
 * std::runtime_error and addCards() refuse to write.
 */
class JsonCardRepository : public domain::CardRepository, public domain::CardWriter {
public:
    explicit JsonCardRepository(std::filesystem::path cardsPath);

    std::vector<domain::MemoryCard> getCards(const std::string& persona,
                                             const std::optional<std::string>& domainFilter = std::nullopt) override;

    int addCards(const std::vector<domain::MemoryCard>& cards) override;
    bool deleteCard(const std::string& cardId) override;

    /** @brief Every readable card regardless of persona, in file order. */
    std::vector<domain::MemoryCard> loadAll();

    const std::filesystem::path& path() const { return m_cardsPath; }

private:
    std::vector<domain::MemoryCard> readFile();
    bool writeFile(const std::vector<domain::MemoryCard>& cards);

    std::filesystem::path m_cardsPath;
    std::mutex m_mutex;
};

} // namespace contextwallet::infrastructure
