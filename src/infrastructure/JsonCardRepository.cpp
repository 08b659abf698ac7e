/**
 * @file JsonCardRepository.cpp
 * @brief Implementation of JsonCardRepository.
 */

#include "infrastructure/JsonCardRepository.hpp"
#include "infrastructure/JsonMapping.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <unordered_set>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace contextwallet::infrastructure {

using json = nlohmann::json;

JsonCardRepository::JsonCardRepository(fs::path cardsPath)
    : m_cardsPath(std::move(cardsPath)) {}

std::vector<domain::MemoryCard> JsonCardRepository::readFile() {
    if (!fs::exists(m_cardsPath)) {
        return {};
    }

    std::ifstream file(m_cardsPath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open card file: " + m_cardsPath.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    if (buffer.str().find_first_not_of(" \t\r\n") == std::string::npos) {
        return {};
    }

    json root = json::parse(buffer.str(), nullptr, false);
    if (root.is_discarded() || !root.is_array()) {
        throw std::runtime_error("Card file is not a JSON array: " + m_cardsPath.string());
    }

    std::vector<domain::MemoryCard> cards;
    cards.reserve(root.size());
    for (std::size_t i = 0; i < root.size(); ++i) {
        std::string error;
        std::optional<domain::MemoryCard> card;
        try {
            card = CardFromJson(root[i], error);
        } catch (const json::exception& e) {
            error = e.what();
        }
        if (!card) {
            std::cerr << "[JsonCardRepository] Skipping record " << i << ": " << error << std::endl;
            continue;
        }
        cards.push_back(std::move(*card));
    }
    return cards;
}

bool JsonCardRepository::writeFile(const std::vector<domain::MemoryCard>& cards) {
    json root = json::array();
    for (const auto& card : cards) {
        root.push_back(CardToJson(card));
    }

    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = m_cardsPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    try {
        if (m_cardsPath.has_parent_path() && !fs::exists(m_cardsPath.parent_path())) {
            fs::create_directories(m_cardsPath.parent_path());
        }
    } catch (const std::exception& e) {
        std::cerr << "[JsonCardRepository] Error creating directories: " << e.what() << std::endl;
        return false;
    }

    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            std::cerr << "[JsonCardRepository] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << root.dump(4);
        if (ofs.fail()) {
            std::cerr << "[JsonCardRepository] Write failed: " << tempPath << std::endl;
            std::error_code ec;
            fs::remove(tempPath, ec);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tempPath, m_cardsPath, ec);
    if (ec) {
        std::cerr << "[JsonCardRepository] Rename failed: " << ec.message() << std::endl;
        fs::remove(tempPath, ec);
        return false;
    }
    return true;
}

std::vector<domain::MemoryCard> JsonCardRepository::loadAll() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return readFile();
}

std::vector<domain::MemoryCard> JsonCardRepository::getCards(const std::string& persona,
                                                             const std::optional<std::string>& domainFilter) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<domain::MemoryCard> result;
    for (auto& card : readFile()) {
        if (card.persona != persona) continue;
        if (domainFilter) {
            const bool matches = std::any_of(card.domain.begin(), card.domain.end(), [&](const std::string& d) {
                return d.find(*domainFilter) != std::string::npos;
            });
            if (!matches) continue;
        }
        result.push_back(std::move(card));
    }
    return result;
}

int JsonCardRepository::addCards(const std::vector<domain::MemoryCard>& cards) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<domain::MemoryCard> existing;
    try {
        existing = readFile();
    } catch (const std::exception& e) {
        std::cerr << "[JsonCardRepository] Refusing to write: " << e.what() << std::endl;
        return 0;
    }

    std::unordered_set<std::string> ids;
    for (const auto& card : existing) ids.insert(card.id);

    int added = 0;
    for (const auto& card : cards) {
        if (!card.isValid()) {
            std::cerr << "[JsonCardRepository] Not storing invalid card '" << card.id << "'" << std::endl;
            continue;
        }
        if (!ids.insert(card.id).second) {
            std::cerr << "[JsonCardRepository] Duplicate card id '" << card.id << "', skipping" << std::endl;
            continue;
        }
        existing.push_back(card);
        ++added;
    }

    if (added == 0) return 0;
    return writeFile(existing) ? added : 0;
}

bool JsonCardRepository::deleteCard(const std::string& cardId) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<domain::MemoryCard> cards;
    try {
        cards = readFile();
    } catch (const std::exception& e) {
        std::cerr << "[JsonCardRepository] Cannot delete: " << e.what() << std::endl;
        return false;
    }

    auto it = std::remove_if(cards.begin(), cards.end(), [&](const domain::MemoryCard& card) {
        return card.id == cardId;
    });
    if (it == cards.end()) return false;
    cards.erase(it, cards.end());
    return writeFile(cards);
}

} // namespace contextwallet::infrastructure
