/**
 * @file ContextPackService.cpp
 * @brief Implementation of ContextPackService.
 */

#include "application/ContextPackService.hpp"
#include "infrastructure/TimeUtils.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace contextwallet::application {

using domain::CardExclusion;
using domain::ExclusionReason;
using domain::MemoryCard;
using domain::ScoredCard;

namespace {

std::vector<ScoredCard> ApplySensitivity(domain::SensitivityMode mode, std::vector<ScoredCard> ranked) {
    // Every mode currently passes the ranked list through unchanged.
    switch (mode) {
        case domain::SensitivityMode::Quiet:
        case domain::SensitivityMode::Normal:
        case domain::SensitivityMode::Verbose:
            break;
    }
    return ranked;
}

domain::UsedCard ToUsedCard(const MemoryCard& card, float relevance) {
    domain::UsedCard used;
    used.id = card.id;
    used.type = card.type;
    used.text = card.text;
    used.domain = card.domain;
    used.relevanceScore = relevance;
    return used;
}

std::string ShortText(const std::string& text) {
    constexpr std::size_t kMaxLogText = 50;
    if (text.size() <= kMaxLogText) return text;
    return text.substr(0, kMaxLogText) + "...";
}

std::string JoinComma(const std::vector<std::string>& values) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << values[i];
    }
    return oss.str();
}

} // namespace

ContextPackService::ContextPackService(std::shared_ptr<domain::CardRepository> repository,
                                       std::shared_ptr<domain::PromptAnalyzer> analyzer,
                                       std::shared_ptr<domain::GraphTagSearch> graphSearch,
                                       Options options,
                                       Clock clock)
    : m_repository(std::move(repository)),
      m_analyzer(std::move(analyzer)),
      m_graphSearch(std::move(graphSearch)),
      m_options(options),
      m_clock(std::move(clock)),
      m_scorer(options.weights) {
    if (!m_repository) {
        throw std::invalid_argument("ContextPackService requires a card repository");
    }
    if (!m_clock) {
        m_clock = [] { return std::chrono::system_clock::now(); };
    }
}

std::vector<MemoryCard> ContextPackService::loadCandidates(const std::string& persona,
                                                           std::vector<CardExclusion>& exclusions) {
    std::vector<MemoryCard> raw;
    try {
        raw = m_repository->getCards(persona);
    } catch (const std::exception& e) {
        std::cerr << "[ContextPackService] Card repository unavailable: " << e.what() << std::endl;
        return {};
    }

    std::vector<MemoryCard> candidates;
    candidates.reserve(raw.size());
    for (auto& card : raw) {
        if (!card.isValid()) {
            std::cerr << "[ContextPackService] Skipping malformed card '" << card.id << "'" << std::endl;
            exclusions.push_back({card.id, ExclusionReason::Malformed, "invalid"});
            continue;
        }
        if (card.persona != persona) {
            std::cerr << "[ContextPackService] Skipping card '" << card.id << "' of persona '"
                      << card.persona << "'" << std::endl;
            exclusions.push_back({card.id, ExclusionReason::Malformed, "persona " + card.persona});
            continue;
        }
        candidates.push_back(std::move(card));
    }
    return candidates;
}

domain::PromptAnalysis ContextPackService::analyzePrompt(const std::string& promptText) {
    if (!m_analyzer) {
        return m_fallbackAnalyzer.analyze(promptText);
    }
    try {
        return m_analyzer->analyze(promptText);
    } catch (const std::exception& e) {
        std::cerr << "[ContextPackService] Prompt analyzer failed, using keyword analysis: "
                  << e.what() << std::endl;
        return m_fallbackAnalyzer.analyze(promptText);
    }
}

int ContextPackService::countGraphHints(const domain::PromptAnalysis& analysis,
                                        const std::string& persona,
                                        const std::vector<MemoryCard>& candidates) {
    if (!m_options.graphRetrieval || !m_graphSearch || analysis.keywords.empty()) {
        return 0;
    }

    std::vector<std::string> searchTags = analysis.domains;
    searchTags.insert(searchTags.end(), analysis.keywords.begin(), analysis.keywords.end());

    std::vector<std::string> relatedIds;
    try {
        relatedIds = m_graphSearch->relatedCardIdsByTags(searchTags, persona, m_options.graphLimit);
    } catch (const std::exception& e) {
        std::cerr << "[ContextPackService] Graph retrieval failed: " << e.what() << std::endl;
        return 0;
    }

    std::unordered_set<std::string> candidateIds;
    for (const auto& card : candidates) candidateIds.insert(card.id);

    std::unordered_set<std::string> hits;
    for (const auto& id : relatedIds) {
        if (candidateIds.count(id) > 0) hits.insert(id);
    }
    if (!hits.empty()) {
        std::clog << "[ContextPackService] Graph found " << hits.size() << " related cards" << std::endl;
    }
    return static_cast<int>(hits.size());
}

domain::ContextPack ContextPackService::emptyPack(const domain::ContextPackRequest& request,
                                                  std::vector<CardExclusion> exclusions) const {
    domain::ContextPack pack;
    pack.persona = request.persona;
    pack.sensitivityMode = request.sensitivityMode;
    pack.generatedAt = infrastructure::TimeUtils::ToIsoTimestamp(m_clock());
    pack.exclusions = std::move(exclusions);
    return pack;
}

domain::ContextPack ContextPackService::build(const domain::ContextPackRequest& request) {
    std::clog << "[ContextPackService] Generating pack for persona '" << request.persona
              << "' (prompt " << request.draftPrompt.size() << " chars, site '" << request.siteId << "')"
              << std::endl;

    std::vector<CardExclusion> exclusions;
    std::vector<MemoryCard> candidates = loadCandidates(request.persona, exclusions);
    if (candidates.empty()) {
        std::clog << "[ContextPackService] No cards for persona '" << request.persona << "'" << std::endl;
        return emptyPack(request, std::move(exclusions));
    }

    const domain::PromptAnalysis analysis = analyzePrompt(request.draftPrompt);
    std::clog << "[ContextPackService] Intent: " << analysis.intent
              << " | Domains: " << JoinComma(analysis.domains) << std::endl;

    const int graphHints = countGraphHints(analysis, request.persona, candidates);

    std::vector<ScoredCard> eligible;
    for (const auto& card : candidates) {
        auto conflict = m_detector.findConflict(card.text, request.draftPrompt, analysis.explicitPreferences);
        if (conflict) {
            std::clog << "[ContextPackService] Excluding contradicting card: " << ShortText(card.text)
                      << " (" << conflict->axis << ")" << std::endl;
            exclusions.push_back({card.id, ExclusionReason::PromptConflict, conflict->axis});
            continue;
        }

        const float score = m_scorer.score(card, analysis, request.draftPrompt);
        if (score >= request.minRelevance) {
            eligible.push_back({card, score});
        } else {
            std::ostringstream detail;
            detail << std::fixed << std::setprecision(3) << score;
            exclusions.push_back({card.id, ExclusionReason::BelowThreshold, detail.str()});
        }
    }

    std::stable_sort(eligible.begin(), eligible.end(), [](const ScoredCard& a, const ScoredCard& b) {
        return a.relevanceScore > b.relevanceScore;
    });

    auto arbitration = m_arbiter.arbitrate(eligible);
    for (const auto& drop : arbitration.dropped) {
        std::clog << "[ContextPackService] Conflict resolved: profile card '" << drop.winnerId
                  << "' wins over extracted card '" << drop.cardId << "' (" << drop.axis << ")" << std::endl;
        exclusions.push_back({drop.cardId, ExclusionReason::ProfileConflict, drop.winnerId});
    }

    std::vector<ScoredCard> ranked = ApplySensitivity(request.sensitivityMode, std::move(arbitration.kept));

    auto selection = m_formatter.select(ranked, request.maxCards);
    for (const auto& over : selection.overflow) {
        exclusions.push_back({over.card.id, ExclusionReason::OverCap, ""});
    }

    domain::ContextPack pack = emptyPack(request, std::move(exclusions));
    pack.graphHintCount = graphHints;

    std::vector<MemoryCard> selectedCards;
    selectedCards.reserve(selection.selected.size());
    for (const auto& scored : selection.selected) {
        selectedCards.push_back(scored.card);
        pack.usedCards.push_back(ToUsedCard(scored.card, scored.relevanceScore));
    }
    pack.packText = m_formatter.render(selectedCards);
    pack.cardCount = static_cast<int>(pack.usedCards.size());

    std::clog << "[ContextPackService] Pack generated with " << pack.cardCount << " cards ("
              << eligible.size() << " eligible of " << candidates.size() << ")" << std::endl;
    return pack;
}

domain::ContextPack ContextPackService::preview(const std::string& persona, int maxCards) {
    domain::ContextPackRequest request;
    request.persona = persona;
    request.maxCards = maxCards;

    std::vector<CardExclusion> exclusions;
    std::vector<MemoryCard> candidates = loadCandidates(persona, exclusions);

    std::vector<ScoredCard> listed;
    listed.reserve(candidates.size());
    for (const auto& card : candidates) {
        listed.push_back({card, 1.0f});
    }

    auto selection = m_formatter.select(listed, maxCards);
    for (const auto& over : selection.overflow) {
        exclusions.push_back({over.card.id, ExclusionReason::OverCap, ""});
    }

    domain::ContextPack pack = emptyPack(request, std::move(exclusions));
    std::vector<MemoryCard> selectedCards;
    for (const auto& scored : selection.selected) {
        selectedCards.push_back(scored.card);
        pack.usedCards.push_back(ToUsedCard(scored.card, scored.relevanceScore));
    }
    pack.packText = m_formatter.render(selectedCards);
    pack.cardCount = static_cast<int>(pack.usedCards.size());
    return pack;
}

} // namespace contextwallet::application
