/**
 * @file ContextPackService.hpp
 * @brief Orchestrates filtering, veto, scoring, arbitration and rendering of a context pack.
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "domain/CardRepository.hpp"
#include "domain/ContextPack.hpp"
#include "domain/GraphTagSearch.hpp"
#include "domain/KeywordPromptAnalyzer.hpp"
#include "domain/PromptAnalyzer.hpp"
#include "domain/selection/ConflictArbiter.hpp"
#include "domain/selection/ContradictionDetector.hpp"
#include "domain/selection/PackFormatter.hpp"
#include "domain/selection/RelevanceScorer.hpp"

namespace contextwallet::application {

/**
 * @struct ContextPackOptions
 * @brief Service-wide tuning that does not vary per request.
 */
struct ContextPackOptions {
    bool graphRetrieval = true;
    int graphLimit = 20;
    domain::selection::ScoringWeights weights;
};

/**
 * @class ContextPackService
 * @brief Builds the bounded, formatted block of memory cards for a draft prompt.
 *
 * Every failure of an external collaborator degrades instead of propagating:
 * an unreadable repository yields an empty pack, a failing analyzer falls back
 * to keyword analysis, a failing graph search contributes no hints.
 * For identical repository contents, analysis and request the result is
 * identical apart from generatedAt.
 */
class ContextPackService {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    using Options = ContextPackOptions;

    /**
     * @param repository Card source. Required.
     * @param analyzer Prompt analyzer; null means keyword analysis only.
     * @param graphSearch Optional tag graph; null disables graph hints.
     * @param clock Source of generatedAt; defaults to system_clock::now.
     */
    ContextPackService(std::shared_ptr<domain::CardRepository> repository,
                       std::shared_ptr<domain::PromptAnalyzer> analyzer,
                       std::shared_ptr<domain::GraphTagSearch> graphSearch = nullptr,
                       Options options = Options{},
                       Clock clock = nullptr);

    domain::ContextPack build(const domain::ContextPackRequest& request);

    /**
     * @brief Debug view of the first maxCards valid cards of a persona.
     * No prompt is involved, so every card is reported with relevance 1.0.
     */
    domain::ContextPack preview(const std::string& persona, int maxCards);

private:
    std::vector<domain::MemoryCard> loadCandidates(const std::string& persona,
                                                   std::vector<domain::CardExclusion>& exclusions);
    domain::PromptAnalysis analyzePrompt(const std::string& promptText);
    int countGraphHints(const domain::PromptAnalysis& analysis,
                        const std::string& persona,
                        const std::vector<domain::MemoryCard>& candidates);
    domain::ContextPack emptyPack(const domain::ContextPackRequest& request,
                                  std::vector<domain::CardExclusion> exclusions) const;

    std::shared_ptr<domain::CardRepository> m_repository;
    std::shared_ptr<domain::PromptAnalyzer> m_analyzer;
    std::shared_ptr<domain::GraphTagSearch> m_graphSearch;
    Options m_options;
    Clock m_clock;

    domain::KeywordPromptAnalyzer m_fallbackAnalyzer;
    domain::selection::ContradictionDetector m_detector;
    domain::selection::RelevanceScorer m_scorer;
    domain::selection::ConflictArbiter m_arbiter;
    domain::selection::PackFormatter m_formatter;
};

} // namespace contextwallet::application
