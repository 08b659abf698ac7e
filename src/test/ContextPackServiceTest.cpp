#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "application/ContextPackService.hpp"
#include "domain/KeywordPromptAnalyzer.hpp"
#include "infrastructure/TimeUtils.hpp"
#include "test/TestFakes.hpp"

using namespace contextwallet::domain;
using contextwallet::application::ContextPackService;
using namespace contextwallet::test;

namespace {

// 2026-01-01T00:00:00Z
ContextPackService::Clock FixedClock() {
    return [] { return std::chrono::system_clock::from_time_t(1767225600); };
}

const CardExclusion* FindExclusion(const ContextPack& pack, const std::string& cardId) {
    for (const auto& exclusion : pack.exclusions) {
        if (exclusion.cardId == cardId) return &exclusion;
    }
    return nullptr;
}

bool Uses(const ContextPack& pack, const std::string& cardId) {
    for (const auto& used : pack.usedCards) {
        if (used.id == cardId) return true;
    }
    return false;
}

ContextPackRequest Request(const std::string& prompt, float minRelevance = 0.5f, int maxCards = 12) {
    ContextPackRequest request;
    request.persona = "Personal";
    request.draftPrompt = prompt;
    request.siteId = "test";
    request.minRelevance = minRelevance;
    request.maxCards = maxCards;
    return request;
}

struct Fixture {
    std::shared_ptr<FakeCardRepository> repo = std::make_shared<FakeCardRepository>();
    std::shared_ptr<FakeGraphSearch> graph;

    ContextPackService Service(std::shared_ptr<PromptAnalyzer> analyzer = std::make_shared<KeywordPromptAnalyzer>(),
                               ContextPackService::Options options = ContextPackService::Options{}) {
        return ContextPackService(repo, std::move(analyzer), graph, options, FixedClock());
    }
};

const MemoryCard kQualityProfile =
    MakeCard("p1", "User prioritizes quality over price, not the cheapest option", {"profile"});
const MemoryCard kCheapGoal = MakeCard("e1", "User's goal: cheapest pans possible", {"extracted"});

void TestCheapPromptVetoesQualityProfile() {
    Fixture f;
    f.repo->cards = {kQualityProfile, kCheapGoal};
    auto pack = f.Service().build(Request("find me the cheapest pans"));

    // The prompt explicitly asks for cheap, which the quality-first card contradicts.
    assert(!Uses(pack, "p1"));
    const auto* veto = FindExclusion(pack, "p1");
    assert(veto && veto->reason == ExclusionReason::PromptConflict);
    assert(veto->detail == "price_quality");

    // The cheap-seeking goal agrees with the prompt and survives: (0.8 + 0.16) * 0.9
    assert(pack.cardCount == 1);
    assert(pack.usedCards[0].id == "e1");
    assert(Near(pack.usedCards[0].relevanceScore, 0.864f));
}

void TestProfileWinsArbitration() {
    Fixture f;
    f.repo->cards = {kQualityProfile, kCheapGoal};
    auto pack = f.Service().build(Request("recommend some pans for my kitchen", 0.2f));

    assert(pack.cardCount == 1);
    assert(pack.usedCards[0].id == "p1");
    assert(Near(pack.usedCards[0].relevanceScore, 0.30f));

    const auto* drop = FindExclusion(pack, "e1");
    assert(drop && drop->reason == ExclusionReason::ProfileConflict);
    assert(drop->detail == "p1");

    assert(pack.packText.find("• User prioritizes quality over price, not the cheapest option") != std::string::npos);
    assert(pack.packText.find("cheapest pans possible") == std::string::npos);
}

void TestEmptyPersona() {
    Fixture f;
    auto pack = f.Service().build(Request("find me the cheapest pans"));
    assert(pack.packText.empty());
    assert(pack.cardCount == 0);
    assert(pack.isEmpty());
    assert(pack.persona == "Personal");
    assert(pack.generatedAt == "2026-01-01T00:00:00Z");
}

void TestHighThresholdYieldsEmptyPack() {
    Fixture f;
    f.repo->cards = {MakeCard("s1", "User owns a gas stove", {}, {"shopping"})};
    auto pack = f.Service().build(Request("find me the cheapest pans", 0.9f));
    assert(pack.packText.empty());
    assert(pack.cardCount == 0);
    const auto* below = FindExclusion(pack, "s1");
    assert(below && below->reason == ExclusionReason::BelowThreshold);
    assert(below->detail == "0.400");
}

void TestConversationalCardAlwaysEligible() {
    Fixture f;
    f.repo->cards = {MakeCard("c1", "Prefers concise answers with bullet points", {"profile"}, {"communication"})};

    PromptAnalysis analysis;
    analysis.intent = "shopping";
    analysis.domains = {"shopping"};
    auto pack = f.Service(std::make_shared<FixedPromptAnalyzer>(analysis)).build(Request("buy pans", 0.3f));

    assert(pack.cardCount == 1);
    assert(Near(pack.usedCards[0].relevanceScore, 0.65f));
    assert(pack.packText.find("PREFERENCES:") != std::string::npos);
}

void TestTiesKeepRepositoryOrder() {
    const auto stove = MakeCard("t1", "User owns a gas stove", {}, {"shopping"});
    const auto flat = MakeCard("t2", "User lives in a small apartment", {}, {"shopping"});

    Fixture f;
    f.repo->cards = {stove, flat};
    auto pack = f.Service().build(Request("find me the cheapest pans", 0.3f));
    assert(pack.cardCount == 2);
    assert(pack.usedCards[0].id == "t1");
    assert(pack.usedCards[1].id == "t2");
    assert(pack.usedCards[0].relevanceScore == pack.usedCards[1].relevanceScore);

    f.repo->cards = {flat, stove};
    auto reversed = f.Service().build(Request("find me the cheapest pans", 0.3f));
    assert(reversed.usedCards[0].id == "t2");
    assert(reversed.usedCards[1].id == "t1");
}

void TestHigherScoresComeFirst() {
    Fixture f;
    f.repo->cards = {
        MakeCard("low", "User owns a gas stove", {}, {"shopping"}),
        MakeCard("high", "Needs pans for an induction hob", {"profile"}, {"shopping"}),
        MakeCard("hard", "Cannot spend over 100 euros", {}, {}, CardType::Constraint, CardPriority::Hard),
    };
    auto pack = f.Service().build(Request("find me the cheapest pans", 0.3f));
    assert(pack.cardCount == 3);
    assert(pack.usedCards[0].id == "high");  // 0.3 + 0.4 + 0.45 + 0.08 -> 1.0
    assert(pack.usedCards[1].id == "low");   // 0.4
    assert(pack.usedCards[2].id == "hard");  // 0.35
    // Rendering groups by type, constraints first
    assert(pack.packText.find("CONSTRAINTS:\n• Cannot spend over 100 euros [HARD]") != std::string::npos);
}

void TestDeterminism() {
    Fixture f;
    f.repo->cards = {
        kQualityProfile, kCheapGoal,
        MakeCard("t1", "User owns a gas stove", {}, {"shopping"}),
        MakeCard("c1", "Prefers short answers", {"profile"}, {"communication"}),
    };
    auto service = f.Service();
    auto first = service.build(Request("recommend some pans for my kitchen", 0.2f));
    auto second = service.build(Request("recommend some pans for my kitchen", 0.2f));

    assert(first.packText == second.packText);
    assert(first.generatedAt == second.generatedAt);
    assert(first.usedCards.size() == second.usedCards.size());
    for (std::size_t i = 0; i < first.usedCards.size(); ++i) {
        assert(first.usedCards[i].id == second.usedCards[i].id);
        assert(first.usedCards[i].relevanceScore == second.usedCards[i].relevanceScore);
    }
    assert(first.exclusions.size() == second.exclusions.size());
}

void TestCapTruncatesAfterArbitration() {
    Fixture f;
    for (int i = 0; i < 5; ++i) {
        f.repo->cards.push_back(MakeCard("k" + std::to_string(i), "Kitchen fact number " + std::to_string(i),
                                         {}, {"shopping"}));
    }
    auto pack = f.Service().build(Request("find me the cheapest pans", 0.3f, 2));
    assert(pack.cardCount == 2);
    assert(pack.usedCards[0].id == "k0");
    assert(pack.usedCards[1].id == "k1");

    int overCap = 0;
    for (const auto& exclusion : pack.exclusions) {
        if (exclusion.reason == ExclusionReason::OverCap) ++overCap;
    }
    assert(overCap == 3);

    auto none = f.Service().build(Request("find me the cheapest pans", 0.3f, 0));
    assert(none.cardCount == 0);
    assert(none.packText.empty());
}

void TestVetoIgnoresScore() {
    Fixture f;
    f.repo->cards = {MakeCard("h1", "Never buy budget brands, quality over price", {"profile"}, {"shopping"},
                              CardType::Constraint, CardPriority::Hard)};
    auto pack = f.Service().build(Request("find me the cheapest pans", 0.0f));
    assert(pack.cardCount == 0);
    assert(FindExclusion(pack, "h1")->reason == ExclusionReason::PromptConflict);
}

void TestGraphHintsAreCountedOnly() {
    Fixture plain;
    plain.repo->cards = {
        MakeCard("t1", "User owns a gas stove", {"kitchen"}, {"shopping"}),
        MakeCard("t2", "User lives in a small apartment", {}, {"shopping"}),
    };
    auto baseline = plain.Service().build(Request("find me the cheapest pans", 0.3f));

    Fixture f;
    f.repo->cards = plain.repo->cards;
    f.graph = std::make_shared<FakeGraphSearch>();
    f.graph->ids = {"t2", "unknown", "t2"};
    auto pack = f.Service().build(Request("find me the cheapest pans", 0.3f));

    assert(f.graph->calls == 1);
    assert(f.graph->lastLimit == 20);
    // domains then keywords
    assert(f.graph->lastTags.front() == "shopping");
    assert(f.graph->lastTags.back() == "pans");
    assert(pack.graphHintCount == 1);
    assert(pack.packText == baseline.packText);
    assert(pack.usedCards[0].id == baseline.usedCards[0].id);
}

void TestGraphFailureDegrades() {
    Fixture f;
    f.repo->cards = {MakeCard("t1", "User owns a gas stove", {}, {"shopping"})};
    f.graph = std::make_shared<FakeGraphSearch>();
    f.graph->fail = true;
    auto pack = f.Service().build(Request("find me the cheapest pans", 0.3f));
    assert(f.graph->calls == 1);
    assert(pack.graphHintCount == 0);
    assert(pack.cardCount == 1);
}

void TestGraphSkippedWithoutKeywordsOrWhenDisabled() {
    Fixture f;
    f.repo->cards = {MakeCard("t1", "User owns a gas stove", {}, {"shopping"})};
    f.graph = std::make_shared<FakeGraphSearch>();

    PromptAnalysis noKeywords;
    noKeywords.domains = {"shopping"};
    f.Service(std::make_shared<FixedPromptAnalyzer>(noKeywords)).build(Request("pans", 0.3f));
    assert(f.graph->calls == 0);

    ContextPackService::Options options;
    options.graphRetrieval = false;
    f.Service(std::make_shared<KeywordPromptAnalyzer>(), options).build(Request("find me the cheapest pans", 0.3f));
    assert(f.graph->calls == 0);
}

void TestMalformedAndForeignCardsAreSkipped() {
    Fixture f;
    f.repo->cards = {
        MakeCard("bad", "", {}, {"shopping"}),
        MakeCard("w1", "Work laptop is a ThinkPad", {}, {"shopping"}, CardType::Preference, CardPriority::Soft, "Work"),
        MakeCard("t1", "User owns a gas stove", {}, {"shopping"}),
    };
    auto pack = f.Service().build(Request("find me the cheapest pans", 0.3f));
    assert(pack.cardCount == 1);
    assert(pack.usedCards[0].id == "t1");
    assert(FindExclusion(pack, "bad")->reason == ExclusionReason::Malformed);
    assert(FindExclusion(pack, "w1")->reason == ExclusionReason::Malformed);
}

void TestCollaboratorFailuresDegrade() {
    Fixture f;
    f.repo->cards = {MakeCard("t1", "User owns a gas stove", {}, {"shopping"})};

    // Analyzer failure falls back to keyword analysis
    auto pack = f.Service(std::make_shared<ThrowingPromptAnalyzer>()).build(Request("find me the cheapest pans", 0.3f));
    assert(pack.cardCount == 1);

    // No analyzer at all behaves the same
    auto keywordOnly = f.Service(nullptr).build(Request("find me the cheapest pans", 0.3f));
    assert(keywordOnly.packText == pack.packText);

    // Unreadable repository yields an empty pack
    f.repo->failReads = true;
    auto empty = f.Service().build(Request("find me the cheapest pans", 0.3f));
    assert(empty.packText.empty());
    assert(empty.cardCount == 0);
}

void TestSensitivityModeIsRecorded() {
    Fixture f;
    f.repo->cards = {MakeCard("t1", "User owns a gas stove", {}, {"shopping"})};
    auto quiet = f.Service().build(Request("find me the cheapest pans", 0.3f));

    auto request = Request("find me the cheapest pans", 0.3f);
    request.sensitivityMode = SensitivityMode::Verbose;
    auto verbose = f.Service().build(request);

    assert(verbose.sensitivityMode == SensitivityMode::Verbose);
    assert(verbose.packText == quiet.packText);
}

void TestPreview() {
    Fixture f;
    f.repo->cards = {
        MakeCard("a", "First"),
        MakeCard("b", "Second", {}, {}, CardType::Goal),
        MakeCard("c", "Third"),
    };
    auto pack = f.Service().preview("Personal", 2);
    assert(pack.cardCount == 2);
    assert(pack.usedCards[0].id == "a");
    assert(pack.usedCards[1].id == "b");
    assert(pack.usedCards[0].relevanceScore == 1.0f);
    assert(pack.packText.find("GOALS:\n• Second") != std::string::npos);
}

void TestRequiresRepository() {
    bool threw = false;
    try {
        ContextPackService service(nullptr, nullptr);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

void TestDefaultOptionsAndClock() {
    auto repo = std::make_shared<FakeCardRepository>();
    repo->cards = {MakeCard("t1", "User owns a gas stove", {}, {"shopping"})};
    auto graph = std::make_shared<FakeGraphSearch>();
    graph->ids = {"t1"};

    ContextPackService service(repo, std::make_shared<KeywordPromptAnalyzer>(), graph);
    auto pack = service.build(Request("find me the cheapest pans", 0.3f));
    assert(graph->calls == 1);
    assert(graph->lastLimit == 20);
    assert(pack.graphHintCount == 1);
    // System clock, UTC, second precision
    assert(pack.generatedAt.size() == 20);
    assert(pack.generatedAt[10] == 'T' && pack.generatedAt.back() == 'Z');

    contextwallet::application::ContextPackOptions options;
    assert(options.graphRetrieval);
    assert(options.graphLimit == 20);

    using contextwallet::infrastructure::TimeUtils;
    assert(TimeUtils::ToIsoTimestamp(std::chrono::system_clock::from_time_t(0)) == "1970-01-01T00:00:00Z");
    assert(TimeUtils::ToIsoTimestamp(std::chrono::system_clock::from_time_t(1767225600)) == "2026-01-01T00:00:00Z");
    assert(TimeUtils::NowIso().size() == 20);
}

} // namespace

int main() {
    std::cout << "[Test] Starting ContextPackService Test..." << std::endl;

    TestCheapPromptVetoesQualityProfile();
    TestProfileWinsArbitration();
    TestEmptyPersona();
    TestHighThresholdYieldsEmptyPack();
    TestConversationalCardAlwaysEligible();
    TestTiesKeepRepositoryOrder();
    TestHigherScoresComeFirst();
    TestDeterminism();
    TestCapTruncatesAfterArbitration();
    TestVetoIgnoresScore();
    TestGraphHintsAreCountedOnly();
    TestGraphFailureDegrades();
    TestGraphSkippedWithoutKeywordsOrWhenDisabled();
    TestMalformedAndForeignCardsAreSkipped();
    TestCollaboratorFailuresDegrade();
    TestSensitivityModeIsRecorded();
    TestPreview();
    TestRequiresRepository();
    TestDefaultOptionsAndClock();

    std::cout << "[PASS] ContextPackService Test." << std::endl;
    return 0;
}
