#include <cassert>
#include <iostream>

#include "domain/selection/RelevanceScorer.hpp"
#include "test/TestFakes.hpp"

using namespace contextwallet::domain;
using namespace contextwallet::domain::selection;
using contextwallet::test::MakeCard;
using contextwallet::test::Near;

namespace {

PromptAnalysis Analysis(std::vector<std::string> domains, std::vector<std::string> keywords = {}) {
    PromptAnalysis analysis;
    analysis.intent = "user request";
    analysis.domains = std::move(domains);
    analysis.keywords = std::move(keywords);
    return analysis;
}

} // namespace

int main() {
    std::cout << "[Test] Starting RelevanceScorer Test..." << std::endl;
    RelevanceScorer scorer;

    // Profile boost alone
    {
        auto card = MakeCard("c1", "zzz", {"profile"});
        assert(Near(scorer.score(card, Analysis({}), ""), 0.30f));
    }

    // Domain overlap is a fraction of the card's domains
    {
        auto card = MakeCard("c2", "zzz", {}, {"shopping", "health"});
        assert(Near(scorer.score(card, Analysis({"shopping"}), ""), 0.20f));
        assert(Near(scorer.score(card, Analysis({"SHOPPING", "health"}), ""), 0.40f));
    }

    // Conversational cards get a flat bonus even without overlap
    {
        auto card = MakeCard("c3", "Keep answers short", {}, {"communication"});
        assert(Near(scorer.score(card, Analysis({"shopping"}), ""), 0.35f));
        assert(Near(scorer.score(card, Analysis({"communication"}), ""), 0.75f));
    }

    // Lexical matches saturate at the cap
    {
        auto card = MakeCard("c4", "Cheapest pans for my kitchen");
        assert(Near(scorer.score(card, Analysis({}), "cheapest pans"), 0.80f));
        assert(Near(scorer.score(card, Analysis({}), "kitchen"), 0.45f));
    }

    // Keyword matches saturate at their own cap
    {
        auto card = MakeCard("c5", "alpha beta gamma delta");
        assert(Near(scorer.score(card, Analysis({}, {"alpha"}), ""), 0.08f));
        assert(Near(scorer.score(card, Analysis({}, {"alpha", "beta", "gamma", "delta"}), ""), 0.25f));
    }

    // Constraint and hard constraint bonuses
    {
        auto soft = MakeCard("c6", "zzz", {}, {}, CardType::Constraint, CardPriority::Soft);
        auto hard = MakeCard("c7", "zzz", {}, {}, CardType::Constraint, CardPriority::Hard);
        assert(Near(scorer.score(soft, Analysis({}), ""), 0.20f));
        assert(Near(scorer.score(hard, Analysis({}), ""), 0.35f));
    }

    // Extracted-only cards are damped, profile-confirmed ones are not
    {
        auto extracted = MakeCard("c8", "zzz", {"extracted"}, {"shopping"});
        auto confirmed = MakeCard("c9", "zzz", {"extracted", "profile"}, {"shopping"});
        assert(Near(scorer.score(extracted, Analysis({"shopping"}), ""), 0.36f));
        assert(Near(scorer.score(confirmed, Analysis({"shopping"}), ""), 0.70f));
    }

    // Result is clamped to 1
    {
        auto card = MakeCard("c10", "Cheapest pans", {"profile"}, {"communication"});
        float s = scorer.score(card, Analysis({"communication"}, {"cheapest"}), "cheapest pans");
        assert(Near(s, 1.0f));
    }

    // Nothing matches
    {
        auto card = MakeCard("c11", "Owns a bicycle");
        assert(Near(scorer.score(card, Analysis({"eating"}), "dinner ideas"), 0.0f));
    }

    // Lexical matching ignores stopwords, short words and duplicates
    {
        assert(RelevanceScorer::CountLexicalMatches("find the best pans", "find the best pans") == 1);
        assert(RelevanceScorer::CountLexicalMatches("pans pans PANS", "pans") == 1);
        assert(RelevanceScorer::CountLexicalMatches("go to my gym", "go to my gym") == 1);
        assert(RelevanceScorer::CountLexicalMatches("", "anything") == 0);
        // Whole words only: "pan" does not match "pans"
        assert(RelevanceScorer::CountLexicalMatches("pan", "pans") == 0);
    }

    // Custom weights flow through
    {
        ScoringWeights weights;
        weights.profileBoost = 0.5f;
        RelevanceScorer custom(weights);
        auto card = MakeCard("c12", "zzz", {"profile"});
        assert(Near(custom.score(card, Analysis({}), ""), 0.5f));
    }

    std::cout << "[PASS] RelevanceScorer Test." << std::endl;
    return 0;
}
