/**
 * @file SemanticTuple.hpp
 * @brief Closed record for relationships mined from conversation text.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

namespace contextwallet::domain {

/**
 * @enum TuplePredicate
 * @brief Relationship kinds the extractor is allowed to emit.
 */
enum class TuplePredicate {
    Prefers,
    HasGoal,
    HasConstraint,
    Likes,
    Dislikes,
    Wants,
    Avoids,
    InterestedIn,
    RelatesTo
};

inline std::string PredicateToString(TuplePredicate predicate) {
    switch (predicate) {
        case TuplePredicate::Prefers: return "PREFERS";
        case TuplePredicate::HasGoal: return "HAS_GOAL";
        case TuplePredicate::HasConstraint: return "HAS_CONSTRAINT";
        case TuplePredicate::Likes: return "LIKES";
        case TuplePredicate::Dislikes: return "DISLIKES";
        case TuplePredicate::Wants: return "WANTS";
        case TuplePredicate::Avoids: return "AVOIDS";
        case TuplePredicate::InterestedIn: return "INTERESTED_IN";
        case TuplePredicate::RelatesTo: return "RELATES_TO";
    }
    return "RELATES_TO";
}

/** @brief Unknown predicates collapse to RelatesTo. */
inline TuplePredicate PredicateFromString(const std::string& value) {
    if (value == "PREFERS") return TuplePredicate::Prefers;
    if (value == "HAS_GOAL") return TuplePredicate::HasGoal;
    if (value == "HAS_CONSTRAINT") return TuplePredicate::HasConstraint;
    if (value == "LIKES") return TuplePredicate::Likes;
    if (value == "DISLIKES") return TuplePredicate::Dislikes;
    if (value == "WANTS") return TuplePredicate::Wants;
    if (value == "AVOIDS") return TuplePredicate::Avoids;
    if (value == "INTERESTED_IN") return TuplePredicate::InterestedIn;
    return TuplePredicate::RelatesTo;
}

/**
 * @struct SemanticTuple
 * @brief subject-predicate-object fact with a confidence in [0, 1].
 */
struct SemanticTuple {
    std::string subject = "User";
    std::string subjectType = "Person";
    TuplePredicate predicate = TuplePredicate::RelatesTo;
    std::string object;
    std::string objectType = "Entity";
    float confidence = 0.5f;
    std::string source = "manual";
    std::map<std::string, std::vector<std::string>> properties;
};

} // namespace contextwallet::domain
