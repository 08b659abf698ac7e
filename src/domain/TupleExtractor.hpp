/**
 * @file TupleExtractor.hpp
 * @brief Interface for mining semantic tuples from raw conversation text.
 */

#pragma once

#include <string>
#include <vector>
#include "SemanticTuple.hpp"

namespace contextwallet::domain {

class TupleExtractor {
public:
    virtual ~TupleExtractor() = default;

    /**
     * @brief Extracts tuples from free text.
     * @param rawContext Conversation or statement text.
     * @param source Provenance label stored on every tuple.
     * @return Possibly empty list; empty when every backend failed.
     */
    virtual std::vector<SemanticTuple> extract(const std::string& rawContext, const std::string& source) = 0;
};

} // namespace contextwallet::domain
