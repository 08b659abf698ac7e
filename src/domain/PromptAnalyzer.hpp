/**
 * @file PromptAnalyzer.hpp
 * @brief Interface for turning a draft prompt into a PromptAnalysis.
 */

#pragma once

#include <string>
#include "PromptAnalysis.hpp"

namespace contextwallet::domain {

/**
 * @class PromptAnalyzer
 * @brief Opaque synchronous analysis function with a fixed output contract.
 *
 * Implementations must not throw: on any internal failure they return the
 * deterministic keyword analysis instead.
 */
class PromptAnalyzer {
public:
    virtual ~PromptAnalyzer() = default;

    virtual PromptAnalysis analyze(const std::string& promptText) = 0;
};

} // namespace contextwallet::domain
