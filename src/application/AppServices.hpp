/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/CardExtractionService.hpp"
#include "application/ContextPackService.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/JsonCardRepository.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace contextwallet::application {

struct AppServices {
    infrastructure::Settings settings;
    std::shared_ptr<infrastructure::JsonCardRepository> cardRepository;
    std::shared_ptr<infrastructure::OllamaClient> ollamaClient;
    std::unique_ptr<ContextPackService> contextPackService;
    std::unique_ptr<CardExtractionService> extractionService;
};

} // namespace contextwallet::application
