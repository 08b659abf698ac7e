#include "infrastructure/PromptCatalog.hpp"

namespace contextwallet::infrastructure {

std::string PromptCatalog::GetPromptAnalysisPrompt(const std::string& userPrompt) {
    return
        "Analyze this user prompt and determine:\n"
        "1. What is the user's primary goal/intent?\n"
        "2. What domains/categories are relevant? Choose from: shopping, eating, health, work, "
        "communication, personality, general\n"
        "3. Are there any explicit preferences stated in the prompt that should override stored memory?\n\n"
        "Output ONLY valid JSON with this structure:\n"
        "{\n"
        "  \"intent\": \"brief description of what user wants\",\n"
        "  \"domains\": [\"list\", \"of\", \"relevant\", \"domains\"],\n"
        "  \"explicit_preferences\": [\"any preferences explicitly stated in the prompt\"],\n"
        "  \"keywords\": [\"key\", \"terms\", \"from\", \"prompt\"]\n"
        "}\n\n"
        "User prompt: \"" + userPrompt + "\"\n\n"
        "Output ONLY the JSON, no other text:";
}

std::string PromptCatalog::GetTupleExtractionPrompt(const std::string& rawContext) {
    return
        "You are a semantic tuple extractor. Given user behavior or statements, extract structured relationships.\n\n"
        "Output ONLY valid JSON array of tuples. Each tuple has:\n"
        "- subject: The entity performing or being described (usually \"User\")\n"
        "- subject_type: Type of subject (Person, Product, etc.)\n"
        "- predicate: The relationship (PREFERS, HAS_GOAL, HAS_CONSTRAINT, LIKES, DISLIKES, WANTS, AVOIDS, "
        "INTERESTED_IN)\n"
        "- object: The target entity\n"
        "- object_type: Type of object (Diet, Budget, Restaurant, Food, Product, etc.)\n"
        "- confidence: 0.0 to 1.0 based on how certain the statement is\n"
        "- properties: Additional key-value properties if relevant\n\n"
        "Example:\n"
        "Input: \"I started a vegan diet 3 days ago\"\n"
        "Output: [{\"subject\": \"User\", \"subject_type\": \"Person\", \"predicate\": \"HAS_CONSTRAINT\", "
        "\"object\": \"Vegan Diet\", \"object_type\": \"Diet\", \"confidence\": 1.0, "
        "\"properties\": {\"restriction\": \"no animal products\"}}]\n\n"
        "Now extract tuples from:\n"
        "Input: \"" + rawContext + "\"\n\n"
        "Output ONLY the JSON array, no other text:";
}

} // namespace contextwallet::infrastructure
