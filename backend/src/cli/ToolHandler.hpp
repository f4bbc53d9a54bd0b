#pragma once
#include <iosfwd>
#include <string>
#include <nlohmann/json.hpp>

class FlashcardService;

// Line protocol over the service:
//
//   request : {"tool": "<name>", "arguments": {...}}
//   response: one JSON object (or array) per line
//
// Failures come back as {"error": message, "code": name}; the due-card outcomes
// also carry "stats". A bad request never stops the loop.
class ToolHandler {
public:
    explicit ToolHandler(FlashcardService& service);

    // Reads requests until EOF. Returns the number of requests answered.
    int run(std::istream& in, std::ostream& out);

    // One request line in, one response line out (without the newline).
    std::string handleLine(const std::string& line);

    nlohmann::json dispatch(const std::string& tool, const nlohmann::json& args);

private:
    nlohmann::json getDueCard(const nlohmann::json& args);
    nlohmann::json submitReview(const nlohmann::json& args);
    nlohmann::json createCard(const nlohmann::json& args);
    nlohmann::json updateCard(const nlohmann::json& args);
    nlohmann::json deleteCard(const nlohmann::json& args);
    nlohmann::json listCards(const nlohmann::json& args);
    nlohmann::json getStats();
    nlohmann::json listTags();
    nlohmann::json analyzeLearning();
    nlohmann::json manageDueDates(const nlohmann::json& args);
    nlohmann::json dueDateProgress();

    FlashcardService& service;
};
