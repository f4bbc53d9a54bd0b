#include "ToolHandler.hpp"
#include "../core/Errors.hpp"
#include "../service/FlashcardService.hpp"
#include "../storage/JsonCodec.hpp"
#include <cmath>
#include <istream>
#include <map>
#include <optional>
#include <ostream>
#include <vector>
#include <spdlog/spdlog.h>

using nlohmann::json;

namespace {

    json statsJson(const CardStats& s) {
        return json{
            {"total_cards", s.total_cards},
            {"due_cards", s.due_cards},
            {"reviews_today", s.reviews_today},
            {"retention_rate", s.retention_rate}
        };
    }

    json errorJson(const FlashcardError& e) {
        return json{ {"error", e.what()}, {"code", errorCodeName(e.code())} };
    }

    // Absent or null -> fallback; any other non-string is a bad request
    std::string stringArg(const json& args, const char* key, const std::string& fallback = "") {
        auto it = args.find(key);
        if (it == args.end() || it->is_null()) return fallback;
        if (!it->is_string()) {
            throw ValidationError(std::string("argument '") + key + "' must be a string");
        }
        return it->get<std::string>();
    }

    std::optional<std::string> optionalStringArg(const json& args, const char* key) {
        if (args.find(key) == args.end() || args.at(key).is_null()) return std::nullopt;
        return stringArg(args, key);
    }

    std::optional<std::vector<std::string>> optionalTagsArg(const json& args, const char* key) {
        auto it = args.find(key);
        if (it == args.end() || it->is_null()) return std::nullopt;
        if (!it->is_array()) {
            throw ValidationError(std::string("argument '") + key + "' must be an array of strings");
        }
        std::vector<std::string> tags;
        for (const auto& t : *it) {
            if (!t.is_string()) {
                throw ValidationError(std::string("argument '") + key + "' must be an array of strings");
            }
            tags.push_back(t.get<std::string>());
        }
        return tags;
    }

    std::vector<std::string> tagsArg(const json& args, const char* key) {
        return optionalTagsArg(args, key).value_or(std::vector<std::string>{});
    }

    bool boolArg(const json& args, const char* key) {
        auto it = args.find(key);
        if (it == args.end() || it->is_null()) return false;
        if (!it->is_boolean()) {
            throw ValidationError(std::string("argument '") + key + "' must be a boolean");
        }
        return it->get<bool>();
    }

    // Clients send numbers as JSON numbers; 3.0 is accepted as 3
    int ratingArg(const json& args) {
        auto it = args.find("rating");
        if (it == args.end() || !it->is_number()) {
            throw ValidationError("argument 'rating' must be a number between 1 and 4");
        }
        double value = it->get<double>();
        if (std::floor(value) != value || value < 1.0 || value > 4.0) {
            throw ValidationError("Rating must be between 1 and 4");
        }
        return static_cast<int>(value);
    }

    std::string requiredId(const json& args, const char* key) {
        std::string id = stringArg(args, key);
        if (id.empty()) {
            throw ValidationError(std::string("argument '") + key + "' is required");
        }
        return id;
    }

    json dueDateJson(const DueDate& dd) {
        json j = dd;
        j["due_date"] = TimeUtils::formatDate(dd.due_date);
        return j;
    }
}

ToolHandler::ToolHandler(FlashcardService& s)
    : service(s)
{
}

int ToolHandler::run(std::istream& in, std::ostream& out) {
    int answered = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        out << handleLine(line) << '\n';
        out.flush();
        answered++;
    }
    spdlog::info("Input closed after {} request(s)", answered);
    return answered;
}

std::string ToolHandler::handleLine(const std::string& line) {
    json response;
    try {
        json request = json::parse(line);
        if (!request.is_object()) {
            throw ValidationError("request must be a JSON object");
        }
        std::string tool = stringArg(request, "tool");
        if (tool.empty()) {
            throw ValidationError("request is missing 'tool'");
        }

        json args = json::object();
        auto it = request.find("arguments");
        if (it != request.end() && !it->is_null()) {
            if (!it->is_object()) {
                throw ValidationError("'arguments' must be a JSON object");
            }
            args = *it;
        }

        spdlog::debug("Request: {}", tool);
        response = dispatch(tool, args);
    }
    catch (const json::parse_error& e) {
        spdlog::warn("Malformed request: {}", e.what());
        response = errorJson(ValidationError(std::string("malformed request: ") + e.what()));
    }
    catch (const FlashcardError& e) {
        if (e.code() == ErrorCode::StorageIO) spdlog::error("Request failed: {}", e.what());
        else spdlog::warn("Request rejected: {}", e.what());
        response = errorJson(e);
    }
    return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

json ToolHandler::dispatch(const std::string& tool, const json& args) {
    if (tool == "get_due_card") return getDueCard(args);
    if (tool == "submit_review") return submitReview(args);
    if (tool == "create_card") return createCard(args);
    if (tool == "update_card") return updateCard(args);
    if (tool == "delete_card") return deleteCard(args);
    if (tool == "list_cards") return listCards(args);
    if (tool == "get_stats") return getStats();
    if (tool == "list_tags") return listTags();
    if (tool == "help_analyze_learning") return analyzeLearning();
    if (tool == "manage_due_dates") return manageDueDates(args);
    if (tool == "due_date_progress") return dueDateProgress();

    throw ValidationError("unknown tool: " + tool);
}

json ToolHandler::getDueCard(const json& args) {
    DueCardResult result = service.getDueCard(tagsArg(args, "tags"));
    if (!result.ok()) {
        ErrorCode code = result.error.value_or(ErrorCode::NoCardsDue);
        return json{
            {"error", result.message},
            {"code", errorCodeName(code)},
            {"stats", statsJson(result.stats)}
        };
    }
    return json{ {"card", *result.card}, {"stats", statsJson(result.stats)} };
}

json ToolHandler::submitReview(const json& args) {
    std::string id = requiredId(args, "card_id");
    int rating = ratingArg(args);
    ReviewOutcome outcome = service.submitReview(id, rating, stringArg(args, "answer"));
    return json{
        {"success", true},
        {"message", "Review submitted successfully"},
        {"card", outcome.card},
        {"review", outcome.review}
    };
}

json ToolHandler::createCard(const json& args) {
    // empty strings are valid card text; only a missing field is rejected
    for (const char* key : { "front", "back" }) {
        if (args.find(key) == args.end() || args.at(key).is_null()) {
            throw ValidationError(std::string("Missing required parameter: ") + key);
        }
    }
    Card card = service.createCard(stringArg(args, "front"), stringArg(args, "back"), tagsArg(args, "tags"));
    return json{ {"card", card} };
}

json ToolHandler::updateCard(const json& args) {
    std::string id = requiredId(args, "card_id");
    Card card = service.updateCard(id,
        optionalStringArg(args, "front"),
        optionalStringArg(args, "back"),
        optionalTagsArg(args, "tags"));
    return json{ {"success", true}, {"message", "Card updated successfully"}, {"card", card} };
}

json ToolHandler::deleteCard(const json& args) {
    std::string id = requiredId(args, "card_id");
    service.deleteCard(id);
    return json{ {"success", true}, {"message", "Card deleted successfully"} };
}

json ToolHandler::listCards(const json& args) {
    json response = json{ {"cards", service.listCards(tagsArg(args, "tags"))} };
    if (boolArg(args, "include_stats")) {
        response["stats"] = statsJson(service.getStats());
    }
    return response;
}

json ToolHandler::getStats() {
    return statsJson(service.getStats());
}

json ToolHandler::listTags() {
    CardStats stats = service.getStats();
    auto counts = service.listTags();

    std::map<std::string, int> due_counts;
    Timestamp now = Clock::now();
    for (const auto& card : service.listCards({})) {
        if (!card.fsrs.isDue(now)) continue;
        for (const auto& t : card.tags) due_counts[t]++;
    }

    json tags = json::array();
    for (const auto& entry : counts) {
        tags.push_back(json{
            {"tag", entry.first},
            {"card_count", entry.second},
            {"due_count", due_counts[entry.first]},
            {"total_cards", stats.total_cards},
            {"due_cards", stats.due_cards}
        });
    }
    return tags;
}

json ToolHandler::analyzeLearning() {
    return json{ {"message", service.analyzeLearning()} };
}

json ToolHandler::manageDueDates(const json& args) {
    std::string action = stringArg(args, "action");

    if (action == "create") {
        return dueDateJson(service.createDueDate(
            stringArg(args, "topic"), stringArg(args, "date"), stringArg(args, "tag")));
    }
    if (action == "list") {
        json list = json::array();
        for (const auto& dd : service.listDueDates()) list.push_back(dueDateJson(dd));
        return list;
    }
    if (action == "update") {
        return dueDateJson(service.updateDueDate(stringArg(args, "due_date_id"),
            optionalStringArg(args, "topic"),
            optionalStringArg(args, "date"),
            optionalStringArg(args, "tag")));
    }
    if (action == "delete") {
        std::string id = stringArg(args, "due_date_id");
        service.deleteDueDate(id);
        return json{ {"message", "Due date " + id + " deleted successfully"} };
    }

    throw ValidationError("Invalid action: " + action + ". Must be one of 'create', 'update', 'delete', 'list'");
}

json ToolHandler::dueDateProgress() {
    json report = json::array();
    for (const auto& info : service.dueDateProgressReport()) {
        report.push_back(json{
            {"id", info.due_date.id},
            {"topic", info.due_date.topic},
            {"due_date", TimeUtils::formatDate(info.due_date.due_date)},
            {"tag", info.due_date.tag},
            {"total_cards", info.progress.total_cards},
            {"mastered_cards", info.progress.mastered_cards},
            {"progress_percent", info.progress.progress_percent},
            {"days_remaining", info.days_remaining},
            {"cards_left", info.cards_left},
            {"required_pace", info.required_pace}
        });
    }
    return report;
}
