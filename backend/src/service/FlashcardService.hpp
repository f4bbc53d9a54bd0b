#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "../core/Card.hpp"
#include "../core/MemoryModel.hpp"
#include "../core/ReviewProcessor.hpp"
#include "../core/Scheduler.hpp"
#include "../core/Stats.hpp"

class Storage;

// Operations offered to the request layer. Every mutation is followed by a
// save, so a successful call is on disk when it returns. Failures are thrown as
// FlashcardError subclasses; due-card lookups report "nothing due" through
// DueCardResult so the stats can travel with them.
class FlashcardService {
public:
    FlashcardService(Storage& storage, const SchedulingOracle& oracle);

    // CARDS
    Card createCard(const std::string& front, const std::string& back, const std::vector<std::string>& tags);
    Card getCard(const std::string& id) const;
    // Only fields that are set change; saves only if something did.
    Card updateCard(const std::string& id,
        const std::optional<std::string>& front,
        const std::optional<std::string>& back,
        const std::optional<std::vector<std::string>>& tags);
    void deleteCard(const std::string& id);
    // OR filter on tags
    std::vector<Card> listCards(const std::vector<std::string>& tags) const;

    // REVIEWING
    DueCardResult getDueCard(const std::vector<std::string>& tags) const;
    ReviewOutcome submitReview(const std::string& cardId, int rating, const std::string& answer);
    CardStats getStats() const;

    // INSIGHT
    std::map<std::string, int> listTags() const;
    std::string analyzeLearning() const;

    // DUE DATES
    DueDate createDueDate(const std::string& topic, const std::string& date, const std::string& tag);
    std::vector<DueDate> listDueDates() const;
    DueDate updateDueDate(const std::string& id,
        const std::optional<std::string>& topic,
        const std::optional<std::string>& date,
        const std::optional<std::string>& tag);
    void deleteDueDate(const std::string& id);
    DueDateProgress dueDateProgress(const std::string& tag) const;
    std::vector<DueDateProgressInfo> dueDateProgressReport() const;

private:
    Storage& storage;
    Scheduler scheduler;
    ReviewProcessor processor;
};
