#include "FlashcardService.hpp"
#include "../core/Errors.hpp"
#include "../core/TagManager.hpp"
#include "../storage/Storage.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

FlashcardService::FlashcardService(Storage& s, const SchedulingOracle& oracle)
    : storage(s), processor(s, oracle)
{
    spdlog::info("FlashcardService initialized for '{}'", storage.path());
}

Card FlashcardService::createCard(const std::string& front, const std::string& back,
    const std::vector<std::string>& tags) {
    Card card = storage.createCard(front, back, tags);
    storage.save();
    return card;
}

Card FlashcardService::getCard(const std::string& id) const {
    return storage.getCard(id);
}

Card FlashcardService::updateCard(const std::string& id,
    const std::optional<std::string>& front,
    const std::optional<std::string>& back,
    const std::optional<std::vector<std::string>>& tags) {
    bool changed = false;

    // Edit in place under the exclusive lock so a concurrent review's
    // scheduling state is never overwritten by a stale copy.
    Card card = storage.transact([&](StoreData& data) {
        auto it = data.cards.find(id);
        if (it == data.cards.end()) {
            throw NotFoundError("card not found: " + id);
        }
        Card& stored = it->second;

        if (front && *front != stored.front) {
            stored.front = *front;
            changed = true;
        }
        if (back && *back != stored.back) {
            stored.back = *back;
            changed = true;
        }
        if (tags) {
            auto before = stored.tags;
            stored.setTags(*tags);
            changed = changed || before != stored.tags;
        }
        return stored;
    }, false);

    if (changed) {
        storage.save();
        spdlog::info("Updated card {}", id);
    }
    else {
        spdlog::debug("updateCard {}: nothing changed", id);
    }
    return card;
}

void FlashcardService::deleteCard(const std::string& id) {
    storage.deleteCard(id);
    storage.save();
}

std::vector<Card> FlashcardService::listCards(const std::vector<std::string>& tags) const {
    return storage.listCards(tags);
}

DueCardResult FlashcardService::getDueCard(const std::vector<std::string>& tags) const {
    return scheduler.selectDueCard(storage.snapshot(), tags, Clock::now());
}

ReviewOutcome FlashcardService::submitReview(const std::string& cardId, int rating, const std::string& answer) {
    Rating r = ratingFromInt(rating);
    return processor.submit(cardId, r, answer);
}

CardStats FlashcardService::getStats() const {
    return Stats::compute(storage.snapshot(), Clock::now());
}

std::map<std::string, int> FlashcardService::listTags() const {
    return TagManager::countTags(storage.listCards({}));
}

std::string FlashcardService::analyzeLearning() const {
    StoreData snapshot = storage.snapshot();
    if (snapshot.cards.empty()) {
        return "No cards available to analyze yet. Let's create some!";
    }

    // most recent struggle (AGAIN or HARD) on a card that still exists
    const Review* worst = nullptr;
    for (const auto& r : snapshot.reviews) {
        if (r.rating > Rating::HARD) continue;
        if (snapshot.cards.find(r.card_id) == snapshot.cards.end()) continue;
        if (!worst || r.timestamp > worst->timestamp) worst = &r;
    }

    if (worst) {
        const Card& card = snapshot.cards.at(worst->card_id);
        return "It looks like the card '" + card.front + "' was challenging (rated "
            + std::to_string(static_cast<int>(worst->rating)) + " on "
            + TimeUtils::formatRfc3339(worst->timestamp)
            + "). Maybe we can break down the concept or create related cards?";
    }
    return "Great job so far! All recent reviews look good. Keep up the excellent work!";
}

DueDate FlashcardService::createDueDate(const std::string& topic, const std::string& date, const std::string& tag) {
    if (topic.empty() || date.empty()) {
        throw ValidationError("Missing required parameters for create: topic, date (YYYY-MM-DD)");
    }

    DueDate dd;
    dd.topic = topic;
    dd.due_date = TimeUtils::parseDate(date);
    dd.tag = tag.empty() ? TagManager::cohortTag(topic, date) : tag;

    dd = storage.addDueDate(dd);
    storage.save();
    spdlog::info("Created due date {} '{}' on {} for tag '{}'", dd.id, dd.topic, date, dd.tag);
    return dd;
}

std::vector<DueDate> FlashcardService::listDueDates() const {
    return storage.listDueDates();
}

DueDate FlashcardService::updateDueDate(const std::string& id,
    const std::optional<std::string>& topic,
    const std::optional<std::string>& date,
    const std::optional<std::string>& tag) {
    if (id.empty()) {
        throw ValidationError("due date ID is required for update");
    }

    // parse before taking the lock; a bad date changes nothing
    std::optional<Timestamp> due;
    if (date && !date->empty()) due = TimeUtils::parseDate(*date);

    return storage.transact([&](StoreData& data) {
        auto it = std::find_if(data.due_dates.begin(), data.due_dates.end(),
            [&id](const DueDate& d) { return d.id == id; });
        if (it == data.due_dates.end()) {
            throw NotFoundError("due date not found: " + id);
        }

        if (topic && !topic->empty()) it->topic = *topic;
        if (due) it->due_date = *due;
        if (tag && !tag->empty()) it->tag = *tag;
        return *it;
    }, true);
}

void FlashcardService::deleteDueDate(const std::string& id) {
    if (id.empty()) {
        throw ValidationError("due date ID is required for delete");
    }
    storage.deleteDueDate(id);
    storage.save();
}

DueDateProgress FlashcardService::dueDateProgress(const std::string& tag) const {
    if (tag.empty()) {
        throw ValidationError("tag cannot be empty");
    }
    return Stats::dueDateProgress(storage.snapshot(), tag);
}

std::vector<DueDateProgressInfo> FlashcardService::dueDateProgressReport() const {
    return Stats::progressReport(storage.snapshot(), Clock::now());
}
