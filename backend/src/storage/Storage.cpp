#include "Storage.hpp"
#include "../core/Errors.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

Storage::Storage(const std::string& file)
    : filename(file)
{
    spdlog::info("Storage created for '{}'", filename);
}

Card Storage::createCard(const std::string& front, const std::string& back,
    const std::vector<std::string>& tags, Timestamp now) {
    std::unique_lock<std::shared_mutex> lock(mutex);

    Card card(front, back, now);
    card.setTags(tags);

    data.cards[card.id] = card;
    data.last_updated = now;
    return card;
}

Card Storage::getCard(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex);

    auto it = data.cards.find(id);
    if (it == data.cards.end()) {
        throw NotFoundError("card not found: " + id);
    }
    return it->second;
}

void Storage::updateCard(const Card& card) {
    std::unique_lock<std::shared_mutex> lock(mutex);

    auto it = data.cards.find(card.id);
    if (it == data.cards.end()) {
        throw NotFoundError("card not found: " + card.id);
    }
    it->second = card;
    data.last_updated = Clock::now();
}

void Storage::deleteCard(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mutex);

    if (data.cards.erase(id) == 0) {
        throw NotFoundError("card not found: " + id);
    }
    data.last_updated = Clock::now();
    spdlog::info("Deleted card {} (its reviews stay in the log)", id);
}

std::vector<Card> Storage::listCards(const std::vector<std::string>& tags) const {
    std::shared_lock<std::shared_mutex> lock(mutex);

    std::vector<Card> result;
    result.reserve(data.cards.size());
    for (const auto& entry : data.cards) {
        if (entry.second.hasAnyTag(tags)) {
            result.push_back(entry.second);
        }
    }
    return result;
}

Review Storage::addReview(Review review) {
    std::unique_lock<std::shared_mutex> lock(mutex);

    if (data.cards.find(review.card_id) == data.cards.end()) {
        throw NotFoundError("card not found: " + review.card_id);
    }
    if (review.id.empty()) review.id = Card::generateID();

    data.reviews.push_back(review);
    data.last_updated = Clock::now();
    return review;
}

std::vector<Review> Storage::getCardReviews(const std::string& cardId) const {
    std::shared_lock<std::shared_mutex> lock(mutex);

    if (data.cards.find(cardId) == data.cards.end()) {
        throw NotFoundError("card not found: " + cardId);
    }

    std::vector<Review> result;
    std::copy_if(data.reviews.begin(), data.reviews.end(), std::back_inserter(result),
        [&cardId](const Review& r) { return r.card_id == cardId; });
    return result;
}

DueDate Storage::addDueDate(DueDate dueDate) {
    std::unique_lock<std::shared_mutex> lock(mutex);

    if (dueDate.id.empty()) dueDate.id = Card::generateID();
    spdlog::debug("Adding due date id={} topic='{}' tag='{}' (count before: {})",
        dueDate.id, dueDate.topic, dueDate.tag, data.due_dates.size());

    data.due_dates.push_back(dueDate);
    data.last_updated = Clock::now();
    return dueDate;
}

std::vector<DueDate> Storage::listDueDates() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return data.due_dates;
}

void Storage::updateDueDate(const DueDate& dueDate) {
    std::unique_lock<std::shared_mutex> lock(mutex);

    auto it = std::find_if(data.due_dates.begin(), data.due_dates.end(),
        [&dueDate](const DueDate& d) { return d.id == dueDate.id; });
    if (it == data.due_dates.end()) {
        throw NotFoundError("due date not found: " + dueDate.id);
    }
    *it = dueDate;
    data.last_updated = Clock::now();
}

void Storage::deleteDueDate(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mutex);

    auto it = std::find_if(data.due_dates.begin(), data.due_dates.end(),
        [&id](const DueDate& d) { return d.id == id; });
    if (it == data.due_dates.end()) {
        throw NotFoundError("due date not found: " + id);
    }
    data.due_dates.erase(it);
    data.last_updated = Clock::now();
    spdlog::debug("Deleted due date {} ({} left)", id, data.due_dates.size());
}

StoreData Storage::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return data;
}

void Storage::load() {
    std::unique_lock<std::shared_mutex> lock(mutex);
    spdlog::info("Loading store from '{}'", filename);

    std::error_code ec;
    if (!fs::exists(filename, ec)) {
        spdlog::info("Store file '{}' not found; writing an empty store", filename);
        data = StoreData{};
        writeFile();
        return;
    }

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        spdlog::error("Failed to open '{}' for reading", filename);
        throw StorageError("failed to read storage file '" + filename + "'");
    }
    std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        spdlog::error("I/O error while reading '{}'", filename);
        throw StorageError("failed to read storage file '" + filename + "'");
    }

    if (raw.empty()) {
        spdlog::warn("Store file '{}' is empty; starting with an empty store", filename);
        data = StoreData{};
        return;
    }

    StoreData loaded;
    try {
        loaded = nlohmann::json::parse(raw).get<StoreData>();
    }
    catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to decode '{}': {}", filename, e.what());
        throw StorageError(std::string("failed to unmarshal storage data: ") + e.what());
    }
    catch (const ValidationError& e) {
        spdlog::error("Invalid data in '{}': {}", filename, e.what());
        throw StorageError(std::string("failed to unmarshal storage data: ") + e.what());
    }

    data = std::move(loaded);
    spdlog::info("Loaded {} cards, {} reviews, {} due dates",
        data.cards.size(), data.reviews.size(), data.due_dates.size());
}

void Storage::save() {
    std::unique_lock<std::shared_mutex> lock(mutex);
    writeFile();
}

void Storage::writeFile() {
    data.last_updated = Clock::now();

    std::string payload;
    try {
        payload = nlohmann::json(data).dump(2);
    }
    catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to encode store: {}", e.what());
        throw StorageError(std::string("failed to marshal storage data: ") + e.what());
    }

    fs::path target(filename);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            spdlog::error("Failed to create directory '{}': {}", target.parent_path().string(), ec.message());
            throw StorageError("failed to create directory: " + ec.message());
        }
    }

    const std::string temp = filename + ".tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            spdlog::error("Failed to open '{}' for writing", temp);
            throw StorageError("failed to write temporary file '" + temp + "'");
        }
        out << payload;
        out.flush();
        if (!out) {
            spdlog::error("Write to '{}' failed", temp);
            out.close();
            fs::remove(temp, ec);
            throw StorageError("failed to write temporary file '" + temp + "'");
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        spdlog::error("Failed to rename '{}' over '{}': {}", temp, filename, ec.message());
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw StorageError("failed to rename temporary file: " + ec.message());
    }

    spdlog::info("Saved {} cards, {} reviews, {} due dates to '{}'",
        data.cards.size(), data.reviews.size(), data.due_dates.size(), filename);
}
