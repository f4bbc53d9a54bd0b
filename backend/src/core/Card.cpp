#include "Card.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <sodium.h>
#include <spdlog/spdlog.h>

const char* ratingName(Rating rating) {
    switch (rating) {
    case Rating::AGAIN: return "Again";
    case Rating::HARD: return "Hard";
    case Rating::GOOD: return "Good";
    case Rating::EASY: return "Easy";
    }
    return "Unknown";
}

const char* cardStateName(CardState state) {
    switch (state) {
    case CardState::NEW: return "New";
    case CardState::LEARNING: return "Learning";
    case CardState::REVIEW: return "Review";
    case CardState::RELEARNING: return "Relearning";
    }
    return "Unknown";
}

Rating ratingFromInt(int value) {
    if (value < 1 || value > 4) {
        throw ValidationError("Rating must be between 1 and 4");
    }
    return static_cast<Rating>(value);
}

CardState cardStateFromInt(int value) {
    if (value < 0 || value > 3) {
        throw ValidationError("Card state must be between 0 and 3, got " + std::to_string(value));
    }
    return static_cast<CardState>(value);
}

Card::Card(const std::string& f, const std::string& b, Timestamp now)
    : front(f), back(b)
{
    id = generateID();
    created_at = now;
    fsrs.due = now;
    fsrs.state = CardState::NEW;
    spdlog::info("Created Card: ID={}", id);
}

void Card::addTag(const std::string& tag) {
    if (!hasTag(tag)) {
        tags.push_back(tag);
        spdlog::debug("Card ID={} addTag '{}'", id, tag);
    }
}

bool Card::hasTag(const std::string& tag) const {
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

void Card::setTags(const std::vector<std::string>& newTags) {
    tags.clear();
    for (const auto& t : newTags) {
        addTag(t);
    }
    spdlog::debug("Card ID={} setTags count={}", id, tags.size());
}

bool Card::hasAnyTag(const std::vector<std::string>& wanted) const {
    if (wanted.empty()) return true;
    for (const auto& w : wanted) {
        if (hasTag(w)) return true;
    }
    return false;
}

bool Card::hasAllTags(const std::vector<std::string>& wanted) const {
    for (const auto& w : wanted) {
        if (!hasTag(w)) return false;
    }
    return true;
}

// Random version-4 UUID drawn from libsodium's CSPRNG
std::string Card::generateID() {
    static const bool sodium_ready = sodium_init() >= 0;
    if (!sodium_ready) {
        spdlog::error("libsodium failed to initialize; cannot generate ids");
        throw std::runtime_error("sodium_init failed");
    }

    unsigned char bytes[16];
    randombytes_buf(bytes, sizeof(bytes));
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);

    char hex[2 * sizeof(bytes) + 1];
    sodium_bin2hex(hex, sizeof(hex), bytes, sizeof(bytes));

    std::string h(hex);
    return h.substr(0, 8) + "-" + h.substr(8, 4) + "-" + h.substr(12, 4) + "-"
        + h.substr(16, 4) + "-" + h.substr(20, 12);
}
