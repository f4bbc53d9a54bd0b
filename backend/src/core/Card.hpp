#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include "TimeUtils.hpp"

enum class Rating {
    AGAIN = 1,
    HARD = 2,
    GOOD = 3,
    EASY = 4
};

enum class CardState {
    NEW = 0,
    LEARNING = 1,
    REVIEW = 2,
    RELEARNING = 3
};

const char* ratingName(Rating rating);
const char* cardStateName(CardState state);

// Throws ValidationError unless value is 1..4
Rating ratingFromInt(int value);
CardState cardStateFromInt(int value);

// Memory state owned by the scheduling oracle
struct SchedulingState {
    Timestamp due{};
    double stability = 0.0;
    double difficulty = 0.0;
    std::uint64_t elapsed_days = 0;
    std::uint64_t scheduled_days = 0;
    std::uint64_t reps = 0;
    std::uint64_t lapses = 0;
    CardState state = CardState::NEW;
    Timestamp last_review{};

    bool isDue(Timestamp now) const { return due <= now; }
};

class Card {
public:
    Card() = default;
    Card(const std::string& front, const std::string& back, Timestamp now);

    std::string id;          // Auto-generated, never changes
    std::string front;
    std::string back;
    Timestamp created_at{};
    Timestamp last_reviewed_at{};

    std::vector<std::string> tags;

    SchedulingState fsrs;

    // Tag helpers (exact, case-sensitive matching). Tags are kept as given;
    // only exact duplicates are dropped.
    void addTag(const std::string& tag);
    bool hasTag(const std::string& tag) const;
    void setTags(const std::vector<std::string>& newTags);

    // OR semantics: true if the card carries any of `wanted` (or wanted is empty)
    bool hasAnyTag(const std::vector<std::string>& wanted) const;
    // AND semantics: true if the card carries every tag in `wanted`
    bool hasAllTags(const std::vector<std::string>& wanted) const;

    // Utility
    static std::string generateID();
};

struct Review {
    std::string id;
    std::string card_id;     // non-owning, may outlive the card
    Rating rating = Rating::AGAIN;
    Timestamp timestamp{};
    std::string answer;

    // Snapshot of the oracle output at review time
    std::uint64_t scheduled_days = 0;
    std::uint64_t elapsed_days = 0;
    CardState state = CardState::NEW;
};

// Deadline for a cohort of cards sharing `tag`
struct DueDate {
    std::string id;
    std::string topic;
    Timestamp due_date{};
    std::string tag;
};
