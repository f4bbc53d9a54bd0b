#pragma once
#include <string>
#include <vector>
#include "Card.hpp"
#include "StoreData.hpp"

struct CardStats {
    int total_cards = 0;
    int due_cards = 0;
    int reviews_today = 0;
    double retention_rate = 0.0;  // percent of today's reviews rated GOOD or EASY
};

struct DueDateProgress {
    int total_cards = 0;
    int mastered_cards = 0;
    double progress_percent = 0.0;
};

// Progress of one due date, as shown to the user while preparing for it
struct DueDateProgressInfo {
    DueDate due_date;
    DueDateProgress progress;
    double days_remaining = 0.0;
    int cards_left = 0;
    double required_pace = 0.0;  // cards per day
};

// Pure functions over a store snapshot; none of them touch the store itself.
namespace Stats {

    // Review counts only include reviews of cards present in the snapshot, so
    // orphaned reviews of deleted cards never show up.
    CardStats compute(const StoreData& snapshot, Timestamp now);

    // Mastered: the card's most recent review was rated EASY.
    DueDateProgress dueDateProgress(const StoreData& snapshot, const std::string& tag);

    // Every due date falling today or later, plus past ones whose tag starts
    // with "test-", sorted by date ascending.
    std::vector<DueDateProgressInfo> progressReport(const StoreData& snapshot, Timestamp now);
}
