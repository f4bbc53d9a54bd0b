#include <cassert>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <sodium.h>

#include "core/MemoryModel.hpp"
#include "core/Stats.hpp"
#include "service/FlashcardService.hpp"
#include "storage/Storage.hpp"

namespace fs = std::filesystem;

using namespace std::chrono;

static Card makeCard(const std::string& id, std::vector<std::string> tags, Timestamp due) {
    Card c;
    c.id = id;
    c.front = id;
    c.back = id;
    c.tags = std::move(tags);
    c.fsrs.due = due;
    return c;
}

static Review makeReview(const std::string& cardId, Rating rating, Timestamp at) {
    Review r;
    r.id = Card::generateID();
    r.card_id = cardId;
    r.rating = rating;
    r.timestamp = at;
    return r;
}

static DueDate makeDueDate(const std::string& topic, const std::string& date, const std::string& tag) {
    DueDate d;
    d.id = Card::generateID();
    d.topic = topic;
    d.due_date = TimeUtils::parseDate(date);
    d.tag = tag;
    return d;
}

int main() {
    std::cout << "[Test] Starting Stats Test..." << std::endl;
    if (sodium_init() < 0) return 1;

    const Timestamp now = TimeUtils::parseRfc3339("2024-05-10T12:00:00Z");

    // Three "bio" cards, one mastered
    StoreData data;
    data.cards["b1"] = makeCard("b1", { "bio" }, now - hours(1));
    data.cards["b2"] = makeCard("b2", { "bio", "cells" }, now + hours(30));
    data.cards["b3"] = makeCard("b3", { "bio" }, now + hours(2));
    data.cards["c1"] = makeCard("c1", { "chem" }, now - hours(3));
    data.reviews.push_back(makeReview("b1", Rating::EASY, now));
    data.reviews.push_back(makeReview("b2", Rating::EASY, now));
    data.reviews.push_back(makeReview("b2", Rating::HARD, now));  // same time: later log entry wins
    data.reviews.push_back(makeReview("gone", Rating::AGAIN, now));  // orphan

    {
        DueDateProgress p = Stats::dueDateProgress(data, "bio");
        assert(p.total_cards == 3);
        assert(p.mastered_cards == 1);
        assert(std::abs(p.progress_percent - 100.0 / 3.0) < 0.01);

        DueDateProgress none = Stats::dueDateProgress(data, "physics");
        assert(none.total_cards == 0 && none.progress_percent == 0.0);
        std::cout << "[PASS] Progress counts mastered cards by latest review." << std::endl;
    }

    {
        CardStats s = Stats::compute(data, now);
        assert(s.total_cards == 4);
        assert(s.due_cards == 2);
        // the orphaned review is not counted
        assert(s.reviews_today == 3);
        assert(std::abs(s.retention_rate - 200.0 / 3.0) < 0.01);

        StoreData empty;
        CardStats e = Stats::compute(empty, now);
        assert(e.total_cards == 0 && e.reviews_today == 0 && e.retention_rate == 0.0);
        std::cout << "[PASS] Card stats." << std::endl;
    }

    {
        data.due_dates.push_back(makeDueDate("Chem Final", "2024-05-11", "chem"));
        data.due_dates.push_back(makeDueDate("Bio Midterm", "2024-05-20", "bio"));
        data.due_dates.push_back(makeDueDate("Old Quiz", "2024-05-01", "bio"));
        data.due_dates.push_back(makeDueDate("Today", "2024-05-10", "bio"));
        // generated cohort tags stay in the report after their date passes
        data.due_dates.push_back(makeDueDate("Practice", "2024-05-03", "test-practice-2024-05-03"));

        auto report = Stats::progressReport(data, now);
        assert(report.size() == 4);
        assert(report[0].due_date.topic == "Practice");
        assert(report[1].due_date.topic == "Today");
        assert(report[2].due_date.topic == "Chem Final");
        assert(report[3].due_date.topic == "Bio Midterm");

        assert(report[0].days_remaining == 0.0);
        assert(report[0].required_pace == 0.0);
        assert(report[0].progress.total_cards == 0);
        assert(report[1].days_remaining == 0.0);
        assert(report[1].required_pace == 0.0);
        assert(report[2].days_remaining == 0.0);
        assert(report[2].cards_left == 1);

        const DueDateProgressInfo& bio = report[3];
        assert(bio.days_remaining == 9.0);
        assert(bio.cards_left == 2);
        assert(std::abs(bio.required_pace - 2.0 / 9.0) < 1e-9);
        std::cout << "[PASS] Progress report skips past dates and computes pace." << std::endl;
    }

    // Same progress numbers through the service: three "bio" cards, one rated EASY
    {
        fs::path testRoot = fs::temp_directory_path() / ("flashcards_stats_" + Card::generateID());
        fs::create_directories(testRoot);
        {
            Storage storage((testRoot / "cards.json").string());
            storage.load();
            MemoryModel model;
            FlashcardService service(storage, model);

            Card first = service.createCard("Q1", "A1", { "bio" });
            service.createCard("Q2", "A2", { "bio" });
            service.createCard("Q3", "A3", { "bio" });
            service.submitReview(first.id, 4, "");

            DueDateProgress p = service.dueDateProgress("bio");
            assert(p.total_cards == 3);
            assert(p.mastered_cards == 1);
            assert(std::abs(p.progress_percent - 33.33) < 0.01);
        }
        fs::remove_all(testRoot);
        std::cout << "[PASS] Service reports progress for a tag." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
