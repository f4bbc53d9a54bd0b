#include <atomic>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <sodium.h>

#include "core/Errors.hpp"
#include "core/ReviewProcessor.hpp"
#include "core/Scheduler.hpp"
#include "service/FlashcardService.hpp"
#include "storage/Storage.hpp"

namespace fs = std::filesystem;
using namespace std::chrono;

// Remembers what it was asked and schedules everything one day out
class RecordingOracle : public SchedulingOracle {
public:
    SchedulingState advance(const SchedulingState& current, Rating, Timestamp now) const override {
        {
            std::lock_guard<std::mutex> lock(m);
            seen_elapsed.push_back(current.elapsed_days);
        }
        SchedulingState next = current;
        next.reps = current.reps + 1;
        next.state = CardState::REVIEW;
        next.scheduled_days = 1;
        next.due = now + hours(24);
        next.last_review = now;
        return next;
    }

    mutable std::mutex m;
    mutable std::vector<std::uint64_t> seen_elapsed;
};

static void setDue(Storage& storage, const std::string& id, Timestamp due) {
    storage.transact([&](StoreData& data) { data.cards.at(id).fsrs.due = due; }, false);
}

int main() {
    std::cout << "[Test] Starting ReviewProcessor Test..." << std::endl;
    if (sodium_init() < 0) return 1;

    fs::path testRoot = fs::temp_directory_path() / ("flashcards_review_" + Card::generateID());
    fs::create_directories(testRoot);

    // A due 1h ago, B due 30m ago: A first, then B once A is rated GOOD
    {
        Storage storage((testRoot / "ab.json").string());
        storage.load();
        MemoryModel model;
        ReviewProcessor processor(storage, model);
        Scheduler scheduler;

        const Timestamp now = Clock::now();
        Card a = storage.createCard("A", "a", {});
        Card b = storage.createCard("B", "b", {});
        setDue(storage, a.id, now - hours(1));
        setDue(storage, b.id, now - minutes(30));

        DueCardResult first = scheduler.selectDueCard(storage.snapshot(), {}, now);
        assert(first.ok() && first.card->id == a.id);

        ReviewOutcome outcome = processor.submit(a.id, Rating::GOOD, "", now);
        assert(outcome.card.fsrs.due > now);
        assert(outcome.card.fsrs.reps == 1);
        assert(outcome.card.last_reviewed_at == now);
        assert(outcome.review.card_id == a.id);
        assert(outcome.review.rating == Rating::GOOD);
        assert(outcome.review.state == outcome.card.fsrs.state);
        assert(storage.getCard(a.id).fsrs.due == outcome.card.fsrs.due);

        DueCardResult second = scheduler.selectDueCard(storage.snapshot(), {}, now);
        assert(second.ok() && second.card->id == b.id);

        // the review reached disk with the card update
        Storage reloaded((testRoot / "ab.json").string());
        reloaded.load();
        assert(reloaded.getCardReviews(a.id).size() == 1);
        assert(reloaded.getCard(a.id).fsrs.reps == 1);
        std::cout << "[PASS] Reviewed card leaves the queue." << std::endl;
    }

    // elapsed_days comes from the previous review in the log
    {
        Storage storage((testRoot / "elapsed.json").string());
        storage.load();
        RecordingOracle oracle;
        ReviewProcessor processor(storage, oracle);

        Card c = storage.createCard("Q", "A", {});
        const Timestamp t0 = TimeUtils::parseRfc3339("2024-02-01T09:00:00Z");
        processor.submit(c.id, Rating::GOOD, "", t0);
        ReviewOutcome second = processor.submit(c.id, Rating::HARD, "close", t0 + hours(84));

        assert(oracle.seen_elapsed.size() == 2);
        assert(oracle.seen_elapsed[0] == 0);
        assert(oracle.seen_elapsed[1] == 3);
        assert(second.review.elapsed_days == 3);
        assert(second.review.answer == "close");

        assert(ReviewProcessor::elapsedDays(t0, t0 - hours(5)) == 0);
        assert(ReviewProcessor::elapsedDays(t0, t0 + hours(47)) == 1);
        std::cout << "[PASS] Elapsed days follow the review log." << std::endl;
    }

    // Unknown card and invalid ratings change nothing
    {
        Storage storage((testRoot / "invalid.json").string());
        storage.load();
        MemoryModel model;
        FlashcardService service(storage, model);
        Card c = service.createCard("Q", "A", {});

        bool notFound = false;
        try { service.submitReview("no-such-card", 3, ""); }
        catch (const NotFoundError&) { notFound = true; }
        assert(notFound);

        for (int bad : { 0, 5, -1 }) {
            bool rejected = false;
            try { service.submitReview(c.id, bad, ""); }
            catch (const ValidationError& e) {
                rejected = std::string(e.what()) == "Rating must be between 1 and 4";
            }
            assert(rejected);
        }
        assert(storage.snapshot().reviews.empty());
        assert(storage.getCard(c.id).fsrs.reps == 0);
        std::cout << "[PASS] Invalid reviews are rejected." << std::endl;
    }

    // Concurrent reviews of one card never lose an update
    {
        Storage storage((testRoot / "concurrent.json").string());
        storage.load();
        MemoryModel model;
        ReviewProcessor processor(storage, model);
        Card c = storage.createCard("Q", "A", {});

        const int NUM_THREADS = 16;
        std::atomic<int> failures{ 0 };
        std::vector<std::thread> threads;
        for (int i = 0; i < NUM_THREADS; ++i) {
            threads.emplace_back([&processor, &c, &failures, i]() {
                try {
                    processor.submit(c.id, static_cast<Rating>(1 + i % 4), "");
                }
                catch (const FlashcardError&) {
                    failures++;
                }
            });
        }
        for (auto& t : threads) t.join();

        assert(failures == 0);
        StoreData snap = storage.snapshot();
        assert(snap.reviews.size() == static_cast<size_t>(NUM_THREADS));
        assert(snap.cards.at(c.id).fsrs.reps == static_cast<std::uint64_t>(NUM_THREADS));
        std::cout << "[PASS] " << NUM_THREADS << " concurrent reviews all recorded." << std::endl;
    }

    // Editing a card while it is being reviewed keeps every review's state
    {
        Storage storage((testRoot / "edit_during_review.json").string());
        storage.load();
        MemoryModel model;
        FlashcardService service(storage, model);
        Card c = service.createCard("Q", "A", { "bio" });

        const int ROUNDS = 200;
        std::atomic<int> failures{ 0 };
        std::thread reviewer([&]() {
            for (int i = 0; i < ROUNDS; ++i) {
                try { service.submitReview(c.id, 3, ""); }
                catch (const FlashcardError&) { failures++; }
            }
        });
        std::thread editor([&]() {
            for (int i = 0; i < ROUNDS; ++i) {
                try { service.updateCard(c.id, "Q" + std::to_string(i), std::nullopt, std::nullopt); }
                catch (const FlashcardError&) { failures++; }
            }
        });
        reviewer.join();
        editor.join();

        assert(failures == 0);
        StoreData snap = storage.snapshot();
        const Card& stored = snap.cards.at(c.id);
        assert(snap.reviews.size() == static_cast<size_t>(ROUNDS));
        assert(stored.fsrs.reps == static_cast<std::uint64_t>(ROUNDS));
        assert(stored.front == "Q" + std::to_string(ROUNDS - 1));
        assert((stored.tags == std::vector<std::string>{ "bio" }));
        std::cout << "[PASS] Card edits never roll back concurrent reviews." << std::endl;
    }

    // A failed save leaves the change applied in memory and reports StorageError
    {
        const fs::path file = testRoot / "failing.json";
        Storage storage(file.string());
        storage.load();
        MemoryModel model;
        ReviewProcessor processor(storage, model);
        FlashcardService service(storage, model);
        Card c = service.createCard("Q", "A", {});

        // a directory where the temp file goes makes every write fail
        fs::create_directories(file.string() + ".tmp");

        bool reviewFailed = false;
        try { processor.submit(c.id, Rating::GOOD, ""); }
        catch (const StorageError&) { reviewFailed = true; }
        assert(reviewFailed);
        assert(storage.snapshot().reviews.size() == 1);
        assert(storage.getCard(c.id).fsrs.reps == 1);

        bool createFailed = false;
        try { service.createCard("second", "card", {}); }
        catch (const StorageError&) { createFailed = true; }
        assert(createFailed);
        assert(storage.listCards({}).size() == 2);

        // the file on disk still holds the last good save
        Storage onDisk(file.string());
        onDisk.load();
        assert(onDisk.listCards({}).size() == 1);
        assert(onDisk.snapshot().reviews.empty());

        fs::remove_all(file.string() + ".tmp");
        storage.save();
        Storage recovered(file.string());
        recovered.load();
        assert(recovered.listCards({}).size() == 2);
        assert(recovered.snapshot().reviews.size() == 1);
        std::cout << "[PASS] Failed save keeps the in-memory change." << std::endl;
    }

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
