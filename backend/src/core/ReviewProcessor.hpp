#pragma once
#include <string>
#include "Card.hpp"
#include "MemoryModel.hpp"

class Storage;

struct ReviewOutcome {
    Card card;      // card as stored after the review
    Review review;  // record appended to the log
};

// Applies a rating to a card.
//
// The whole read / oracle / update / append / save sequence runs inside one
// exclusive Storage::transact, so two reviews of the same card can never
// interleave and lose an update. If the final save fails the in-memory change
// stays applied and StorageError propagates; there is no rollback.
class ReviewProcessor {
public:
    ReviewProcessor(Storage& storage, const SchedulingOracle& oracle);

    // Throws NotFoundError for an unknown card and StorageError if the save fails.
    ReviewOutcome submit(const std::string& cardId, Rating rating,
        const std::string& answer, Timestamp now = Clock::now());

    // floor((now - last) in days), never negative
    static std::uint64_t elapsedDays(Timestamp last, Timestamp now);

private:
    Storage& storage;
    const SchedulingOracle& oracle;
};
