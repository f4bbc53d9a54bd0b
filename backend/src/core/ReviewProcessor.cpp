#include "ReviewProcessor.hpp"
#include "Errors.hpp"
#include "../storage/Storage.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

ReviewProcessor::ReviewProcessor(Storage& s, const SchedulingOracle& o)
    : storage(s), oracle(o)
{
}

std::uint64_t ReviewProcessor::elapsedDays(Timestamp last, Timestamp now) {
    double days = TimeUtils::daysBetween(last, now);
    if (days <= 0.0) return 0;
    return static_cast<std::uint64_t>(std::floor(days));
}

ReviewOutcome ReviewProcessor::submit(const std::string& cardId, Rating rating,
    const std::string& answer, Timestamp now) {
    spdlog::info("Review card {} | rating={}", cardId, static_cast<int>(rating));

    return storage.transact([&](StoreData& data) {
        auto it = data.cards.find(cardId);
        if (it == data.cards.end()) {
            spdlog::warn("Review rejected: card {} not found", cardId);
            throw NotFoundError("card not found: " + cardId);
        }
        Card card = it->second;

        // Elapsed days come from the review log, not from what the card remembers
        const Review* latest = nullptr;
        for (const auto& r : data.reviews) {
            if (r.card_id != cardId) continue;
            if (!latest || r.timestamp >= latest->timestamp) latest = &r;
        }
        if (latest) {
            card.fsrs.elapsed_days = elapsedDays(latest->timestamp, now);
            spdlog::debug("Card {} last reviewed {}, elapsed_days={}",
                cardId, TimeUtils::formatRfc3339(latest->timestamp), card.fsrs.elapsed_days);
        }

        card.fsrs = oracle.advance(card.fsrs, rating, now);
        card.last_reviewed_at = now;

        Review review;
        review.id = Card::generateID();
        review.card_id = cardId;
        review.rating = rating;
        review.timestamp = now;
        review.answer = answer;
        review.scheduled_days = card.fsrs.scheduled_days;
        review.elapsed_days = card.fsrs.elapsed_days;
        review.state = card.fsrs.state;

        it->second = card;
        data.reviews.push_back(review);

        spdlog::info("Card {} now {} due {} (scheduled {}d)", cardId, cardStateName(card.fsrs.state),
            TimeUtils::formatRfc3339(card.fsrs.due), card.fsrs.scheduled_days);
        return ReviewOutcome{ card, review };
    }, true);
}
