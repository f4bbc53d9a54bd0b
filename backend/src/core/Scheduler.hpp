#pragma once
#include <optional>
#include <string>
#include <vector>
#include "Card.hpp"
#include "Errors.hpp"
#include "Stats.hpp"
#include "StoreData.hpp"

// Outcome of a due-card request. Stats over ALL cards are filled in whether or
// not a card was found.
struct DueCardResult {
    std::optional<Card> card;
    double priority = 0.0;
    CardStats stats;
    std::optional<ErrorCode> error;  // NoCardsDue, NoCardsDueWithTags or NoCardsMatchingTags
    std::string message;

    bool ok() const { return card.has_value(); }
};

/*
  Due-card selection.
   - a card is due when fsrs.due <= now
   - priority = base(state) * (1 + overdue_days * 0.1)
     with base New=1, Review=2, Learning/Relearning=3
   - tag filters here use AND semantics (every requested tag must be present),
     unlike Storage::listCards which uses OR
   - ties on priority go to the earlier due time, then the smaller id
*/
class Scheduler {
public:
    Scheduler();

    double basePriority(CardState state) const;

    // For cards not yet due this returns base / (1 + days_to_due); selection never
    // uses that branch, it exists for simulations.
    double reviewPriority(CardState state, Timestamp due, Timestamp now) const;

    // Due cards matching every tag in `tags`, highest priority first.
    std::vector<const Card*> getDueCards(const StoreData& snapshot,
        const std::vector<std::string>& tags, Timestamp now) const;

    DueCardResult selectDueCard(const StoreData& snapshot,
        const std::vector<std::string>& tags, Timestamp now) const;

private:
    bool higherPriority(const Card& a, double pa, const Card& b, double pb) const;

    double base_new;
    double base_learning;
    double base_review;
    double overdue_weight;  // priority gained per overdue day, relative to base
};
