#pragma once
#include <chrono>
#include "Card.hpp"

// Produces the next memory state of a card after a rating. Implementations must
// be deterministic and return a complete state, not a diff.
class SchedulingOracle {
public:
    virtual ~SchedulingOracle() = default;

    virtual SchedulingState advance(const SchedulingState& current, Rating rating, Timestamp now) const = 0;
};

/*
  Default oracle: a small FSRS-inspired stability/difficulty model.
   - New and (re)learning cards step through minute-scale learning steps
   - Review cards grow stability multiplicatively and get day intervals
     from R(t) = exp(-t / stability) and a per-rating retention target
   - AGAIN on a review card is a lapse and moves it to Relearning
  No fuzzing, so equal inputs always give equal outputs.
*/
class MemoryModel : public SchedulingOracle {
public:
    MemoryModel();

    SchedulingState advance(const SchedulingState& current, Rating rating, Timestamp now) const override;

    // Whole days until the next review for the given stability and rating
    int intervalDays(double stability, Rating rating) const;

private:
    double initialStability(Rating r) const;
    double updateStability(double stability, double difficulty, Rating r, int interval) const;
    double updateDifficulty(double difficulty, Rating r) const;
    void scheduleReview(SchedulingState& s, Rating r, Timestamp now) const;
    void scheduleStep(SchedulingState& s, CardState state, std::chrono::minutes step, Timestamp now) const;

    // Tuning (days unless noted)
    double initial_difficulty;
    double min_stability;
    double max_stability;
    double lapse_stability_factor;
    int max_interval_days;

    double q_target_hard;
    double q_target_good;
    double q_target_easy;

    std::chrono::minutes again_step;
    std::chrono::minutes hard_step;
    std::chrono::minutes good_step;
    std::chrono::minutes relearning_step;
};
