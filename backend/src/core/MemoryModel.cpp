#include "MemoryModel.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

MemoryModel::MemoryModel()
    : initial_difficulty(0.3),
    min_stability(0.5),
    max_stability(36500.0),
    lapse_stability_factor(0.3),
    max_interval_days(36500),
    q_target_hard(0.80),
    q_target_good(0.90),
    q_target_easy(0.95),
    again_step(1),
    hard_step(5),
    good_step(10),
    relearning_step(10)
{
}

SchedulingState MemoryModel::advance(const SchedulingState& current, Rating r, Timestamp now) const {
    SchedulingState next = current;
    next.reps = current.reps + 1;
    next.last_review = now;

    switch (current.state) {
    case CardState::NEW:
        next.stability = initialStability(r);
        next.difficulty = updateDifficulty(initial_difficulty, r);
        if (r == Rating::EASY) scheduleReview(next, r, now);
        else if (r == Rating::AGAIN) scheduleStep(next, CardState::LEARNING, again_step, now);
        else if (r == Rating::HARD) scheduleStep(next, CardState::LEARNING, hard_step, now);
        else scheduleStep(next, CardState::LEARNING, good_step, now);
        break;

    case CardState::LEARNING:
    case CardState::RELEARNING: {
        next.difficulty = updateDifficulty(current.difficulty, r);
        bool relearning = current.state == CardState::RELEARNING;
        if (r == Rating::AGAIN) {
            scheduleStep(next, current.state, relearning ? relearning_step : again_step, now);
        }
        else if (r == Rating::HARD) {
            scheduleStep(next, current.state, relearning ? relearning_step : hard_step, now);
        }
        else {
            scheduleReview(next, r, now);
        }
        break;
    }

    case CardState::REVIEW:
        next.difficulty = updateDifficulty(current.difficulty, r);
        if (r == Rating::AGAIN) {
            // lapse: forget most of the stability and relearn
            next.lapses = current.lapses + 1;
            next.stability = std::max(min_stability, current.stability * lapse_stability_factor);
            scheduleStep(next, CardState::RELEARNING, relearning_step, now);
            spdlog::debug("MemoryModel: lapse #{} stability {:.3f} -> {:.3f}",
                next.lapses, current.stability, next.stability);
        }
        else {
            int interval = intervalDays(current.stability, r);
            next.stability = updateStability(current.stability, next.difficulty, r, interval);
            scheduleReview(next, r, now);
        }
        break;
    }

    spdlog::debug("MemoryModel: {} + {} -> {} stab={:.3f} diff={:.3f} scheduled={}d",
        cardStateName(current.state), ratingName(r), cardStateName(next.state),
        next.stability, next.difficulty, next.scheduled_days);
    return next;
}

/* -------------------------
   Interval from stability
   -------------------------
   Retention model R(t) = exp(-t / stability). For a target retention p* the
   next interval is t = -stability * ln(p*), rounded up to whole days.
*/
int MemoryModel::intervalDays(double stability, Rating r) const {
    double p_target = q_target_good;
    if (r == Rating::HARD) p_target = q_target_hard;
    else if (r == Rating::EASY) p_target = q_target_easy;
    p_target = std::clamp(p_target, 0.01, 0.999999);

    double s = std::clamp(stability, min_stability, max_stability);
    double next_interval = -s * std::log(p_target);
    int days = static_cast<int>(std::ceil(next_interval));
    return std::clamp(days, 1, max_interval_days);
}

double MemoryModel::initialStability(Rating r) const {
    switch (r) {
    case Rating::AGAIN: return 0.4;
    case Rating::HARD: return 0.6;
    case Rating::GOOD: return 2.4;
    case Rating::EASY: return 5.8;
    }
    return 0.4;
}

double MemoryModel::updateStability(double stability, double difficulty, Rating r, int interval) const {
    double base = 1.0;
    if (r == Rating::HARD) base = 1.15;
    else if (r == Rating::GOOD) base = 1.8;
    else if (r == Rating::EASY) base = 2.8;

    // Harder material grows slower
    double difficulty_factor = std::clamp(1.0 - (difficulty * 0.5), 0.4, 1.0);

    // Learning plateaus on long intervals
    double interval_factor = 1.0 + std::log(1.0 + std::max(1.0, static_cast<double>(interval))) * 0.05;

    double new_stability = stability * base * difficulty_factor * interval_factor;
    if (new_stability > stability + 1000.0) {
        new_stability = stability + 1000.0;
    }
    return std::clamp(new_stability, min_stability, max_stability);
}

double MemoryModel::updateDifficulty(double difficulty, Rating r) const {
    double delta = 0.0;
    if (r == Rating::AGAIN) delta = 0.08;
    else if (r == Rating::HARD) delta = 0.03;
    else if (r == Rating::GOOD) delta = -0.01;
    else if (r == Rating::EASY) delta = -0.05;

    return std::clamp(difficulty + delta, 0.01, 0.99);
}

void MemoryModel::scheduleReview(SchedulingState& s, Rating r, Timestamp now) const {
    int days = intervalDays(s.stability, r);
    s.state = CardState::REVIEW;
    s.scheduled_days = static_cast<std::uint64_t>(days);
    s.due = now + std::chrono::hours(24 * days);
}

void MemoryModel::scheduleStep(SchedulingState& s, CardState state, std::chrono::minutes step, Timestamp now) const {
    s.state = state;
    s.scheduled_days = 0;
    s.due = now + step;
}
