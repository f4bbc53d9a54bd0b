#include <cassert>
#include <cmath>
#include <iostream>

#include "core/MemoryModel.hpp"

using namespace std::chrono;

static bool near(double a, double b) { return std::abs(a - b) < 1e-9; }

int main() {
    std::cout << "[Test] Starting MemoryModel Test..." << std::endl;

    MemoryModel model;
    const Timestamp now = TimeUtils::parseRfc3339("2024-05-10T12:00:00Z");

    // New cards
    {
        SchedulingState fresh;
        fresh.due = now;
        fresh.elapsed_days = 4;

        SchedulingState again = model.advance(fresh, Rating::AGAIN, now);
        assert(again.state == CardState::LEARNING);
        assert(again.due == now + minutes(1));
        assert(again.scheduled_days == 0);
        assert(near(again.stability, 0.4));
        assert(near(again.difficulty, 0.38));
        assert(again.reps == 1);
        assert(again.last_review == now);
        assert(again.elapsed_days == 4);

        SchedulingState hard = model.advance(fresh, Rating::HARD, now);
        assert(hard.state == CardState::LEARNING && hard.due == now + minutes(5));

        SchedulingState good = model.advance(fresh, Rating::GOOD, now);
        assert(good.state == CardState::LEARNING && good.due == now + minutes(10));
        assert(near(good.stability, 2.4));

        SchedulingState easy = model.advance(fresh, Rating::EASY, now);
        assert(easy.state == CardState::REVIEW);
        assert(near(easy.stability, 5.8));
        assert(easy.scheduled_days == 1);
        assert(easy.due == now + hours(24));
        std::cout << "[PASS] New card transitions." << std::endl;
    }

    // Learning and relearning
    {
        SchedulingState learning;
        learning.state = CardState::LEARNING;
        learning.stability = 2.4;
        learning.difficulty = 0.3;

        SchedulingState again = model.advance(learning, Rating::AGAIN, now);
        assert(again.state == CardState::LEARNING && again.due == now + minutes(1));

        SchedulingState good = model.advance(learning, Rating::GOOD, now);
        assert(good.state == CardState::REVIEW);
        assert(good.scheduled_days >= 1);
        assert(good.due == now + hours(24 * static_cast<int>(good.scheduled_days)));

        SchedulingState relearning = learning;
        relearning.state = CardState::RELEARNING;
        SchedulingState stillRelearning = model.advance(relearning, Rating::AGAIN, now);
        assert(stillRelearning.state == CardState::RELEARNING);
        assert(stillRelearning.due == now + minutes(10));
        SchedulingState hardRelearning = model.advance(relearning, Rating::HARD, now);
        assert(hardRelearning.state == CardState::RELEARNING);
        assert(hardRelearning.due == now + minutes(10));
        std::cout << "[PASS] Learning step transitions." << std::endl;
    }

    // Review cards
    {
        SchedulingState review;
        review.state = CardState::REVIEW;
        review.stability = 20.0;
        review.difficulty = 0.3;
        review.reps = 5;

        SchedulingState good = model.advance(review, Rating::GOOD, now);
        assert(good.state == CardState::REVIEW);
        assert(good.stability > 20.0);
        assert(good.scheduled_days >= 3);
        assert(good.reps == 6);
        assert(good.lapses == 0);

        SchedulingState lapse = model.advance(review, Rating::AGAIN, now);
        assert(lapse.state == CardState::RELEARNING);
        assert(lapse.lapses == 1);
        assert(near(lapse.stability, 6.0));
        assert(lapse.due == now + minutes(10));
        assert(lapse.scheduled_days == 0);

        SchedulingState weak = review;
        weak.stability = 1.0;
        assert(near(model.advance(weak, Rating::AGAIN, now).stability, 0.5));

        SchedulingState veryHard = review;
        veryHard.difficulty = 0.98;
        assert(near(model.advance(veryHard, Rating::AGAIN, now).difficulty, 0.99));
        SchedulingState veryEasy = review;
        veryEasy.difficulty = 0.02;
        assert(near(model.advance(veryEasy, Rating::EASY, now).difficulty, 0.01));

        // same input, same output
        SchedulingState again1 = model.advance(review, Rating::HARD, now);
        SchedulingState again2 = model.advance(review, Rating::HARD, now);
        assert(again1.due == again2.due && again1.stability == again2.stability);
        std::cout << "[PASS] Review transitions and lapses." << std::endl;
    }

    // Intervals
    {
        // ceil(-20 * ln(target)) with targets 0.80 / 0.90 / 0.95
        assert(model.intervalDays(20.0, Rating::HARD) == 5);
        assert(model.intervalDays(20.0, Rating::GOOD) == 3);
        assert(model.intervalDays(20.0, Rating::EASY) == 2);
        assert(model.intervalDays(0.01, Rating::HARD) == 1);
        assert(model.intervalDays(1e9, Rating::EASY) <= 36500);
        std::cout << "[PASS] Interval bounds." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
