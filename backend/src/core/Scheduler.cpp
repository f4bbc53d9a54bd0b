#include "Scheduler.hpp"
#include <algorithm>
#include <sstream>
#include <spdlog/spdlog.h>

namespace {
    std::string joinTags(const std::vector<std::string>& tags) {
        std::ostringstream oss;
        oss << "[";
        for (size_t i = 0; i < tags.size(); ++i) {
            if (i) oss << " ";
            oss << tags[i];
        }
        oss << "]";
        return oss.str();
    }
}

Scheduler::Scheduler()
    : base_new(1.0),
    base_learning(3.0),
    base_review(2.0),
    overdue_weight(0.1)
{
}

double Scheduler::basePriority(CardState state) const {
    switch (state) {
    case CardState::NEW: return base_new;
    case CardState::LEARNING:
    case CardState::RELEARNING: return base_learning;
    case CardState::REVIEW: return base_review;
    }
    return base_new;
}

double Scheduler::reviewPriority(CardState state, Timestamp due, Timestamp now) const {
    double base = basePriority(state);
    double overdue_days = TimeUtils::daysBetween(due, now);

    if (overdue_days >= 0) {
        return base * (1.0 + overdue_days * overdue_weight);
    }
    return base / (1.0 + (-overdue_days));
}

bool Scheduler::higherPriority(const Card& a, double pa, const Card& b, double pb) const {
    if (pa != pb) return pa > pb;
    if (a.fsrs.due != b.fsrs.due) return a.fsrs.due < b.fsrs.due;
    return a.id < b.id;
}

std::vector<const Card*> Scheduler::getDueCards(const StoreData& snapshot,
    const std::vector<std::string>& tags, Timestamp now) const {
    std::vector<std::pair<const Card*, double>> due;

    for (const auto& entry : snapshot.cards) {
        const Card& card = entry.second;
        if (!card.hasAllTags(tags) || !card.fsrs.isDue(now)) continue;
        due.emplace_back(&card, reviewPriority(card.fsrs.state, card.fsrs.due, now));
    }

    std::sort(due.begin(), due.end(),
        [this](const std::pair<const Card*, double>& a, const std::pair<const Card*, double>& b) {
            return higherPriority(*a.first, a.second, *b.first, b.second);
        });

    std::vector<const Card*> result;
    result.reserve(due.size());
    for (const auto& p : due) result.push_back(p.first);
    return result;
}

DueCardResult Scheduler::selectDueCard(const StoreData& snapshot,
    const std::vector<std::string>& tags, Timestamp now) const {
    DueCardResult result;
    result.stats = Stats::compute(snapshot, now);

    if (!tags.empty()) {
        bool any_match = std::any_of(snapshot.cards.begin(), snapshot.cards.end(),
            [&tags](const std::pair<const std::string, Card>& entry) { return entry.second.hasAllTags(tags); });
        if (!any_match) {
            spdlog::debug("selectDueCard: no card carries all of {}", joinTags(tags));
            result.error = ErrorCode::NoCardsMatchingTags;
            result.message = "no cards found with the specified tags: " + joinTags(tags);
            return result;
        }
    }

    auto due = getDueCards(snapshot, tags, now);
    spdlog::debug("selectDueCard: {} due card(s) among {} total, filter {}",
        due.size(), snapshot.cards.size(), joinTags(tags));

    if (due.empty()) {
        if (!tags.empty()) {
            result.error = ErrorCode::NoCardsDueWithTags;
            result.message = "no cards due for review with the specified tags: " + joinTags(tags);
        }
        else {
            result.error = ErrorCode::NoCardsDue;
            result.message = "no cards due for review";
        }
        return result;
    }

    const Card* best = due.front();
    result.card = *best;
    result.priority = reviewPriority(best->fsrs.state, best->fsrs.due, now);
    spdlog::debug("selectDueCard: picked {} (priority {:.3f})", best->id, result.priority);
    return result;
}
