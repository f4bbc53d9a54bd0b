#include "Stats.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <spdlog/spdlog.h>

namespace Stats {

    CardStats compute(const StoreData& snapshot, Timestamp now) {
        CardStats stats;
        stats.total_cards = static_cast<int>(snapshot.cards.size());

        for (const auto& entry : snapshot.cards) {
            if (entry.second.fsrs.isDue(now)) stats.due_cards++;
        }

        const Timestamp today = TimeUtils::startOfLocalDay(now);
        int correct = 0;
        for (const auto& r : snapshot.reviews) {
            if (snapshot.cards.find(r.card_id) == snapshot.cards.end()) continue;
            if (r.timestamp < today) continue;

            stats.reviews_today++;
            if (r.rating >= Rating::GOOD) correct++;
        }

        if (stats.reviews_today > 0) {
            stats.retention_rate = static_cast<double>(correct) / stats.reviews_today * 100.0;
        }
        return stats;
    }

    DueDateProgress dueDateProgress(const StoreData& snapshot, const std::string& tag) {
        DueDateProgress progress;

        // latest review per card; later log entries win ties
        std::unordered_map<std::string, const Review*> latest;
        for (const auto& r : snapshot.reviews) {
            auto& slot = latest[r.card_id];
            if (!slot || r.timestamp >= slot->timestamp) slot = &r;
        }

        for (const auto& entry : snapshot.cards) {
            const Card& card = entry.second;
            if (!card.hasTag(tag)) continue;

            progress.total_cards++;
            auto it = latest.find(card.id);
            if (it != latest.end() && it->second->rating == Rating::EASY) {
                progress.mastered_cards++;
            }
        }

        if (progress.total_cards > 0) {
            progress.progress_percent =
                static_cast<double>(progress.mastered_cards) / progress.total_cards * 100.0;
        }

        spdlog::debug("Progress for tag '{}': {}/{} mastered", tag, progress.mastered_cards, progress.total_cards);
        return progress;
    }

    std::vector<DueDateProgressInfo> progressReport(const StoreData& snapshot, Timestamp now) {
        std::vector<DueDateProgressInfo> report;
        const Timestamp today = TimeUtils::startOfUtcDay(now);

        for (const auto& dd : snapshot.due_dates) {
            const Timestamp due_day = TimeUtils::startOfUtcDay(dd.due_date);
            // past deadlines drop out, except cohort tags generated for due dates
            if (due_day < today && dd.tag.rfind("test-", 0) != 0) {
                spdlog::debug("Skipping past due date '{}' ({})", dd.topic, TimeUtils::formatDate(due_day));
                continue;
            }

            DueDateProgressInfo info;
            info.due_date = dd;
            info.progress = dueDateProgress(snapshot, dd.tag);

            // whole days before the deadline day itself
            double days_until = std::round(TimeUtils::daysBetween(today, due_day));
            info.days_remaining = std::max(0.0, days_until - 1.0);
            info.cards_left = info.progress.total_cards - info.progress.mastered_cards;
            if (info.days_remaining > 0 && info.cards_left > 0) {
                info.required_pace = info.cards_left / info.days_remaining;
            }
            report.push_back(info);
        }

        std::stable_sort(report.begin(), report.end(),
            [](const DueDateProgressInfo& a, const DueDateProgressInfo& b) {
                return a.due_date.due_date < b.due_date.due_date;
            });
        return report;
    }
}
