#include "JsonCodec.hpp"
#include "../core/Errors.hpp"

using nlohmann::json;

namespace JsonCodec {

    json timestamp(Timestamp ts) {
        return TimeUtils::formatRfc3339(ts);
    }

    Timestamp timestampFrom(const json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) return Timestamp{};
        if (!it->is_string()) {
            throw ValidationError(std::string("field '") + key + "' must be an RFC 3339 string");
        }
        return TimeUtils::parseRfc3339(it->get<std::string>());
    }
}

void to_json(json& j, const SchedulingState& s) {
    j = json{
        {"Due", JsonCodec::timestamp(s.due)},
        {"Stability", s.stability},
        {"Difficulty", s.difficulty},
        {"ElapsedDays", s.elapsed_days},
        {"ScheduledDays", s.scheduled_days},
        {"Reps", s.reps},
        {"Lapses", s.lapses},
        {"State", static_cast<int>(s.state)},
        {"LastReview", JsonCodec::timestamp(s.last_review)}
    };
}

void from_json(const json& j, SchedulingState& s) {
    s.due = JsonCodec::timestampFrom(j, "Due");
    s.stability = j.value("Stability", 0.0);
    s.difficulty = j.value("Difficulty", 0.0);
    s.elapsed_days = j.value("ElapsedDays", std::uint64_t{ 0 });
    s.scheduled_days = j.value("ScheduledDays", std::uint64_t{ 0 });
    s.reps = j.value("Reps", std::uint64_t{ 0 });
    s.lapses = j.value("Lapses", std::uint64_t{ 0 });
    s.state = cardStateFromInt(j.value("State", 0));
    s.last_review = JsonCodec::timestampFrom(j, "LastReview");
}

void to_json(json& j, const Card& c) {
    j = json{
        {"id", c.id},
        {"front", c.front},
        {"back", c.back},
        {"created_at", JsonCodec::timestamp(c.created_at)},
        {"last_reviewed_at", JsonCodec::timestamp(c.last_reviewed_at)},
        {"fsrs", c.fsrs}
    };
    if (!c.tags.empty()) j["tags"] = c.tags;
}

void from_json(const json& j, Card& c) {
    c.id = j.value("id", std::string());
    c.front = j.value("front", std::string());
    c.back = j.value("back", std::string());
    c.created_at = JsonCodec::timestampFrom(j, "created_at");
    c.last_reviewed_at = JsonCodec::timestampFrom(j, "last_reviewed_at");

    c.tags.clear();
    auto tags = j.find("tags");
    if (tags != j.end() && !tags->is_null()) {
        c.tags = tags->get<std::vector<std::string>>();
    }

    c.fsrs = SchedulingState{};
    auto fsrs = j.find("fsrs");
    if (fsrs != j.end() && fsrs->is_object()) {
        c.fsrs = fsrs->get<SchedulingState>();
    }
}

void to_json(json& j, const Review& r) {
    j = json{
        {"id", r.id},
        {"card_id", r.card_id},
        {"rating", static_cast<int>(r.rating)},
        {"timestamp", JsonCodec::timestamp(r.timestamp)},
        {"scheduled_days", r.scheduled_days},
        {"elapsed_days", r.elapsed_days},
        {"state", static_cast<int>(r.state)}
    };
    if (!r.answer.empty()) j["answer"] = r.answer;
}

void from_json(const json& j, Review& r) {
    r.id = j.value("id", std::string());
    r.card_id = j.at("card_id").get<std::string>();
    r.rating = ratingFromInt(j.at("rating").get<int>());
    r.timestamp = JsonCodec::timestampFrom(j, "timestamp");
    r.answer = j.value("answer", std::string());
    r.scheduled_days = j.value("scheduled_days", std::uint64_t{ 0 });
    r.elapsed_days = j.value("elapsed_days", std::uint64_t{ 0 });
    r.state = cardStateFromInt(j.value("state", 0));
}

void to_json(json& j, const DueDate& d) {
    j = json{
        {"id", d.id},
        {"topic", d.topic},
        {"due_date", JsonCodec::timestamp(d.due_date)},
        {"tag", d.tag}
    };
}

void from_json(const json& j, DueDate& d) {
    d.id = j.at("id").get<std::string>();
    d.topic = j.value("topic", std::string());
    d.due_date = JsonCodec::timestampFrom(j, "due_date");
    d.tag = j.value("tag", std::string());
}

void to_json(json& j, const StoreData& s) {
    json cards = json::object();
    for (const auto& entry : s.cards) {
        cards[entry.first] = entry.second;
    }
    j = json{
        {"cards", cards},
        {"reviews", s.reviews},
        {"due_dates", s.due_dates},
        {"last_updated", JsonCodec::timestamp(s.last_updated)}
    };
}

void from_json(const json& j, StoreData& s) {
    if (!j.is_object()) {
        throw ValidationError("store document must be a JSON object");
    }

    s = StoreData{};

    auto cards = j.find("cards");
    if (cards != j.end() && !cards->is_null()) {
        for (auto it = cards->begin(); it != cards->end(); ++it) {
            Card c = it.value().get<Card>();
            // The map key is authoritative for lookups; keep the record consistent with it.
            if (c.id.empty()) c.id = it.key();
            s.cards.emplace(it.key(), std::move(c));
        }
    }

    auto reviews = j.find("reviews");
    if (reviews != j.end() && !reviews->is_null()) {
        s.reviews = reviews->get<std::vector<Review>>();
    }

    auto due_dates = j.find("due_dates");
    if (due_dates != j.end() && !due_dates->is_null()) {
        s.due_dates = due_dates->get<std::vector<DueDate>>();
    }

    s.last_updated = JsonCodec::timestampFrom(j, "last_updated");
}
