#pragma once
#include <nlohmann/json.hpp>
#include "../core/Card.hpp"
#include "../core/StoreData.hpp"

// JSON mapping of the store file:
//
//   { "cards": { id: Card }, "reviews": [Review], "due_dates": [DueDate], "last_updated": ts }
//
// Card scheduling data lives under "fsrs" with the capitalised keys other
// FSRS tooling writes (Due, Stability, ...). Missing keys decode to defaults.
void to_json(nlohmann::json& j, const SchedulingState& s);
void from_json(const nlohmann::json& j, SchedulingState& s);

void to_json(nlohmann::json& j, const Card& c);
void from_json(const nlohmann::json& j, Card& c);

void to_json(nlohmann::json& j, const Review& r);
void from_json(const nlohmann::json& j, Review& r);

void to_json(nlohmann::json& j, const DueDate& d);
void from_json(const nlohmann::json& j, DueDate& d);

void to_json(nlohmann::json& j, const StoreData& s);
void from_json(const nlohmann::json& j, StoreData& s);

namespace JsonCodec {
    nlohmann::json timestamp(Timestamp ts);
    Timestamp timestampFrom(const nlohmann::json& j, const char* key);
}
