#pragma once
#include <map>
#include <string>
#include <vector>
#include "Card.hpp"

// Everything the store persists. Cards are keyed (and therefore listed) by id.
struct StoreData {
    std::map<std::string, Card> cards;
    std::vector<Review> reviews;
    std::vector<DueDate> due_dates;
    Timestamp last_updated{};
};
