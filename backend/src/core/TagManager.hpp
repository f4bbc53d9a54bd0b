#pragma once
#include <map>
#include <string>
#include <vector>
#include "Card.hpp"

// Tag views over a set of cards. Tags are plain strings; nothing checks that a
// due-date cohort tag is actually carried by any card.
class TagManager {
public:
    // tag -> number of cards carrying it, ordered by tag
    static std::map<std::string, int> countTags(const std::vector<Card>& cards);

    // Tag used for a due date when the caller does not name one:
    // test-<topic lowercased, spaces as dashes>-<YYYY-MM-DD>
    static std::string cohortTag(const std::string& topic, const std::string& date);
};
