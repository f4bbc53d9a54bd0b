#include "TagManager.hpp"
#include <cctype>

std::map<std::string, int> TagManager::countTags(const std::vector<Card>& cards) {
    std::map<std::string, int> counts;
    for (const auto& card : cards) {
        for (const auto& t : card.tags) {
            counts[t]++;
        }
    }
    return counts;
}

std::string TagManager::cohortTag(const std::string& topic, const std::string& date) {
    std::string safe;
    safe.reserve(topic.size());
    for (unsigned char c : topic) {
        safe.push_back(c == ' ' ? '-' : static_cast<char>(std::tolower(c)));
    }
    return "test-" + safe + "-" + date;
}
