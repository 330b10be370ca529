#include <navpick/config/config_helpers.h>
#include <navpick/search/fuzzy_matcher.h>

namespace navpick::search {

std::string FuzzyMatcher::normalizeQuery(std::string_view query) {
    return config::toLower(config::trimmed(query));
}

std::optional<int> FuzzyMatcher::scoreKey(std::string_view key, std::string_view normalizedQuery) {
    if (key.empty() || normalizedQuery.empty()) {
        return std::nullopt;
    }

    const std::string text = config::toLower(key);

    if (auto idx = text.find(normalizedQuery); idx != std::string::npos) {
        // Favor earlier matches and shorter keys
        return kSubstringBase - static_cast<int>(idx) -
               static_cast<int>(std::min(text.size(), kLengthPenaltyCap));
    }

    std::size_t qi = 0;
    int score = 0;
    int streak = 0;
    for (std::size_t ti = 0; ti < text.size() && qi < normalizedQuery.size(); ++ti) {
        if (text[ti] == normalizedQuery[qi]) {
            ++qi;
            ++streak;
            score += 2;
            if (streak > 1)
                score += 1;
        } else {
            streak = 0;
        }
    }

    if (qi != normalizedQuery.size()) {
        return std::nullopt;
    }
    return score;
}

} // namespace navpick::search
