#include <navpick/search/fuzzy_matcher.h>
#include <navpick/search/highlight_utils.hpp>

#include <navpick/config/config_helpers.h>

namespace navpick::search {

namespace {
void appendRun(std::vector<HighlightSegment>& segments, std::string_view text, bool highlighted) {
    if (text.empty())
        return;
    if (!segments.empty() && segments.back().highlighted == highlighted) {
        segments.back().text.append(text);
        return;
    }
    segments.push_back({std::string(text), highlighted});
}
} // namespace

std::vector<HighlightSegment> computeHighlightSegments(std::string_view text,
                                                       std::string_view query) {
    std::vector<HighlightSegment> segments;
    const std::string lowerQuery = FuzzyMatcher::normalizeQuery(query);
    if (lowerQuery.empty() || text.empty()) {
        segments.push_back({std::string(text), false});
        return segments;
    }

    const std::string lowerText = config::toLower(text);

    if (auto match = lowerText.find(lowerQuery); match != std::string::npos) {
        appendRun(segments, text.substr(0, match), false);
        appendRun(segments, text.substr(match, lowerQuery.size()), true);
        appendRun(segments, text.substr(match + lowerQuery.size()), false);
        return segments;
    }

    // Greedy subsequence, same walk as the scorer
    std::vector<bool> marked(text.size(), false);
    std::size_t qi = 0;
    for (std::size_t ti = 0; ti < lowerText.size() && qi < lowerQuery.size(); ++ti) {
        if (lowerText[ti] == lowerQuery[qi]) {
            marked[ti] = true;
            ++qi;
        }
    }
    if (qi != lowerQuery.size()) {
        segments.push_back({std::string(text), false});
        return segments;
    }

    for (std::size_t i = 0; i < text.size(); ++i) {
        appendRun(segments, text.substr(i, 1), marked[i]);
    }
    return segments;
}

} // namespace navpick::search
