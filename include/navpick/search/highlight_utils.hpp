#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace navpick::search {

struct HighlightSegment {
    std::string text;
    bool highlighted = false;
};

// Split text into plain/highlighted runs for the query. The first case-insensitive
// substring occurrence wins; otherwise the characters the subsequence scorer would
// match are highlighted. Text that does not match comes back as one plain segment.
std::vector<HighlightSegment> computeHighlightSegments(std::string_view text,
                                                       std::string_view query);

} // namespace navpick::search
