#include <navpick/input/key_action.h>

#include <cctype>
#include <string>

namespace navpick::input {

namespace {
std::string normalize(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == '_' || c == '-' || std::isspace(static_cast<unsigned char>(c)))
            continue;
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}
} // namespace

std::optional<KeyAction> parseKeyAction(std::string_view name) {
    const auto wanted = normalize(name);
    if (wanted.empty())
        return std::nullopt;
    for (auto action : kAllKeyActions) {
        if (normalize(keyActionName(action)) == wanted)
            return action;
    }
    return std::nullopt;
}

} // namespace navpick::input
