#include <navpick/config/config_helpers.h>
#include <navpick/config/selection_config.h>

#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace navpick::config {

using input::KeyAction;

KeyBindingsConfig KeyBindingsConfig::defaults() {
    KeyBindingsConfig cfg;
    cfg.bindings = {
        {KeyAction::MoveDown, "j"}, {KeyAction::MoveUp, "k"},  {KeyAction::Enter, "l"},
        {KeyAction::Back, "h"},     {KeyAction::Top, "gg"},    {KeyAction::Bottom, "G"},
        {KeyAction::Search, "/"},   {KeyAction::Command, ":"}, {KeyAction::Refresh, "r"},
        {KeyAction::Info, "i"},     {KeyAction::Help, "?"},    {KeyAction::Download, "d"},
    };
    return cfg;
}

Result<KeyBindingsConfig>
KeyBindingsConfig::fromMap(const std::map<std::string, std::string>& values,
                           std::chrono::milliseconds sequenceTimeout) {
    auto cfg = defaults();
    if (sequenceTimeout.count() > 0) {
        cfg.sequenceTimeout = sequenceTimeout;
    }

    for (const auto& [name, raw] : values) {
        auto action = input::parseKeyAction(name);
        if (!action) {
            return Error{ErrorCode::InvalidArgument, "Unknown key binding action: " + name};
        }
        // Values are literal; a quoted " " binds the space key.
        std::string seq = raw;
        if (seq.size() >= 2 &&
            ((seq.front() == '"' && seq.back() == '"') ||
             (seq.front() == '\'' && seq.back() == '\''))) {
            seq = seq.substr(1, seq.size() - 2);
        } else {
            seq = unquote(seq);
        }
        if (seq.empty()) {
            cfg.bindings.erase(*action);
        } else {
            cfg.bindings[*action] = std::move(seq);
        }
    }

    if (auto ok = cfg.validate(); !ok) {
        return ok.error();
    }
    return cfg;
}

Result<void> KeyBindingsConfig::validate() const {
    if (sequenceTimeout.count() <= 0) {
        return Error{ErrorCode::InvalidArgument, "Key sequence timeout must be positive"};
    }

    for (auto it = bindings.begin(); it != bindings.end(); ++it) {
        const auto& [action, seq] = *it;
        if (seq.empty()) {
            return Error{ErrorCode::InvalidArgument, fmt::format("Empty key sequence bound to {}",
                                                                 input::keyActionName(action))};
        }
        for (auto jt = std::next(it); jt != bindings.end(); ++jt) {
            const auto& other = jt->second;
            if (seq == other) {
                return Error{ErrorCode::InvalidArgument,
                             fmt::format("Key sequence '{}' is bound to both {} and {}", seq,
                                         input::keyActionName(action),
                                         input::keyActionName(jt->first))};
            }
            const auto& shorter = seq.size() < other.size() ? seq : other;
            const auto& longer = seq.size() < other.size() ? other : seq;
            if (!waitForLongerMatch && longer.compare(0, shorter.size(), shorter) == 0) {
                const auto shortAction = shorter == seq ? action : jt->first;
                const auto longAction = shorter == seq ? jt->first : action;
                return Error{ErrorCode::InvalidArgument,
                             fmt::format("Key sequence '{}' ({}) is a prefix of '{}' ({})",
                                         shorter, input::keyActionName(shortAction), longer,
                                         input::keyActionName(longAction))};
            }
        }
    }
    return {};
}

std::optional<input::KeyAction> KeyBindingsConfig::actionFor(const std::string& sequence) const {
    for (const auto& [action, seq] : bindings) {
        if (seq == sequence) {
            return action;
        }
    }
    return std::nullopt;
}

bool KeyBindingsConfig::isStrictPrefix(const std::string& buffer) const {
    return std::any_of(bindings.begin(), bindings.end(), [&](const auto& kv) {
        const auto& seq = kv.second;
        return seq.size() > buffer.size() && seq.compare(0, buffer.size(), buffer) == 0;
    });
}

int SelectionOptions::effectiveMaxVisible() const {
    return std::max(kMinVisibleItems, maxVisibleItems);
}

int SelectionOptions::effectivePrefetchDistance() const {
    return prefetchDistance > 0 ? prefetchDistance : effectiveMaxVisible();
}

} // namespace navpick::config
