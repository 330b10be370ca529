#pragma once

#include <navpick/core/types.h>
#include <navpick/input/key_action.h>

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace navpick::config {

/**
 * Literal key sequences bound to logical actions.
 *
 * Sequences are compared character by character (case-sensitive), so "g" and "G"
 * may be bound to different actions. The defaults mirror vim-style navigation:
 * j/k move, l enters, h goes back, gg/G jump to top/bottom.
 */
struct KeyBindingsConfig {
    std::map<input::KeyAction, std::string> bindings;
    std::chrono::milliseconds sequenceTimeout{1000};
    // When set, a sequence may also be a strict prefix of another one ("g" and "gg").
    // The shorter binding then waits for the timeout (or a diverging key) instead of
    // resolving immediately.
    bool waitForLongerMatch = false;

    static KeyBindingsConfig defaults();

    /**
     * Build bindings from the string map produced by the host's configuration loader.
     * Keys are action names (see input::parseKeyAction), values are literal sequences
     * (surrounding quotes are stripped). An empty value unbinds the action.
     * Unknown action names are rejected. A non-positive timeout keeps the default.
     */
    static Result<KeyBindingsConfig>
    fromMap(const std::map<std::string, std::string>& values,
            std::chrono::milliseconds sequenceTimeout = std::chrono::milliseconds{1000});

    /**
     * Reject configurations that break prefix resolution:
     *  - an empty sequence
     *  - the same sequence bound to two actions
     *  - a sequence that is a strict prefix of another one (the longer one would be
     *    unreachable because exact matches resolve immediately), unless
     *    waitForLongerMatch is set
     *  - a non-positive sequence timeout
     */
    [[nodiscard]] Result<void> validate() const;

    std::optional<input::KeyAction> actionFor(const std::string& sequence) const;
    bool isStrictPrefix(const std::string& buffer) const;
};

struct SelectionOptions {
    static constexpr int kMinVisibleItems = 5;
    static constexpr std::size_t kDefaultPageSize = 100;

    bool enableFuzzySearch = true;
    int maxVisibleItems = 15;
    std::size_t pageSize = kDefaultPageSize;
    // Rows from the end of the filtered list that trigger the next page. 0 = maxVisibleItems.
    int prefetchDistance = 0;
    bool highlightMatches = true;
    // Inactivity timeout for an interactive session; reset on every keystroke.
    std::optional<std::chrono::milliseconds> pickerTimeout;
    bool autoSelectSingle = false;

    int effectiveMaxVisible() const;
    int effectivePrefetchDistance() const;
};

} // namespace navpick::config
