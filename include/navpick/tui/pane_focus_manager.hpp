#pragma once

#include <navpick/core/types.h>

#include <memory>
#include <string>
#include <vector>

namespace navpick::tui {

// A pane or widget that can take keyboard focus
class IFocusRegion {
public:
    virtual ~IFocusRegion() = default;

    virtual bool canAcceptFocus() const = 0;
    virtual bool isVisible() const = 0;
    virtual std::string focusName() const { return {}; }
};

using FocusRegionPtr = std::shared_ptr<IFocusRegion>;

/**
 * PaneFocusManager
 *
 * Ordered focus cycle over registered regions. Navigation skips regions that
 * cannot accept focus or are hidden and wraps around at either end. When a full
 * cycle finds no eligible region the lookup returns NotFound and the current
 * position is left as it was.
 *
 * Outlives individual picker sessions; shares the UI thread with them.
 */
class PaneFocusManager {
public:
    // Appends the region; registering the same region twice is a no-op.
    void registerRegion(FocusRegionPtr region);
    // Returns false when the region was not registered.
    bool unregisterRegion(const FocusRegionPtr& region);

    Result<FocusRegionPtr> tryGetFirst();
    Result<FocusRegionPtr> tryGetNext();
    Result<FocusRegionPtr> tryGetPrevious();

    // Make region the current position without reordering. NotFound if unregistered.
    Result<void> setCurrent(const FocusRegionPtr& region);

    // nullptr before any focus was assigned
    FocusRegionPtr current() const;

    std::size_t size() const noexcept { return chain_.size(); }
    bool empty() const noexcept { return chain_.empty(); }

private:
    static bool isFocusable(const IFocusRegion& region) {
        return region.canAcceptFocus() && region.isVisible();
    }

    int indexOf(const FocusRegionPtr& region) const;
    Result<FocusRegionPtr> focusAt(int index);

    std::vector<FocusRegionPtr> chain_;
    int currentIndex_{-1};
};

} // namespace navpick::tui
