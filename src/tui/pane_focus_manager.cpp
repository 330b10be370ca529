#include <navpick/tui/pane_focus_manager.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace navpick::tui {

void PaneFocusManager::registerRegion(FocusRegionPtr region) {
    if (!region || indexOf(region) >= 0) {
        return;
    }
    chain_.push_back(std::move(region));
}

bool PaneFocusManager::unregisterRegion(const FocusRegionPtr& region) {
    const int idx = indexOf(region);
    if (idx < 0) {
        return false;
    }
    chain_.erase(chain_.begin() + idx);
    if (idx == currentIndex_) {
        currentIndex_ = -1;
    } else if (idx < currentIndex_) {
        --currentIndex_;
    }
    return true;
}

Result<FocusRegionPtr> PaneFocusManager::tryGetFirst() {
    for (int i = 0; i < static_cast<int>(chain_.size()); ++i) {
        if (isFocusable(*chain_[i])) {
            return focusAt(i);
        }
    }
    return Error{ErrorCode::NotFound, "No focusable region"};
}

Result<FocusRegionPtr> PaneFocusManager::tryGetNext() {
    const int count = static_cast<int>(chain_.size());
    int index = currentIndex_;
    for (int attempts = 0; attempts < count; ++attempts) {
        index = (index + 1) % count;
        if (isFocusable(*chain_[index])) {
            return focusAt(index);
        }
    }
    return Error{ErrorCode::NotFound, "No focusable region"};
}

Result<FocusRegionPtr> PaneFocusManager::tryGetPrevious() {
    const int count = static_cast<int>(chain_.size());
    int index = currentIndex_ < 0 ? 0 : currentIndex_;
    for (int attempts = 0; attempts < count; ++attempts) {
        index = index == 0 ? count - 1 : index - 1;
        if (isFocusable(*chain_[index])) {
            return focusAt(index);
        }
    }
    return Error{ErrorCode::NotFound, "No focusable region"};
}

Result<void> PaneFocusManager::setCurrent(const FocusRegionPtr& region) {
    const int idx = indexOf(region);
    if (idx < 0) {
        return Error{ErrorCode::NotFound, "Region is not registered"};
    }
    currentIndex_ = idx;
    return Result<void>();
}

FocusRegionPtr PaneFocusManager::current() const {
    if (currentIndex_ < 0 || currentIndex_ >= static_cast<int>(chain_.size())) {
        return nullptr;
    }
    return chain_[currentIndex_];
}

int PaneFocusManager::indexOf(const FocusRegionPtr& region) const {
    auto it = std::find(chain_.begin(), chain_.end(), region);
    return it == chain_.end() ? -1 : static_cast<int>(std::distance(chain_.begin(), it));
}

Result<FocusRegionPtr> PaneFocusManager::focusAt(int index) {
    currentIndex_ = index;
    const auto& region = chain_[index];
    spdlog::debug("[PaneFocusManager] Focus -> {} ({})", index, region->focusName());
    return region;
}

} // namespace navpick::tui
