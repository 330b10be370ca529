#pragma once

#include <navpick/config/selection_config.h>
#include <navpick/core/types.h>
#include <navpick/paging/page_loader.h>
#include <navpick/search/fuzzy_matcher.h>

#include <boost/asio/any_io_executor.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace navpick::tui {

enum class SelectionStatus { Pending, Confirmed, Cancelled, TimedOut, Empty };

constexpr const char* selectionStatusName(SelectionStatus s) {
    switch (s) {
        case SelectionStatus::Pending:
            return "pending";
        case SelectionStatus::Confirmed:
            return "confirmed";
        case SelectionStatus::Cancelled:
            return "cancelled";
        case SelectionStatus::TimedOut:
            return "timed out";
        case SelectionStatus::Empty:
            return "empty";
    }
    return "unknown";
}

template <typename T> struct SelectionOutcome {
    SelectionStatus status = SelectionStatus::Pending;
    std::optional<T> item; // set only when Confirmed

    bool confirmed() const noexcept { return status == SelectionStatus::Confirmed; }
    bool finished() const noexcept { return status != SelectionStatus::Pending; }
};

// Half-open range [start, end) of rows in the filtered list currently on screen
struct VisibleWindow {
    std::size_t start = 0;
    std::size_t end = 0;

    std::size_t size() const noexcept { return end - start; }
    bool empty() const noexcept { return start == end; }
    bool contains(int index) const noexcept {
        return index >= 0 && static_cast<std::size_t>(index) >= start &&
               static_cast<std::size_t>(index) < end;
    }
};

/**
 * PickerEngine
 *
 * Selection state for one interactive picker session: the filter query, the ranked
 * candidate list, the cursor and the visible window. Rendering is left to the host
 * through the render callback, which runs after every state change.
 *
 * Invariants while the filtered list is non-empty:
 *   0 <= index < filtered.size()
 *   windowStart <= index < windowEnd
 *   windowEnd - windowStart <= maxVisibleItems
 * With an empty filtered list index is -1 and the window is empty.
 *
 * Candidates come from an initial list and/or a paged data source. Pages are
 * requested lazily once the cursor comes within prefetchDistance rows of the end
 * of the filtered list; arriving pages are merged into the ranking without moving
 * the selection.
 *
 * After confirm() or cancel() the session is closed and every further mutation is
 * a no-op. Not thread-safe; all calls (and the data source completions, via the
 * page loader) run on the session executor.
 */
template <typename T> class PickerEngine {
public:
    using Candidate = search::FuzzyMatchResult<T>;
    using RenderCallback = std::function<void(const PickerEngine&)>;

    PickerEngine(config::SelectionOptions options, search::KeyExtractor<T> keys,
                 std::vector<T> initialItems = {}, RenderCallback render = {})
        : options_(std::move(options)), keys_(std::move(keys)),
          candidates_(std::move(initialItems)), render_(std::move(render)),
          maxVisible_(options_.effectiveMaxVisible()),
          prefetchDistance_(options_.effectivePrefetchDistance()) {
        refilter();
    }

    PickerEngine(const PickerEngine&) = delete;
    PickerEngine& operator=(const PickerEngine&) = delete;

    /**
     * Attach a paged data source. Pages start flowing on start().
     * @return InvalidArgument for a null source or an out-of-range page size,
     *         InvalidState when a source is already attached or the session is closed
     */
    Result<void> attachSource(boost::asio::any_io_executor executor,
                              std::shared_ptr<paging::IPagedDataSource<T>> source) {
        if (closed_) {
            return Error{ErrorCode::InvalidState, "Selection session is closed"};
        }
        if (loader_) {
            return Error{ErrorCode::InvalidState, "A data source is already attached"};
        }
        auto loader = paging::PageLoader<T>::create(
            std::move(executor), std::move(source), options_.pageSize,
            [this](paging::PagedResult<T> page) { onPage(std::move(page)); },
            [this](const Error& err) { onFetchError(err); });
        if (!loader) {
            return loader.error();
        }
        loader_ = std::move(loader).value();
        return Result<void>();
    }

    // Request the first page (when a source is attached) and render the initial state.
    Result<void> start() {
        if (closed_) {
            return Error{ErrorCode::InvalidState, "Selection session is closed"};
        }
        Result<void> r;
        if (loader_ && loader_->state() == paging::PageLoaderState::Idle &&
            loader_->pagesLoaded() == 0) {
            r = loader_->requestNext();
        }
        notify();
        return r;
    }

    void typeChar(char c) {
        if (rejectWhenClosed("typeChar") || !options_.enableFuzzySearch) {
            return;
        }
        const auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7f) {
            return;
        }
        query_.push_back(c);
        refilter();
        afterChange();
    }

    void backspace() {
        if (rejectWhenClosed("backspace") || !options_.enableFuzzySearch || query_.empty()) {
            return;
        }
        // Drop a whole UTF-8 sequence: continuation bytes and their lead byte.
        while (query_.size() > 1 && (static_cast<unsigned char>(query_.back()) & 0xC0) == 0x80) {
            query_.pop_back();
        }
        query_.pop_back();
        refilter();
        afterChange();
    }

    void moveDown() { moveBy(1, "moveDown"); }
    void moveUp() { moveBy(-1, "moveUp"); }
    void pageDown() { moveBy(maxVisible_, "pageDown"); }
    void pageUp() { moveBy(-maxVisible_, "pageUp"); }

    void top() {
        if (rejectWhenClosed("top") || filtered_.empty()) {
            return;
        }
        index_ = 0;
        windowStart_ = 0;
        afterChange();
    }

    void bottom() {
        if (rejectWhenClosed("bottom") || filtered_.empty()) {
            return;
        }
        const int count = static_cast<int>(filtered_.size());
        index_ = count - 1;
        windowStart_ = static_cast<std::size_t>(std::max(0, count - maxVisible_));
        afterChange();
    }

    /**
     * Confirm the highlighted candidate and close the session.
     * Returns nothing (and leaves the session open) when the filtered list is empty.
     */
    std::optional<T> confirm() {
        if (rejectWhenClosed("confirm")) {
            return std::nullopt;
        }
        const Candidate* selected = current();
        if (!selected) {
            return std::nullopt;
        }
        T item = selected->item;
        close(SelectionStatus::Confirmed, item);
        return item;
    }

    // End the session without a selection. reason must be Cancelled, TimedOut or Empty.
    void cancel(SelectionStatus reason = SelectionStatus::Cancelled) {
        if (rejectWhenClosed("cancel")) {
            return;
        }
        if (reason == SelectionStatus::Confirmed || reason == SelectionStatus::Pending) {
            reason = SelectionStatus::Cancelled;
        }
        close(reason, std::nullopt);
    }

    // Re-issue a failed page fetch with the same continuation token.
    Result<void> retryFetch() {
        if (closed_) {
            return Error{ErrorCode::InvalidState, "Selection session is closed"};
        }
        if (!loader_) {
            return Error{ErrorCode::InvalidState, "No data source attached"};
        }
        auto r = loader_->retry();
        if (r) {
            notify();
        }
        return r;
    }

    // Observation surface
    const std::string& query() const noexcept { return query_; }
    const std::vector<Candidate>& filtered() const noexcept { return filtered_; }
    int index() const noexcept { return index_; }
    int maxVisibleItems() const noexcept { return maxVisible_; }
    std::size_t candidateCount() const noexcept { return candidates_.size(); }
    const config::SelectionOptions& options() const noexcept { return options_; }

    VisibleWindow visibleWindow() const noexcept {
        if (filtered_.empty()) {
            return {};
        }
        return {windowStart_,
                std::min(filtered_.size(), windowStart_ + static_cast<std::size_t>(maxVisible_))};
    }

    const Candidate* current() const noexcept {
        if (index_ < 0 || static_cast<std::size_t>(index_) >= filtered_.size()) {
            return nullptr;
        }
        return &filtered_[static_cast<std::size_t>(index_)];
    }

    bool hasSource() const noexcept { return loader_ != nullptr; }
    bool loading() const noexcept { return loader_ && loader_->isFetching(); }
    bool hasMore() const noexcept { return loader_ && loader_->hasMore(); }
    std::size_t pagesLoaded() const noexcept { return loader_ ? loader_->pagesLoaded() : 0; }
    std::optional<Error> lastFetchError() const {
        if (!loader_) {
            return std::nullopt;
        }
        return loader_->lastError();
    }

    bool closed() const noexcept { return closed_; }
    const SelectionOutcome<T>& outcome() const noexcept { return outcome_; }

private:
    bool rejectWhenClosed(const char* op) const {
        if (closed_) {
            spdlog::debug("[PickerEngine] {} ignored: session already {}", op,
                          selectionStatusName(outcome_.status));
        }
        return closed_;
    }

    bool hasActiveQuery() const {
        return options_.enableFuzzySearch && !search::FuzzyMatcher::normalizeQuery(query_).empty();
    }

    void refilter() {
        if (hasActiveQuery()) {
            filtered_ = matcher_.rankAll(candidates_, keys_, query_);
        } else {
            filtered_.clear();
            filtered_.reserve(candidates_.size());
            for (std::size_t i = 0; i < candidates_.size(); ++i) {
                filtered_.push_back(Candidate{candidates_[i], 0, i});
            }
        }
        index_ = filtered_.empty() ? -1 : 0;
        windowStart_ = 0;
    }

    void moveBy(int delta, const char* op) {
        if (rejectWhenClosed(op) || filtered_.empty()) {
            return;
        }
        const int last = static_cast<int>(filtered_.size()) - 1;
        index_ = std::clamp(index_ + delta, 0, last);
        ensureVisible();
        afterChange();
    }

    void ensureVisible() {
        if (index_ < 0) {
            windowStart_ = 0;
            return;
        }
        const auto idx = static_cast<std::size_t>(index_);
        const auto visible = static_cast<std::size_t>(maxVisible_);
        if (idx < windowStart_) {
            windowStart_ = idx;
        } else if (idx >= windowStart_ + visible) {
            windowStart_ = idx - visible + 1;
        }
    }

    void afterChange() {
        maybePrefetch();
        notify();
    }

    void maybePrefetch() {
        if (closed_ || !loader_ || loader_->state() != paging::PageLoaderState::Idle) {
            return;
        }
        const long remaining = static_cast<long>(filtered_.size()) - index_;
        if (remaining > prefetchDistance_) {
            return;
        }
        if (auto r = loader_->requestNext(); !r) {
            spdlog::debug("[PickerEngine] Prefetch not issued: {}", r.error().message);
        }
    }

    void onPage(paging::PagedResult<T> page) {
        if (closed_) {
            return;
        }
        const std::size_t firstNew = candidates_.size();
        const std::size_t added = page.items.size();
        candidates_.insert(candidates_.end(), std::make_move_iterator(page.items.begin()),
                           std::make_move_iterator(page.items.end()));

        const Candidate* selected = current();
        const std::optional<std::size_t> selectedSource =
            selected ? std::optional<std::size_t>(selected->sourceIndex) : std::nullopt;

        if (hasActiveQuery()) {
            auto ranked = matcher_.rankAll(candidates_, keys_, query_, firstNew);
            std::vector<Candidate> merged;
            merged.reserve(filtered_.size() + ranked.size());
            std::merge(std::make_move_iterator(filtered_.begin()),
                       std::make_move_iterator(filtered_.end()),
                       std::make_move_iterator(ranked.begin()),
                       std::make_move_iterator(ranked.end()), std::back_inserter(merged),
                       [](const Candidate& a, const Candidate& b) { return a.score > b.score; });
            filtered_ = std::move(merged);
        } else {
            for (std::size_t i = firstNew; i < candidates_.size(); ++i) {
                filtered_.push_back(Candidate{candidates_[i], 0, i});
            }
        }

        if (selectedSource) {
            auto it = std::find_if(filtered_.begin(), filtered_.end(), [&](const Candidate& c) {
                return c.sourceIndex == *selectedSource;
            });
            index_ = static_cast<int>(std::distance(filtered_.begin(), it));
        } else {
            index_ = filtered_.empty() ? -1 : 0;
            windowStart_ = 0;
        }
        ensureVisible();

        spdlog::debug("[PickerEngine] Merged page: {} new items, {} candidates, {} filtered",
                      added, candidates_.size(), filtered_.size());
        afterChange();
    }

    void onFetchError(const Error&) {
        if (closed_) {
            return;
        }
        notify();
    }

    void close(SelectionStatus status, std::optional<T> item) {
        closed_ = true;
        outcome_.status = status;
        outcome_.item = std::move(item);
        if (loader_) {
            loader_->cancel();
        }
        spdlog::info("[PickerEngine] Selection {} ({} candidates, query='{}')",
                     selectionStatusName(status), candidates_.size(), query_);
        notify();
    }

    void notify() {
        if (render_) {
            render_(*this);
        }
    }

    config::SelectionOptions options_;
    search::KeyExtractor<T> keys_;
    search::FuzzyMatcher matcher_;
    std::vector<T> candidates_;
    RenderCallback render_;
    int maxVisible_;
    int prefetchDistance_;

    std::string query_;
    std::vector<Candidate> filtered_;
    int index_{-1};
    std::size_t windowStart_{0};

    std::unique_ptr<paging::PageLoader<T>> loader_;
    bool closed_{false};
    SelectionOutcome<T> outcome_;
};

} // namespace navpick::tui
