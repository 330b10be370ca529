#pragma once

#include <navpick/core/types.h>
#include <navpick/paging/paged_data_source.h>
#include <navpick/paging/paged_result.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/post.hpp>

#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>

namespace navpick::paging {

enum class PageLoaderState { Idle, Fetching, Exhausted, Failed, Cancelled };

constexpr const char* pageLoaderStateName(PageLoaderState s) {
    switch (s) {
        case PageLoaderState::Idle:
            return "Idle";
        case PageLoaderState::Fetching:
            return "Fetching";
        case PageLoaderState::Exhausted:
            return "Exhausted";
        case PageLoaderState::Failed:
            return "Failed";
        case PageLoaderState::Cancelled:
            return "Cancelled";
    }
    return "Unknown";
}

struct PageLoaderSnapshot {
    PageLoaderState state{PageLoaderState::Idle};
    std::optional<std::string> continuationToken;
    std::size_t pagesLoaded{0};
    std::size_t itemsLoaded{0};
    std::optional<Error> lastError;
};

/**
 * PageLoader
 *
 * Owns the paging state of one selection session.
 *
 *   Idle --requestNext--> Fetching
 *   Fetching --page(token)--> Idle
 *   Fetching --page(no token)--> Exhausted
 *   Fetching --error--> Failed --retry--> Fetching (same continuation token)
 *   any --cancel--> Cancelled
 *
 * At most one request is outstanding. Completions from the data source are posted
 * onto the session executor before they touch any state, and are dropped when the
 * loader was cancelled or destroyed in the meantime. Page and error handlers run
 * on the session executor.
 */
template <typename T> class PageLoader {
public:
    using PageHandler = std::function<void(PagedResult<T>)>;
    using ErrorHandler = std::function<void(const Error&)>;

    static Result<std::unique_ptr<PageLoader>>
    create(boost::asio::any_io_executor executor, std::shared_ptr<IPagedDataSource<T>> source,
           std::size_t pageSize, PageHandler onPage, ErrorHandler onError = {}) {
        if (!source) {
            return Error{ErrorCode::InvalidArgument, "Paged data source is null"};
        }
        auto first = PageRequest::create(pageSize);
        if (!first) {
            return first.error();
        }
        return std::make_unique<PageLoader>(std::move(executor), std::move(source),
                                            std::move(first).value(), std::move(onPage),
                                            std::move(onError));
    }

    PageLoader(boost::asio::any_io_executor executor, std::shared_ptr<IPagedDataSource<T>> source,
               PageRequest firstRequest, PageHandler onPage, ErrorHandler onError = {})
        : executor_(std::move(executor)), source_(std::move(source)),
          next_(std::move(firstRequest)), onPage_(std::move(onPage)),
          onError_(std::move(onError)) {}

    ~PageLoader() { stop_.request_stop(); }

    PageLoader(const PageLoader&) = delete;
    PageLoader& operator=(const PageLoader&) = delete;

    /**
     * Issue the request for the next page.
     * @return OperationInProgress while a fetch is outstanding, InvalidState once
     *         exhausted or failed (see retry()), OperationCancelled after cancel()
     */
    Result<void> requestNext() {
        switch (state_) {
            case PageLoaderState::Idle:
                return issue();
            case PageLoaderState::Fetching:
                return Error{ErrorCode::OperationInProgress, "A page fetch is already in flight"};
            case PageLoaderState::Exhausted:
                return Error{ErrorCode::InvalidState, "No more pages"};
            case PageLoaderState::Failed:
                return Error{ErrorCode::InvalidState, "Last fetch failed; retry required"};
            case PageLoaderState::Cancelled:
                return Error{ErrorCode::OperationCancelled};
        }
        return Error{ErrorCode::InternalError};
    }

    // Re-issue the failed request with the same continuation token.
    Result<void> retry() {
        if (state_ != PageLoaderState::Failed) {
            return Error{ErrorCode::InvalidState,
                         std::string("Nothing to retry in state ") + pageLoaderStateName(state_)};
        }
        spdlog::debug("[PageLoader] Retrying page {} (token={})", pagesLoaded_ + 1,
                      next_.continuationToken.value_or("<first>"));
        return issue();
    }

    void cancel() {
        if (state_ == PageLoaderState::Cancelled) {
            return;
        }
        if (state_ == PageLoaderState::Fetching) {
            spdlog::debug("[PageLoader] Cancelling in-flight fetch");
        }
        stop_.request_stop();
        ++generation_;
        state_ = PageLoaderState::Cancelled;
    }

    PageLoaderState state() const noexcept { return state_; }
    bool isFetching() const noexcept { return state_ == PageLoaderState::Fetching; }

    // True while further pages may exist (including the not yet requested first page).
    bool hasMore() const noexcept {
        return state_ != PageLoaderState::Exhausted && state_ != PageLoaderState::Cancelled;
    }

    std::size_t pagesLoaded() const noexcept { return pagesLoaded_; }
    const std::optional<Error>& lastError() const noexcept { return lastError_; }
    const PageRequest& nextRequest() const noexcept { return next_; }

    PageLoaderSnapshot snapshot() const {
        return PageLoaderSnapshot{state_, next_.continuationToken, pagesLoaded_, itemsLoaded_,
                                  lastError_};
    }

private:
    Result<void> issue() {
        state_ = PageLoaderState::Fetching;
        const std::uint64_t generation = ++generation_;
        spdlog::debug("[PageLoader] Fetching page {} (size={}, token={})", pagesLoaded_ + 1,
                      next_.pageSize, next_.continuationToken.value_or("<first>"));

        std::weak_ptr<char> alive = lifetime_;
        auto executor = executor_;
        source_->fetchNextPage(
            next_, stop_.get_token(),
            [this, alive, executor, generation](Result<PagedResult<T>> result) {
                boost::asio::post(executor, [this, alive, generation,
                                             result = std::move(result)]() mutable {
                    if (alive.expired()) {
                        return;
                    }
                    onComplete(generation, std::move(result));
                });
            });
        return Result<void>();
    }

    void onComplete(std::uint64_t generation, Result<PagedResult<T>> result) {
        if (generation != generation_ || state_ != PageLoaderState::Fetching) {
            spdlog::debug("[PageLoader] Discarding stale page completion");
            return;
        }

        if (!result) {
            state_ = PageLoaderState::Failed;
            lastError_ = result.error();
            spdlog::warn("[PageLoader] Page fetch failed: {} ({})", result.error().message,
                         result.error().code);
            if (onError_) {
                onError_(*lastError_);
            }
            return;
        }

        PagedResult<T> page = std::move(result).value();
        ++pagesLoaded_;
        itemsLoaded_ += page.items.size();
        lastError_.reset();
        const bool continues =
            page.hasMore && page.continuationToken && !page.continuationToken->empty();
        if (continues) {
            next_ = next_.nextPage(*page.continuationToken);
            state_ = PageLoaderState::Idle;
        } else {
            if (page.hasMore) {
                spdlog::warn("[PageLoader] Page claims more results without a continuation "
                             "token; treating it as the last page");
                page.hasMore = false;
            }
            state_ = PageLoaderState::Exhausted;
        }
        spdlog::debug("[PageLoader] Page {} arrived: {} items, state={}", pagesLoaded_,
                      page.items.size(), pageLoaderStateName(state_));
        if (onPage_) {
            onPage_(std::move(page));
        }
    }

    boost::asio::any_io_executor executor_;
    std::shared_ptr<IPagedDataSource<T>> source_;
    PageRequest next_;
    PageHandler onPage_;
    ErrorHandler onError_;

    PageLoaderState state_{PageLoaderState::Idle};
    std::uint64_t generation_{0};
    std::stop_source stop_;
    std::size_t pagesLoaded_{0};
    std::size_t itemsLoaded_{0};
    std::optional<Error> lastError_;
    std::shared_ptr<char> lifetime_{std::make_shared<char>(0)};
};

} // namespace navpick::paging
