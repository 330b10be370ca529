#pragma once

#include <navpick/core/types.h>
#include <navpick/paging/paged_result.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/post.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <functional>
#include <stop_token>
#include <utility>

namespace navpick::paging {

/**
 * @brief Paged listing provider
 *
 * fetchNextPage must not block the caller. The completion is invoked exactly once
 * and may run on any thread; consumers marshal it back onto their own executor.
 * Implementations should observe the stop token and may complete with
 * ErrorCode::OperationCancelled once it is triggered.
 */
template <typename T> class IPagedDataSource {
public:
    using Completion = std::function<void(Result<PagedResult<T>>)>;

    virtual ~IPagedDataSource() = default;

    virtual void fetchNextPage(const PageRequest& request, std::stop_token cancel,
                               Completion done) = 0;
};

/**
 * @brief Adapts a blocking listing call onto a worker executor
 *
 * The listing function runs on the worker (typically a boost::asio::thread_pool);
 * std::exception failures are reported as NetworkError results, anything else as
 * InternalError.
 */
template <typename T> class ExecutorPagedDataSource : public IPagedDataSource<T> {
public:
    using Completion = typename IPagedDataSource<T>::Completion;
    using FetchFn = std::function<Result<PagedResult<T>>(const PageRequest&, std::stop_token)>;

    ExecutorPagedDataSource(boost::asio::any_io_executor worker, FetchFn fetch)
        : worker_(std::move(worker)), fetch_(std::move(fetch)) {}

    void fetchNextPage(const PageRequest& request, std::stop_token cancel,
                       Completion done) override {
        boost::asio::post(worker_, [fetch = fetch_, request, cancel = std::move(cancel),
                                    done = std::move(done)]() {
            if (cancel.stop_requested()) {
                done(Error{ErrorCode::OperationCancelled});
                return;
            }
            if (!fetch) {
                done(Error{ErrorCode::InvalidState, "No listing function configured"});
                return;
            }
            Result<PagedResult<T>> result = Error{ErrorCode::InternalError};
            try {
                result = fetch(request, cancel);
            } catch (const std::exception& e) {
                spdlog::warn("[ExecutorPagedDataSource] Listing failed: {}", e.what());
                result = Error{ErrorCode::NetworkError, e.what()};
            } catch (...) {
                spdlog::warn("[ExecutorPagedDataSource] Listing failed with unknown exception");
                result = Error{ErrorCode::InternalError, "Listing failed"};
            }
            done(std::move(result));
        });
    }

private:
    boost::asio::any_io_executor worker_;
    FetchFn fetch_;
};

} // namespace navpick::paging
