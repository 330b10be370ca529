#pragma once

#include <navpick/core/types.h>

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace navpick::paging {

/**
 * @brief Request for one page of a paginated listing
 *
 * An absent continuation token requests the first page.
 */
struct PageRequest {
    static constexpr std::size_t kDefaultPageSize = 100;
    static constexpr std::size_t kMaxPageSize = 5000;

    std::size_t pageSize = kDefaultPageSize;
    std::optional<std::string> continuationToken;

    /// @return InvalidArgument when pageSize is 0 or above kMaxPageSize
    static Result<PageRequest> create(std::size_t pageSize,
                                      std::optional<std::string> continuationToken = std::nullopt);

    static PageRequest firstPage() { return PageRequest{}; }

    PageRequest nextPage(std::string token) const {
        PageRequest next = *this;
        next.continuationToken = std::move(token);
        return next;
    }

    bool isFirstPage() const noexcept { return !continuationToken.has_value(); }
};

/**
 * @brief One page of results
 *
 * hasMore is true iff a non-empty continuation token was returned.
 */
template <typename T> struct PagedResult {
    std::vector<T> items;
    std::optional<std::string> continuationToken;
    bool hasMore = false;

    PagedResult() = default;
    explicit PagedResult(std::vector<T> pageItems,
                         std::optional<std::string> token = std::nullopt)
        : items(std::move(pageItems)), continuationToken(std::move(token)),
          hasMore(continuationToken.has_value() && !continuationToken->empty()) {
        if (!hasMore) {
            continuationToken.reset();
        }
    }

    static PagedResult empty() { return PagedResult{}; }

    std::size_t count() const noexcept { return items.size(); }
};

} // namespace navpick::paging
