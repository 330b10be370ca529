#include <navpick/paging/paged_result.h>

#include <spdlog/fmt/fmt.h>

namespace navpick::paging {

Result<PageRequest> PageRequest::create(std::size_t pageSize,
                                        std::optional<std::string> continuationToken) {
    if (pageSize == 0) {
        return Error{ErrorCode::InvalidArgument, "Page size must be greater than zero"};
    }
    if (pageSize > kMaxPageSize) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Page size cannot exceed {} items", kMaxPageSize)};
    }
    PageRequest req;
    req.pageSize = pageSize;
    req.continuationToken = std::move(continuationToken);
    return req;
}

} // namespace navpick::paging
