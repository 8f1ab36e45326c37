/**
 * @file row_source.h
 * @brief Abstract fetch capability consumed by TableController
 */

#pragma once

#include <functional>
#include <optional>
#include <vector>

#include "table/sort_model.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace pagedtable::table {

/**
 * @brief One page request
 *
 * @c page_token is empty for the first page, or when no token was recorded
 * for the requested page.
 */
template <typename K>
struct FetchRequest {
  int page_size = 0;
  std::optional<SortModel> sort_model;
  std::optional<K> page_token;
};

/**
 * @brief One page of rows plus the cursor of the following page
 *
 * An empty @c next_page_token means this is the last page.
 */
template <typename K, typename T>
struct FetchResult {
  std::vector<T> items;
  std::optional<K> next_page_token;
};

/**
 * @brief Abstract interface for a cursor-paginated data source
 *
 * This interface decouples the controller from the backend (remote API,
 * database, in-memory vector) and enables unit testing with fakes.
 *
 * @tparam K Opaque cursor token type
 * @tparam T Row item type
 */
template <typename K, typename T>
class IRowSource {
 public:
  using Result = utils::Expected<FetchResult<K, T>, utils::Error>;
  using FetchCallback = std::function<void(Result)>;

  virtual ~IRowSource() = default;

  /**
   * @brief Start fetching one page
   *
   * @p callback must be invoked exactly once, either before Fetch() returns
   * or later from the task queue. Throwing std::exception from Fetch() is
   * reported to the controller as a failed fetch.
   *
   * @param request Page size, sort and cursor of the page
   * @param callback Receives the rows or the error
   */
  virtual void Fetch(const FetchRequest<K>& request, FetchCallback callback) = 0;
};

}  // namespace pagedtable::table
