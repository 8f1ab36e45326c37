/**
 * @file vector_row_source.h
 * @brief In-memory cursor-paginated row source
 */

#pragma once

#include <algorithm>
#include <charconv>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "table/row_source.h"
#include "utils/error.h"
#include "utils/expected.h"
#include "utils/structured_log.h"
#include "utils/task_queue.h"

namespace pagedtable::source {

/**
 * @brief Row source over a std::vector
 *
 * Each fetch sorts a copy of the rows by the requested field (stable, so
 * equal keys keep insertion order), then returns @c page_size rows starting
 * at the offset carried by the page token. The token is opaque to callers;
 * a next token is returned while rows remain after the page.
 *
 * Fetch() completes from the task queue, like a remote call would. FetchPage()
 * is the synchronous core.
 *
 * @tparam T Row item type
 */
template <typename T>
class VectorRowSource : public table::IRowSource<std::string, T> {
 public:
  using Base = table::IRowSource<std::string, T>;
  using typename Base::FetchCallback;
  using typename Base::Result;

  /**
   * @brief Strict weak ordering of two rows by one field
   */
  using Comparator = std::function<bool(const T&, const T&)>;

  VectorRowSource(utils::TaskQueue& task_queue, std::vector<T> rows, std::map<std::string, Comparator> comparators)
      : task_queue_(task_queue), rows_(std::move(rows)), comparators_(std::move(comparators)) {}

  void Fetch(const table::FetchRequest<std::string>& request, FetchCallback callback) override {
    Result result = FetchPage(request);
    auto shared_callback = std::make_shared<FetchCallback>(std::move(callback));
    bool posted = task_queue_.Post([shared_callback, result]() mutable { (*shared_callback)(std::move(result)); });
    if (!posted) {
      (*shared_callback)(utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kSourceUnavailable, "Task queue is shut down")));
    }
  }

  /**
   * @brief Serve one page synchronously
   */
  Result FetchPage(const table::FetchRequest<std::string>& request) {
    ++fetch_count_;

    if (failures_remaining_ > 0) {
      --failures_remaining_;
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kSourceUnavailable, "Row source unavailable (injected failure)"));
    }

    if (request.page_size <= 0) {
      return utils::MakeUnexpected(utils::MakeError(
          utils::ErrorCode::kInvalidArgument, "Page size must be positive, got " + std::to_string(request.page_size)));
    }

    size_t offset = 0;
    if (request.page_token.has_value()) {
      auto decoded = DecodeToken(*request.page_token);
      if (!decoded) {
        return utils::MakeUnexpected(decoded.error());
      }
      offset = *decoded;
    }

    std::vector<const T*> ordered;
    ordered.reserve(rows_.size());
    for (const auto& row : rows_) {
      ordered.push_back(&row);
    }

    if (request.sort_model.has_value()) {
      const auto& sort = *request.sort_model;
      auto iter = comparators_.find(sort.GetFieldName());
      if (iter == comparators_.end()) {
        return utils::MakeUnexpected(
            utils::MakeError(utils::ErrorCode::kSourceUnknownSortField, "Unknown sort field: " + sort.GetFieldName()));
      }
      const Comparator& less = iter->second;
      if (sort.IsDescending()) {
        std::stable_sort(ordered.begin(), ordered.end(), [&less](const T* lhs, const T* rhs) { return less(*rhs, *lhs); });
      } else {
        std::stable_sort(ordered.begin(), ordered.end(), [&less](const T* lhs, const T* rhs) { return less(*lhs, *rhs); });
      }
    }

    table::FetchResult<std::string, T> page;
    const size_t start = std::min(offset, ordered.size());
    const size_t end = std::min(start + static_cast<size_t>(request.page_size), ordered.size());
    page.items.reserve(end - start);
    for (size_t pos = start; pos < end; ++pos) {
      page.items.push_back(*ordered[pos]);
    }
    if (end < ordered.size()) {
      page.next_page_token = EncodeToken(end);
    }

    utils::StructuredLog()
        .Event("source_page_served")
        .Field("offset", static_cast<uint64_t>(start))
        .Field("rows", static_cast<uint64_t>(page.items.size()))
        .Field("has_next_page", page.next_page_token.has_value())
        .Debug();
    return page;
  }

  /**
   * @brief Make the next @p count fetches fail with kSourceUnavailable
   */
  void FailNextFetches(int count) { failures_remaining_ = std::max(count, 0); }

  std::vector<T>& MutableRows() { return rows_; }
  const std::vector<T>& Rows() const { return rows_; }
  size_t GetFetchCount() const { return fetch_count_; }

  static std::string EncodeToken(size_t offset) { return std::string(kTokenPrefix) + std::to_string(offset); }

  static utils::Expected<size_t, utils::Error> DecodeToken(const std::string& token) {
    const std::string prefix(kTokenPrefix);
    if (token.size() <= prefix.size() || token.compare(0, prefix.size(), prefix) != 0) {
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kSourceInvalidToken, "Malformed page token: " + token));
    }
    size_t offset = 0;
    const char* first = token.data() + prefix.size();
    const char* last = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(first, last, offset);
    if (ec != std::errc() || ptr != last) {
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kSourceInvalidToken, "Malformed page token: " + token));
    }
    return offset;
  }

 private:
  static constexpr const char* kTokenPrefix = "off:";

  utils::TaskQueue& task_queue_;
  std::vector<T> rows_;
  std::map<std::string, Comparator> comparators_;
  int failures_remaining_ = 0;
  size_t fetch_count_ = 0;
};

}  // namespace pagedtable::source
