/**
 * @file dataset_window.h
 * @brief The materialized rows of the current page
 */

#pragma once

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace pagedtable::table {

/**
 * @brief Ordered rows of exactly one page
 *
 * The window size is the table's totalItems (rows on this page, not in the
 * remote collection). It is replaced by fetch results through Merge() and
 * edited in place through the index-checked mutators.
 *
 * @tparam T Row item type
 */
template <typename T>
class DatasetWindow {
 public:
  static constexpr int kNotFound = -1;

  [[nodiscard]] int Size() const { return static_cast<int>(items_.size()); }
  [[nodiscard]] bool Empty() const { return items_.empty(); }
  [[nodiscard]] const std::vector<T>& Items() const { return items_; }

  /**
   * @brief Row at @p index, or nullptr when out of range
   */
  [[nodiscard]] const T* Find(int index) const {
    if (index < 0 || index >= Size()) {
      return nullptr;
    }
    return &items_[static_cast<size_t>(index)];
  }

  /**
   * @brief Insert before @p index, shifting later rows right
   *
   * @p index may equal Size() (append) but not exceed it.
   */
  utils::Expected<void, utils::Error> InsertAt(int index, T value) {
    if (index < 0 || index > Size()) {
      return utils::MakeUnexpected(OutOfRange(index, "insert position must be within [0, " +
                                                         std::to_string(Size()) + "]"));
    }
    items_.insert(items_.begin() + index, std::move(value));
    return {};
  }

  void Append(T value) { items_.push_back(std::move(value)); }

  /**
   * @brief Overwrite the row at @p index
   */
  utils::Expected<void, utils::Error> Replace(int index, T value) {
    if (index < 0 || index >= Size()) {
      return utils::MakeUnexpected(OutOfRange(index, RowRangeText()));
    }
    items_[static_cast<size_t>(index)] = std::move(value);
    return {};
  }

  /**
   * @brief Remove the row at @p index, shifting later rows left
   */
  utils::Expected<void, utils::Error> RemoveAt(int index) {
    if (index < 0 || index >= Size()) {
      return utils::MakeUnexpected(OutOfRange(index, RowRangeText()));
    }
    items_.erase(items_.begin() + index);
    return {};
  }

  /**
   * @brief Position of the first row equal to @p item, or kNotFound
   */
  [[nodiscard]] int IndexOf(const T& item) const {
    auto iter = std::find(items_.begin(), items_.end(), item);
    if (iter == items_.end()) {
      return kNotFound;
    }
    return static_cast<int>(std::distance(items_.begin(), iter));
  }

  /**
   * @brief Make the window equal to @p items
   *
   * An empty window takes the rows as they are; otherwise the overlapping
   * prefix is overwritten in place and the tail is trimmed or extended.
   */
  void Merge(std::vector<T> items) {
    if (items_.empty()) {
      items_ = std::move(items);
      return;
    }

    const size_t overlap = std::min(items_.size(), items.size());
    std::move(items.begin(), items.begin() + static_cast<std::ptrdiff_t>(overlap), items_.begin());

    if (items.size() < items_.size()) {
      items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(items.size()), items_.end());
    } else {
      items_.insert(items_.end(), std::make_move_iterator(items.begin() + static_cast<std::ptrdiff_t>(overlap)),
                    std::make_move_iterator(items.end()));
    }
  }

  void Clear() { items_.clear(); }

 private:
  std::string RowRangeText() const {
    if (items_.empty()) {
      return "the current page has no rows";
    }
    return "row index must be within [0, " + std::to_string(Size() - 1) + "]";
  }

  static utils::Error OutOfRange(int index, const std::string& detail) {
    return utils::MakeError(utils::ErrorCode::kOutOfRange, "Index " + std::to_string(index) + " out of range: " + detail);
  }

  std::vector<T> items_;
};

}  // namespace pagedtable::table
