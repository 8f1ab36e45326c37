/**
 * @file selection_set.h
 * @brief Positional set of row indexes (selection, expansion)
 */

#pragma once

#include <cstddef>
#include <set>
#include <vector>

namespace pagedtable::table {

/**
 * @brief Set of row positions within the current dataset window
 *
 * Membership is positional, not identity-based: index 2 stays flagged when
 * the window is replaced by another page, and then refers to whatever row
 * now occupies position 2. Every mutator reports the indexes whose
 * membership actually changed so the caller can notify exactly those rows.
 */
class SelectionSet {
 public:
  /**
   * @return true if @p index was not a member before
   */
  bool Select(int index);

  /**
   * @return true if @p index was a member before
   */
  bool Unselect(int index);

  /**
   * @brief Flip membership of @p index
   * @return New membership of @p index
   */
  bool Toggle(int index);

  /**
   * @brief Add every position in [0, count)
   * @return Positions that were added, ascending
   */
  std::vector<int> SelectRange(int count);

  /**
   * @brief Remove every member
   * @return Former members, ascending
   */
  std::vector<int> Clear();

  [[nodiscard]] bool Contains(int index) const { return rows_.find(index) != rows_.end(); }
  [[nodiscard]] size_t Size() const { return rows_.size(); }
  [[nodiscard]] bool Empty() const { return rows_.empty(); }

  /**
   * @brief Snapshot of the members, ascending
   */
  [[nodiscard]] std::vector<int> ToVector() const { return {rows_.begin(), rows_.end()}; }

 private:
  std::set<int> rows_;
};

}  // namespace pagedtable::table
