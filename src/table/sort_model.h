/**
 * @file sort_model.h
 * @brief Sort field + direction value and its toggle rule
 */

#pragma once

#include <optional>
#include <string>
#include <utility>

namespace pagedtable::table {

/**
 * @brief Active sort of a table: one field, ascending or descending
 *
 * Immutable; a change of sort replaces the whole value. "Unsorted" is
 * represented as an empty std::optional<SortModel>.
 */
class SortModel {
 public:
  SortModel(std::string field_name, bool descending) : field_name_(std::move(field_name)), descending_(descending) {}

  static SortModel Ascending(std::string field_name) { return {std::move(field_name), false}; }
  static SortModel Descending(std::string field_name) { return {std::move(field_name), true}; }

  [[nodiscard]] const std::string& GetFieldName() const { return field_name_; }
  [[nodiscard]] bool IsDescending() const { return descending_; }

  /**
   * @brief "<field> ASC" or "<field> DESC"
   */
  [[nodiscard]] std::string ToString() const;

  bool operator==(const SortModel& other) const {
    return field_name_ == other.field_name_ && descending_ == other.descending_;
  }
  bool operator!=(const SortModel& other) const { return !(*this == other); }

 private:
  std::string field_name_;
  bool descending_;
};

/**
 * @brief Compute the sort that follows a click on a column header
 *
 * - A column other than the current sort field becomes the ascending sort.
 * - Otherwise (same column, or no column given) the current sort cycles
 *   ascending -> descending -> unsorted.
 * - No column given while unsorted leaves the table unsorted.
 *
 * @param current Current sort (empty = unsorted)
 * @param column_id Clicked column, if any
 * @return Next sort (empty = unsorted)
 */
std::optional<SortModel> NextSortModel(const std::optional<SortModel>& current,
                                       const std::optional<std::string>& column_id);

}  // namespace pagedtable::table
