/**
 * @file sort_model.cpp
 * @brief SortModel implementation
 */

#include "table/sort_model.h"

namespace pagedtable::table {

std::string SortModel::ToString() const {
  return field_name_ + (descending_ ? " DESC" : " ASC");
}

std::optional<SortModel> NextSortModel(const std::optional<SortModel>& current,
                                       const std::optional<std::string>& column_id) {
  if (column_id.has_value() && (!current.has_value() || current->GetFieldName() != *column_id)) {
    return SortModel::Ascending(*column_id);
  }

  if (!current.has_value()) {
    return std::nullopt;
  }

  if (current->IsDescending()) {
    return std::nullopt;
  }
  return SortModel::Descending(current->GetFieldName());
}

}  // namespace pagedtable::table
