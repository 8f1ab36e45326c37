/**
 * @file table_column.h
 * @brief Column descriptor
 */

#pragma once

#include <string>
#include <utility>

namespace pagedtable::table {

/**
 * @brief Column shown by a table
 *
 * @c id is the field name handed to the row source in a SortModel, so it
 * must be unique within a table.
 */
struct TableColumn {
  std::string id;
  std::string title;
  bool sortable = false;
  bool numeric = false;

  TableColumn() = default;
  TableColumn(std::string column_id, std::string column_title, bool is_sortable = false, bool is_numeric = false)
      : id(std::move(column_id)), title(std::move(column_title)), sortable(is_sortable), numeric(is_numeric) {}
};

}  // namespace pagedtable::table
