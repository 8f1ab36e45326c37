/**
 * @file selection_set.cpp
 * @brief SelectionSet implementation
 */

#include "table/selection_set.h"

namespace pagedtable::table {

bool SelectionSet::Select(int index) {
  return rows_.insert(index).second;
}

bool SelectionSet::Unselect(int index) {
  return rows_.erase(index) > 0;
}

bool SelectionSet::Toggle(int index) {
  if (Unselect(index)) {
    return false;
  }
  rows_.insert(index);
  return true;
}

std::vector<int> SelectionSet::SelectRange(int count) {
  std::vector<int> added;
  for (int index = 0; index < count; ++index) {
    if (rows_.insert(index).second) {
      added.push_back(index);
    }
  }
  return added;
}

std::vector<int> SelectionSet::Clear() {
  std::vector<int> removed(rows_.begin(), rows_.end());
  rows_.clear();
  return removed;
}

}  // namespace pagedtable::table
