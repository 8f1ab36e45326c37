/**
 * @file table_state.cpp
 * @brief TableState names
 */

#include "table/table_state.h"

namespace pagedtable::table {

const char* TableStateToString(TableState state) {
  switch (state) {
    case TableState::kIdle:
      return "idle";
    case TableState::kFetching:
      return "fetching";
    case TableState::kError:
      return "error";
  }
  return "unknown";
}

}  // namespace pagedtable::table
