/**
 * @file table_state.h
 * @brief Run state of a table controller
 */

#pragma once

namespace pagedtable::table {

/**
 * @brief Fetch lifecycle state
 *
 * idle -> fetching -> idle | error; error -> fetching on the next attempt.
 */
enum class TableState {
  kIdle,
  kFetching,
  kError,
};

/**
 * @brief "idle", "fetching" or "error"
 */
const char* TableStateToString(TableState state);

}  // namespace pagedtable::table
