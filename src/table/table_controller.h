/**
 * @file table_controller.h
 * @brief State of a paginated, sortable, selectable table
 */

#pragma once

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "config/config.h"
#include "table/dataset_window.h"
#include "table/pagination_key_store.h"
#include "table/row_change_notifier.h"
#include "table/row_source.h"
#include "table/selection_set.h"
#include "table/sort_model.h"
#include "table/table_column.h"
#include "table/table_state.h"
#include "utils/error.h"
#include "utils/expected.h"
#include "utils/structured_log.h"
#include "utils/task_queue.h"

namespace pagedtable::table {

/**
 * @brief Controller behind a paged data table
 *
 * Holds exactly one page of rows (the dataset window) fetched from an
 * IRowSource through opaque cursor tokens, plus the sort, page size,
 * positional selection and expansion of the table. A rendering layer
 * subscribes to coarse broadcasts (structural re-render) and to per-row
 * changes (re-render of one row).
 *
 * Fetch sequencing: every fetch takes a new request generation. Only the
 * completion of the latest generation is applied, once; earlier or repeated
 * completions are dropped. Completions that arrive after Dispose() are
 * ignored.
 *
 * Usage errors are returned as Expected errors and leave the state
 * untouched. Fetch errors are not returned to anyone: they move the table to
 * TableState::kError and are readable through GetCurrentError(). Exceptions
 * thrown by listeners propagate to the caller of the operation that fired
 * them, also when the source completes inside Fetch().
 *
 * Not thread-safe. Every call and every fetch completion must happen on the
 * thread that drains the TaskQueue passed to the constructor.
 *
 * @tparam K Opaque cursor token type
 * @tparam T Row item type
 */
template <typename K, typename T>
class TableController {
 public:
  using Source = IRowSource<K, T>;
  using RowChangeListener = typename RowChangeNotifier<T>::RowChangeListener;
  using Listener = typename RowChangeNotifier<T>::Listener;

  explicit TableController(utils::TaskQueue& task_queue) : task_queue_(task_queue) {}

  ~TableController() { Dispose(); }

  TableController(const TableController&) = delete;
  TableController& operator=(const TableController&) = delete;
  TableController(TableController&&) = delete;
  TableController& operator=(TableController&&) = delete;

  /**
   * @brief Attach columns, source and configuration; schedule the first fetch
   *
   * The first page is fetched from the task queue, not inside Init().
   * Calling Init() again on an initialized controller does nothing.
   *
   * @return Expected<void, Error> - kInvalidArgument for bad columns or a
   *         null source, kTableInvalidPageSize for a bad initial page size
   */
  utils::Expected<void, utils::Error> Init(std::vector<TableColumn> columns, std::unique_ptr<Source> source,
                                           config::TableConfig config = {}) {
    if (disposed_) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kTableDisposed, "Controller is disposed"));
    }
    if (initialized_) {
      return {};
    }

    if (auto valid = ValidateColumns(columns); !valid) {
      return utils::MakeUnexpected(valid.error());
    }
    if (!source) {
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kInvalidArgument, "Row source must not be null"));
    }
    if (config.initial_page_size <= 0) {
      return utils::MakeUnexpected(utils::MakeError(
          utils::ErrorCode::kTableInvalidPageSize,
          "Initial page size must be positive, got " + std::to_string(config.initial_page_size)));
    }
    if (!config.page_sizes.empty() && std::find(config.page_sizes.begin(), config.page_sizes.end(),
                                                config.initial_page_size) == config.page_sizes.end()) {
      return utils::MakeUnexpected(utils::MakeError(
          utils::ErrorCode::kTableInvalidPageSize,
          "Initial page size " + std::to_string(config.initial_page_size) + " is not one of the page sizes"));
    }

    if (auto scheduled = ScheduleFirstPage(); !scheduled) {
      return scheduled;
    }

    columns_ = std::move(columns);
    source_ = std::move(source);
    page_size_ = config.initial_page_size;
    page_sizes_ = config.page_sizes;
    config_ = std::move(config);
    initialized_ = true;

    utils::StructuredLog()
        .Event("table_initialized")
        .Field("columns", static_cast<uint64_t>(columns_.size()))
        .Field("page_size", static_cast<int64_t>(page_size_))
        .Field("copy_items", config_.copy_items)
        .Field("keep_selection_across_pages", config_.keep_selection_across_pages)
        .Info();
    return {};
  }

  /**
   * @brief Replace the columns and schedule a fetch of the first page
   *
   * A sort on a field that is no longer a column is dropped.
   */
  utils::Expected<void, utils::Error> Reset(std::vector<TableColumn> columns) {
    if (auto usable = CheckUsable(); !usable) {
      return usable;
    }
    if (auto valid = ValidateColumns(columns); !valid) {
      return utils::MakeUnexpected(valid.error());
    }
    if (auto scheduled = ScheduleFirstPage(); !scheduled) {
      return scheduled;
    }

    columns_ = std::move(columns);
    if (sort_model_.has_value() && FindColumn(sort_model_->GetFieldName()) == nullptr) {
      sort_model_.reset();
    }
    notifier_.NotifyListeners();
    return {};
  }

  /**
   * @brief Release listeners and ignore every in-flight fetch
   *
   * Idempotent. The destructor calls it.
   */
  void Dispose() {
    if (disposed_) {
      return;
    }
    disposed_ = true;
    alive_.reset();
    notifier_.Clear();

    if (initialized_) {
      utils::StructuredLog()
          .Event("table_disposed")
          .Field("page", static_cast<int64_t>(current_page_index_))
          .Field("generation", fetch_generation_)
          .Debug();
    }
  }

  // Pagination

  [[nodiscard]] bool HasNextPage() const { return has_next_page_; }
  [[nodiscard]] bool HasPreviousPage() const { return current_page_index_ != 0; }

  /**
   * @brief Rows in the current window (not in the whole collection)
   */
  [[nodiscard]] int TotalItems() const { return window_.Size(); }

  [[nodiscard]] int GetCurrentPageIndex() const { return current_page_index_; }
  [[nodiscard]] int GetPageSize() const { return page_size_; }
  [[nodiscard]] const std::vector<int>& GetPageSizes() const { return page_sizes_; }

  /**
   * @brief Fetch the page after the current one
   * @return kTableNoNextPage when the last fetch returned no next token
   */
  utils::Expected<void, utils::Error> NextPage() {
    if (auto usable = CheckUsable(); !usable) {
      return usable;
    }
    if (!has_next_page_) {
      return utils::MakeUnexpected(utils::MakeError(
          utils::ErrorCode::kTableNoNextPage, "Page " + std::to_string(current_page_index_) + " is the last page"));
    }
    Fetch(current_page_index_ + 1);
    return {};
  }

  /**
   * @brief Fetch the page before the current one
   * @return kTableNoPreviousPage on the first page
   */
  utils::Expected<void, utils::Error> PreviousPage() {
    if (auto usable = CheckUsable(); !usable) {
      return usable;
    }
    if (current_page_index_ == 0) {
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kTableNoPreviousPage, "Already on the first page"));
    }
    Fetch(current_page_index_ - 1);
    return {};
  }

  /**
   * @brief Refetch the current page, or restart from the first page
   *
   * @param from_start Clear the token cache and the window, then fetch page 0
   */
  utils::Expected<void, utils::Error> Refresh(bool from_start = false) {
    if (auto usable = CheckUsable(); !usable) {
      return usable;
    }
    if (from_start) {
      key_store_.Clear();
      window_.Clear();
      Fetch(0);
    } else {
      Fetch(current_page_index_);
    }
    return {};
  }

  /**
   * @brief Change the page size and restart from the first page
   */
  utils::Expected<void, utils::Error> SetPageSize(int page_size) {
    if (auto usable = CheckUsable(); !usable) {
      return usable;
    }
    if (page_size <= 0) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kTableInvalidPageSize,
                                                    "Page size must be positive, got " + std::to_string(page_size)));
    }
    page_size_ = page_size;
    RestartAndNotify();
    return {};
  }

  // Sorting

  [[nodiscard]] const std::optional<SortModel>& GetSortModel() const { return sort_model_; }

  /**
   * @brief Replace the sort (empty = unsorted) and restart from the first page
   */
  utils::Expected<void, utils::Error> SetSortModel(std::optional<SortModel> sort_model) {
    if (auto usable = CheckUsable(); !usable) {
      return usable;
    }
    sort_model_ = std::move(sort_model);
    RestartAndNotify();
    return {};
  }

  /**
   * @brief Header click: cycle the sort of @p column_id
   *
   * See NextSortModel(). Nothing is refetched when the sort does not change.
   *
   * @return kTableUnknownColumn / kTableColumnNotSortable for a bad column
   */
  utils::Expected<void, utils::Error> SwipeSortModel(const std::optional<std::string>& column_id = std::nullopt) {
    if (auto usable = CheckUsable(); !usable) {
      return usable;
    }
    if (column_id.has_value()) {
      const TableColumn* column = FindColumn(*column_id);
      if (column == nullptr) {
        return utils::MakeUnexpected(
            utils::MakeError(utils::ErrorCode::kTableUnknownColumn, "Unknown column: " + *column_id));
      }
      if (!column->sortable) {
        return utils::MakeUnexpected(
            utils::MakeError(utils::ErrorCode::kTableColumnNotSortable, "Column is not sortable: " + *column_id));
      }
    }

    auto next = NextSortModel(sort_model_, column_id);
    if (next == sort_model_) {
      return {};
    }
    return SetSortModel(std::move(next));
  }

  // Dataset window

  [[nodiscard]] const std::vector<T>& GetItems() const { return window_.Items(); }

  /**
   * @brief Row at @p index, or nullptr
   */
  [[nodiscard]] const T* FindItem(int index) const { return window_.Find(index); }

  /**
   * @brief Insert @p value before row @p index (index == TotalItems() appends)
   */
  utils::Expected<void, utils::Error> InsertAt(int index, T value) {
    if (auto usable = CheckUsable(); !usable) {
      return usable;
    }
    if (auto inserted = window_.InsertAt(index, std::move(value)); !inserted) {
      return inserted;
    }
    NotifyRows({index});
    return {};
  }

  /**
   * @brief Append @p value
   *
   * The appended position is notified twice: once by the insertion and once
   * more for the append itself. Row listeners must tolerate both calls.
   */
  utils::Expected<void, utils::Error> Insert(T value) {
    const int index = window_.Size();
    if (auto inserted = InsertAt(index, std::move(value)); !inserted) {
      return inserted;
    }
    NotifyRows({index});
    return {};
  }

  utils::Expected<void, utils::Error> Replace(int index, T value) {
    if (auto usable = CheckUsable(); !usable) {
      return usable;
    }
    if (auto replaced = window_.Replace(index, std::move(value)); !replaced) {
      return replaced;
    }
    NotifyRows({index});
    return {};
  }

  /**
   * @brief Remove row @p index; listeners of @p index see the row that moved in
   */
  utils::Expected<void, utils::Error> RemoveRowAt(int index) {
    if (auto usable = CheckUsable(); !usable) {
      return usable;
    }
    if (auto removed = window_.RemoveAt(index); !removed) {
      return removed;
    }
    NotifyRows({index});
    return {};
  }

  /**
   * @brief Remove the first row equal to @p item
   * @return kOutOfRange when no row matches; the window is untouched
   */
  utils::Expected<void, utils::Error> RemoveRow(const T& item) {
    if (auto usable = CheckUsable(); !usable) {
      return usable;
    }
    const int index = window_.IndexOf(item);
    if (index == DatasetWindow<T>::kNotFound) {
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kOutOfRange, "Row not found in the current page"));
    }
    return RemoveRowAt(index);
  }

  // Selection

  [[nodiscard]] std::vector<int> GetSelectedRows() const { return selection_.ToVector(); }
  [[nodiscard]] bool IsRowSelected(int index) const { return selection_.Contains(index); }

  utils::Expected<void, utils::Error> SelectRow(int index) {
    if (auto valid = CheckRowIndex(index); !valid) {
      return valid;
    }
    NotifyRows(selection_.Select(index) ? std::vector<int>{index} : std::vector<int>{});
    return {};
  }

  /**
   * @brief Drop @p index from the selection
   *
   * Any index is accepted so positions left over from a longer page can be
   * cleared.
   */
  utils::Expected<void, utils::Error> UnselectRow(int index) {
    if (auto usable = CheckUsable(); !usable) {
      return usable;
    }
    NotifyRows(selection_.Unselect(index) ? std::vector<int>{index} : std::vector<int>{});
    return {};
  }

  utils::Expected<void, utils::Error> ToggleRow(int index) {
    if (auto valid = CheckRowIndex(index); !valid) {
      return valid;
    }
    selection_.Toggle(index);
    NotifyRows({index});
    return {};
  }

  /**
   * @brief Select positions 0..TotalItems()-1
   */
  utils::Expected<void, utils::Error> SelectAllRows() {
    if (auto usable = CheckUsable(); !usable) {
      return usable;
    }
    NotifyRows(selection_.SelectRange(window_.Size()));
    return {};
  }

  utils::Expected<void, utils::Error> UnselectEveryRow() {
    if (auto usable = CheckUsable(); !usable) {
      return usable;
    }
    NotifyRows(selection_.Clear());
    return {};
  }

  // Expansion (detail rows), reported on the row-change channel

  [[nodiscard]] std::vector<int> GetExpandedRows() const { return expansion_.ToVector(); }
  [[nodiscard]] bool IsRowExpanded(int index) const { return expansion_.Contains(index); }

  utils::Expected<void, utils::Error> ExpandRow(int index) {
    if (auto valid = CheckRowIndex(index); !valid) {
      return valid;
    }
    NotifyRows(expansion_.Select(index) ? std::vector<int>{index} : std::vector<int>{});
    return {};
  }

  utils::Expected<void, utils::Error> CollapseRow(int index) {
    if (auto usable = CheckUsable(); !usable) {
      return usable;
    }
    NotifyRows(expansion_.Unselect(index) ? std::vector<int>{index} : std::vector<int>{});
    return {};
  }

  utils::Expected<void, utils::Error> ToggleRowExpansion(int index) {
    if (auto valid = CheckRowIndex(index); !valid) {
      return valid;
    }
    expansion_.Toggle(index);
    NotifyRows({index});
    return {};
  }

  // Listeners

  ListenerId AddRowChangeListener(int index, RowChangeListener listener) {
    return notifier_.AddRowChangeListener(index, std::move(listener));
  }

  void RemoveRowChangeListener(int index, ListenerId listener_id) {
    notifier_.RemoveRowChangeListener(index, listener_id);
  }

  ListenerId AddListener(Listener listener) { return notifier_.AddListener(std::move(listener)); }

  void RemoveListener(ListenerId listener_id) { notifier_.RemoveListener(listener_id); }

  // State

  [[nodiscard]] TableState GetState() const { return state_; }
  [[nodiscard]] bool IsFetching() const { return state_ == TableState::kFetching; }
  [[nodiscard]] bool IsInitialized() const { return initialized_; }
  [[nodiscard]] bool IsDisposed() const { return disposed_; }
  [[nodiscard]] const std::optional<utils::Error>& GetCurrentError() const { return current_error_; }
  [[nodiscard]] const std::vector<TableColumn>& GetColumns() const { return columns_; }
  [[nodiscard]] uint64_t GetFetchGeneration() const { return fetch_generation_; }

  /**
   * @brief One-line JSON snapshot of the pagination state
   */
  [[nodiscard]] std::string DebugString() const {
    nlohmann::json snapshot;
    snapshot["current_page_index"] = current_page_index_;
    snapshot["pagination_keys"] = key_store_.Pages();
    snapshot["error"] = current_error_.has_value() ? nlohmann::json(current_error_->to_string()) : nlohmann::json();
    snapshot["page_size"] = page_size_;
    snapshot["total_items"] = window_.Size();
    snapshot["has_next_page"] = has_next_page_;
    snapshot["sort"] = sort_model_.has_value() ? nlohmann::json(sort_model_->ToString()) : nlohmann::json();
    snapshot["selected_rows"] = selection_.ToVector();
    snapshot["state"] = TableStateToString(state_);
    snapshot["generation"] = fetch_generation_;
    return snapshot.dump();
  }

  /**
   * @brief Write DebugString() to the log at debug level
   */
  void LogDebugState() const {
    utils::StructuredLog().Event("table_debug_state").Field("state", DebugString()).Debug();
  }

 private:
  using FetchOutcome = typename Source::Result;

  utils::Expected<void, utils::Error> CheckUsable() const {
    if (disposed_) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kTableDisposed, "Controller is disposed"));
    }
    if (!initialized_) {
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kTableNotInitialized, "Controller is not initialized"));
    }
    return {};
  }

  utils::Expected<void, utils::Error> CheckRowIndex(int index) const {
    if (auto usable = CheckUsable(); !usable) {
      return usable;
    }
    if (index < 0 || index >= window_.Size()) {
      return utils::MakeUnexpected(utils::MakeError(
          utils::ErrorCode::kOutOfRange,
          "Row " + std::to_string(index) + " is outside the current page of " + std::to_string(window_.Size())));
    }
    return {};
  }

  static utils::Expected<void, utils::Error> ValidateColumns(const std::vector<TableColumn>& columns) {
    if (columns.empty()) {
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kInvalidArgument, "A table needs at least one column"));
    }
    std::set<std::string> ids;
    for (const auto& column : columns) {
      if (!ids.insert(column.id).second) {
        return utils::MakeUnexpected(
            utils::MakeError(utils::ErrorCode::kInvalidArgument, "Duplicate column id: " + column.id));
      }
    }
    return {};
  }

  const TableColumn* FindColumn(const std::string& column_id) const {
    for (const auto& column : columns_) {
      if (column.id == column_id) {
        return &column;
      }
    }
    return nullptr;
  }

  utils::Expected<void, utils::Error> ScheduleFirstPage() {
    std::weak_ptr<bool> alive = alive_;
    bool posted = task_queue_.Post([this, alive]() {
      if (alive.expired()) {
        return;
      }
      Fetch(0);
    });
    if (!posted) {
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kInternalError, "Task queue is shut down, cannot schedule fetch"));
    }
    return {};
  }

  void RestartAndNotify() {
    key_store_.Clear();
    window_.Clear();
    Fetch(0);
    notifier_.NotifyListeners();
  }

  void NotifyRows(const std::vector<int>& indexes) {
    notifier_.NotifyRowsChanged(indexes, [this](int index) { return window_.Find(index); });
  }

  void Fetch(int page_index) {
    const uint64_t generation = ++fetch_generation_;
    state_ = TableState::kFetching;

    utils::StructuredLog()
        .Event("table_fetch_started")
        .Field("page", static_cast<int64_t>(page_index))
        .Field("generation", generation)
        .Field("page_size", static_cast<int64_t>(page_size_))
        .Debug();
    notifier_.NotifyListeners();

    // A listener may have disposed the controller
    if (disposed_) {
      return;
    }

    FetchRequest<K> request;
    request.page_size = page_size_;
    request.sort_model = sort_model_;
    if (page_index > 0) {
      request.page_token = key_store_.Get(page_index);
      if (!request.page_token.has_value()) {
        utils::StructuredLog()
            .Event("table_page_token_missing")
            .Field("page", static_cast<int64_t>(page_index))
            .Message("no cursor recorded for page, fetching without token")
            .Warn();
      }
    }

    std::weak_ptr<bool> alive = alive_;
    auto completed = std::make_shared<bool>(false);
    try {
      source_->Fetch(request, [this, alive, completed, page_index, generation](FetchOutcome outcome) {
        *completed = true;
        if (alive.expired()) {
          return;
        }
        OnFetchCompleted(page_index, generation, std::move(outcome));
      });
    } catch (const std::exception& e) {
      // Thrown from inside a synchronous completion: a listener failed, not the source
      if (*completed) {
        throw;
      }
      OnFetchCompleted(page_index, generation,
                       utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kTableFetchFailed, e.what())));
    }
  }

  void OnFetchCompleted(int page_index, uint64_t generation, FetchOutcome outcome) {
    if (generation != fetch_generation_ || generation == applied_generation_) {
      utils::StructuredLog()
          .Event("table_fetch_superseded")
          .Field("page", static_cast<int64_t>(page_index))
          .Field("generation", generation)
          .Field("latest_generation", fetch_generation_)
          .Debug();
      return;
    }
    applied_generation_ = generation;

    if (!outcome) {
      state_ = TableState::kError;
      current_error_ = outcome.error();
      window_.Clear();
      utils::LogFetchFailure(page_index, generation, outcome.error().to_string());
      notifier_.NotifyListeners();
      return;
    }

    auto& page = *outcome;
    has_next_page_ = page.next_page_token.has_value();
    current_page_index_ = page_index;
    if (page.next_page_token.has_value()) {
      key_store_.Set(page_index + 1, *page.next_page_token);
    }

    if (config_.copy_items) {
      window_.Merge(page.items);
    } else {
      window_.Merge(std::move(page.items));
    }

    std::vector<int> cleared;
    if (!config_.keep_selection_across_pages) {
      std::set<int> changed;
      for (int index : selection_.Clear()) {
        changed.insert(index);
      }
      for (int index : expansion_.Clear()) {
        changed.insert(index);
      }
      cleared.assign(changed.begin(), changed.end());
    }

    current_error_.reset();
    state_ = TableState::kIdle;

    utils::StructuredLog()
        .Event("table_fetch_completed")
        .Field("page", static_cast<int64_t>(page_index))
        .Field("generation", generation)
        .Field("rows", static_cast<int64_t>(window_.Size()))
        .Field("has_next_page", has_next_page_)
        .Debug();

    NotifyRows(cleared);
  }

  utils::TaskQueue& task_queue_;
  std::unique_ptr<Source> source_;
  std::vector<TableColumn> columns_;
  config::TableConfig config_;
  std::vector<int> page_sizes_;

  PaginationKeyStore<K> key_store_;
  DatasetWindow<T> window_;
  SelectionSet selection_;
  SelectionSet expansion_;
  RowChangeNotifier<T> notifier_;

  std::optional<SortModel> sort_model_;
  std::optional<utils::Error> current_error_;
  TableState state_ = TableState::kIdle;
  int page_size_ = 0;
  int current_page_index_ = 0;
  bool has_next_page_ = false;

  uint64_t fetch_generation_ = 0;
  uint64_t applied_generation_ = 0;

  bool initialized_ = false;
  bool disposed_ = false;
  std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}  // namespace pagedtable::table
