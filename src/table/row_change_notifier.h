/**
 * @file row_change_notifier.h
 * @brief Two-tier change notification: per-row listeners + coarse broadcast
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <utility>
#include <vector>

namespace pagedtable::table {

using ListenerId = uint64_t;

/**
 * @brief Listener registries of a table controller
 *
 * Two tiers:
 * - Row-change listeners are registered against one row index and are
 *   called with (index, item) when that row is mutated, selected or
 *   expanded. @c item is nullptr when the index lies outside the window
 *   (for example the old last row after a removal).
 * - Coarse listeners take no arguments and are called after every
 *   state-affecting operation to trigger a structural re-render.
 *
 * A batch of row-change dispatches is always followed by exactly one coarse
 * broadcast, never interleaved.
 *
 * Listeners may register or remove listeners while being called; changes
 * take effect from the next dispatch.
 *
 * @tparam T Row item type
 */
template <typename T>
class RowChangeNotifier {
 public:
  using RowChangeListener = std::function<void(int index, const T* item)>;
  using Listener = std::function<void()>;

  RowChangeNotifier() = default;

  // Listeners usually capture the owning controller
  RowChangeNotifier(const RowChangeNotifier&) = delete;
  RowChangeNotifier& operator=(const RowChangeNotifier&) = delete;
  RowChangeNotifier(RowChangeNotifier&&) = delete;
  RowChangeNotifier& operator=(RowChangeNotifier&&) = delete;

  ~RowChangeNotifier() = default;

  /**
   * @brief Register @p listener for row @p index
   * @return Handle for RemoveRowChangeListener()
   */
  ListenerId AddRowChangeListener(int index, RowChangeListener listener) {
    const ListenerId listener_id = next_id_++;
    row_listeners_[index].emplace_back(listener_id, std::move(listener));
    return listener_id;
  }

  /**
   * @brief Unregister a row-change listener; unknown handles are ignored
   */
  void RemoveRowChangeListener(int index, ListenerId listener_id) {
    auto iter = row_listeners_.find(index);
    if (iter == row_listeners_.end()) {
      return;
    }
    auto& group = iter->second;
    for (auto entry = group.begin(); entry != group.end(); ++entry) {
      if (entry->first == listener_id) {
        group.erase(entry);
        break;
      }
    }
    if (group.empty()) {
      row_listeners_.erase(iter);
    }
  }

  /**
   * @brief Register a coarse listener
   */
  ListenerId AddListener(Listener listener) {
    const ListenerId listener_id = next_id_++;
    listeners_.emplace_back(listener_id, std::move(listener));
    return listener_id;
  }

  /**
   * @brief Unregister a coarse listener; unknown handles are ignored
   */
  void RemoveListener(ListenerId listener_id) {
    for (auto entry = listeners_.begin(); entry != listeners_.end(); ++entry) {
      if (entry->first == listener_id) {
        listeners_.erase(entry);
        return;
      }
    }
  }

  /**
   * @brief Dispatch row changes for @p indexes, then one coarse broadcast
   *
   * @param indexes Rows to notify, in dispatch order
   * @param lookup Callable int -> const T* giving the current item (or nullptr)
   */
  template <typename ItemLookup>
  void NotifyRowsChanged(const std::vector<int>& indexes, ItemLookup&& lookup) {
    for (int index : indexes) {
      DispatchRowChange(index, lookup(index));
    }
    NotifyListeners();
  }

  /**
   * @brief Coarse broadcast
   */
  void NotifyListeners() {
    if (listeners_.empty()) {
      return;
    }
    auto snapshot = listeners_;
    for (auto& [listener_id, listener] : snapshot) {
      listener();
    }
  }

  [[nodiscard]] size_t RowChangeListenerCount(int index) const {
    auto iter = row_listeners_.find(index);
    return iter == row_listeners_.end() ? 0 : iter->second.size();
  }

  [[nodiscard]] size_t ListenerCount() const { return listeners_.size(); }

  /**
   * @brief Release both registries
   */
  void Clear() {
    row_listeners_.clear();
    listeners_.clear();
  }

 private:
  void DispatchRowChange(int index, const T* item) {
    auto iter = row_listeners_.find(index);
    if (iter == row_listeners_.end()) {
      return;
    }
    auto snapshot = iter->second;
    for (auto& [listener_id, listener] : snapshot) {
      listener(index, item);
    }
  }

  std::map<int, std::vector<std::pair<ListenerId, RowChangeListener>>> row_listeners_;
  std::vector<std::pair<ListenerId, Listener>> listeners_;
  ListenerId next_id_ = 1;
};

}  // namespace pagedtable::table
