/**
 * @file pagination_key_store.h
 * @brief Page index -> forward cursor token cache
 */

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace pagedtable::table {

/**
 * @brief Cursor tokens of the pages reachable from the first page
 *
 * A token for page N+1 is recorded when page N is fetched and the source
 * returns a next-page token. Page 0 is always fetched without a token and is
 * never stored. There is no eviction: the cache grows for the lifetime of a
 * forward browsing session until Clear() (a from-start refresh).
 *
 * Going back to page N requires the token recorded when page N was first
 * reached going forward; an unknown page yields no token.
 *
 * @tparam K Opaque token type produced by the row source
 */
template <typename K>
class PaginationKeyStore {
 public:
  /**
   * @brief Token that starts page @p page_index, if known
   */
  std::optional<K> Get(int page_index) const {
    auto iter = keys_.find(page_index);
    if (iter == keys_.end()) {
      return std::nullopt;
    }
    return iter->second;
  }

  /**
   * @brief Record the token that starts page @p page_index
   *
   * Ignored for page 0 and below.
   */
  void Set(int page_index, K token) {
    if (page_index <= 0) {
      return;
    }
    keys_.insert_or_assign(page_index, std::move(token));
  }

  bool Contains(int page_index) const { return keys_.find(page_index) != keys_.end(); }

  void Clear() { keys_.clear(); }

  /**
   * @brief Pages with a known token, ascending
   */
  std::vector<int> Pages() const {
    std::vector<int> pages;
    pages.reserve(keys_.size());
    for (const auto& [page_index, token] : keys_) {
      pages.push_back(page_index);
    }
    return pages;
  }

  size_t Size() const { return keys_.size(); }
  bool Empty() const { return keys_.empty(); }

 private:
  std::map<int, K> keys_;
};

}  // namespace pagedtable::table
