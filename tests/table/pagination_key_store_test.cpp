/**
 * @file pagination_key_store_test.cpp
 * @brief Unit tests for the page token cache
 */

#include "table/pagination_key_store.h"

#include <gtest/gtest.h>

#include <string>

using namespace pagedtable::table;

TEST(PaginationKeyStoreTest, EmptyStoreHasNoTokens) {
  PaginationKeyStore<std::string> store;
  EXPECT_TRUE(store.Empty());
  EXPECT_FALSE(store.Get(0).has_value());
  EXPECT_FALSE(store.Get(1).has_value());
}

TEST(PaginationKeyStoreTest, SetAndGet) {
  PaginationKeyStore<std::string> store;
  store.Set(1, "t1");
  store.Set(2, "t2");

  EXPECT_EQ(store.Get(1), "t1");
  EXPECT_EQ(store.Get(2), "t2");
  EXPECT_TRUE(store.Contains(2));
  EXPECT_FALSE(store.Contains(3));
  EXPECT_EQ(store.Size(), 2U);
}

TEST(PaginationKeyStoreTest, FirstPageNeverStored) {
  PaginationKeyStore<std::string> store;
  store.Set(0, "zero");
  store.Set(-1, "negative");
  EXPECT_TRUE(store.Empty());
}

TEST(PaginationKeyStoreTest, OverwriteKeepsLatest) {
  PaginationKeyStore<int> store;
  store.Set(1, 10);
  store.Set(1, 20);
  EXPECT_EQ(store.Get(1), 20);
  EXPECT_EQ(store.Size(), 1U);
}

TEST(PaginationKeyStoreTest, PagesAscendingAndClear) {
  PaginationKeyStore<std::string> store;
  store.Set(3, "c");
  store.Set(1, "a");
  store.Set(2, "b");
  EXPECT_EQ(store.Pages(), (std::vector<int>{1, 2, 3}));

  store.Clear();
  EXPECT_TRUE(store.Empty());
  EXPECT_TRUE(store.Pages().empty());
}
