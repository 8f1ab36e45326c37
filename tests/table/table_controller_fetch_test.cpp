/**
 * @file table_controller_fetch_test.cpp
 * @brief TableController lifecycle, pagination and fetch sequencing
 */

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <stdexcept>

#include "table/table_controller_fixture.h"

using namespace pagedtable;
using namespace pagedtable::table;
using namespace pagedtable::table::testing;
using utils::ErrorCode;

using TableControllerLifecycleTest = TableControllerTest;
using TableControllerPagingTest = TableControllerTest;
using TableControllerSequencingTest = TableControllerTest;

// ---------------------------------------------------------------------------
// Init / Dispose
// ---------------------------------------------------------------------------

TEST_F(TableControllerLifecycleTest, FirstFetchRunsFromQueue) {
  auto source = std::make_unique<FakeRowSource<std::string>>();
  source_ = source.get();
  ASSERT_TRUE(controller_->Init(Columns(), std::move(source)));

  EXPECT_TRUE(controller_->IsInitialized());
  EXPECT_TRUE(source_->Requests().empty());
  EXPECT_EQ(queue_.Size(), 1U);

  queue_.RunUntilIdle();
  ASSERT_EQ(source_->Requests().size(), 1U);
  const auto& request = source_->LastRequest();
  EXPECT_EQ(request.page_size, config::defaults::kInitialPageSize);
  EXPECT_FALSE(request.page_token.has_value());
  EXPECT_FALSE(request.sort_model.has_value());
  EXPECT_TRUE(controller_->IsFetching());
}

TEST_F(TableControllerLifecycleTest, SecondInitIsNoop) {
  InitTable();
  auto other = std::make_unique<FakeRowSource<std::string>>();
  EXPECT_TRUE(controller_->Init({{"x", "X"}}, std::move(other)));
  EXPECT_TRUE(queue_.Empty());
  EXPECT_EQ(controller_->GetColumns().size(), Columns().size());
}

TEST_F(TableControllerLifecycleTest, InitRejectsBadArguments) {
  auto empty_columns = controller_->Init({}, std::make_unique<FakeRowSource<std::string>>());
  ASSERT_FALSE(empty_columns);
  EXPECT_EQ(empty_columns.error().code(), ErrorCode::kInvalidArgument);

  auto duplicate = controller_->Init({{"a", "A"}, {"a", "Again"}}, std::make_unique<FakeRowSource<std::string>>());
  ASSERT_FALSE(duplicate);
  EXPECT_EQ(duplicate.error().code(), ErrorCode::kInvalidArgument);

  auto null_source = controller_->Init(Columns(), nullptr);
  ASSERT_FALSE(null_source);
  EXPECT_EQ(null_source.error().code(), ErrorCode::kInvalidArgument);

  EXPECT_FALSE(controller_->IsInitialized());
  EXPECT_TRUE(queue_.Empty());
}

TEST_F(TableControllerLifecycleTest, InitRejectsBadPageSize) {
  config::TableConfig zero;
  zero.initial_page_size = 0;
  auto result = controller_->Init(Columns(), std::make_unique<FakeRowSource<std::string>>(), zero);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kTableInvalidPageSize);

  config::TableConfig unlisted;
  unlisted.initial_page_size = 15;
  result = controller_->Init(Columns(), std::make_unique<FakeRowSource<std::string>>(), unlisted);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kTableInvalidPageSize);

  config::TableConfig any_size;
  any_size.initial_page_size = 15;
  any_size.page_sizes.clear();
  EXPECT_TRUE(controller_->Init(Columns(), std::make_unique<FakeRowSource<std::string>>(), any_size));
  EXPECT_EQ(controller_->GetPageSize(), 15);
}

TEST_F(TableControllerLifecycleTest, InitFailsWhenQueueIsShutDown) {
  queue_.Shutdown();
  auto result = controller_->Init(Columns(), std::make_unique<FakeRowSource<std::string>>());
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kInternalError);
  EXPECT_FALSE(controller_->IsInitialized());
}

TEST_F(TableControllerLifecycleTest, OperationsBeforeInitFail) {
  EXPECT_EQ(controller_->NextPage().error().code(), ErrorCode::kTableNotInitialized);
  EXPECT_EQ(controller_->Refresh().error().code(), ErrorCode::kTableNotInitialized);
  EXPECT_EQ(controller_->SetPageSize(10).error().code(), ErrorCode::kTableNotInitialized);
  EXPECT_EQ(controller_->SwipeSortModel(std::string("name")).error().code(), ErrorCode::kTableNotInitialized);
  EXPECT_EQ(controller_->Insert("x").error().code(), ErrorCode::kTableNotInitialized);
  EXPECT_EQ(controller_->SelectRow(0).error().code(), ErrorCode::kTableNotInitialized);
  EXPECT_EQ(controller_->Reset(Columns()).error().code(), ErrorCode::kTableNotInitialized);
}

TEST_F(TableControllerLifecycleTest, DisposeIgnoresInFlightCompletion) {
  InitTable();
  int broadcasts = 0;
  controller_->AddListener([&]() { ++broadcasts; });

  controller_->Dispose();
  source_->CompleteLatest({"A", "B"}, std::string("t1"));

  EXPECT_TRUE(controller_->IsDisposed());
  EXPECT_EQ(controller_->TotalItems(), 0);
  EXPECT_FALSE(controller_->HasNextPage());
  EXPECT_EQ(broadcasts, 0);
}

TEST_F(TableControllerLifecycleTest, OperationsAfterDisposeFail) {
  LoadFirstPage({"A"});
  controller_->Dispose();
  controller_->Dispose();

  EXPECT_EQ(controller_->Refresh().error().code(), ErrorCode::kTableDisposed);
  EXPECT_EQ(controller_->SelectRow(0).error().code(), ErrorCode::kTableDisposed);
  EXPECT_EQ(controller_->RemoveRowAt(0).error().code(), ErrorCode::kTableDisposed);
  auto init = controller_->Init(Columns(), std::make_unique<FakeRowSource<std::string>>());
  ASSERT_FALSE(init);
  EXPECT_EQ(init.error().code(), ErrorCode::kTableDisposed);
}

TEST_F(TableControllerLifecycleTest, DisposeBeforeScheduledFetchSkipsIt) {
  auto source = std::make_unique<FakeRowSource<std::string>>();
  source_ = source.get();
  ASSERT_TRUE(controller_->Init(Columns(), std::move(source)));
  controller_->Dispose();
  queue_.RunUntilIdle();
  EXPECT_TRUE(source_->Requests().empty());
}

TEST_F(TableControllerLifecycleTest, CompletionAfterDestructionIsIgnored) {
  InitTable();
  auto callback = source_->LatestCallback();
  controller_.reset();
  source_ = nullptr;

  FetchResult<std::string, std::string> page;
  page.items = {"A"};
  callback(std::move(page));
  SUCCEED();
}

TEST_F(TableControllerLifecycleTest, ResetReplacesColumnsAndDropsOrphanedSort) {
  LoadFirstPage({"A"});
  ASSERT_TRUE(controller_->SetSortModel(SortModel::Ascending("age")));
  source_->CompleteLatest({"A"});

  int broadcasts = 0;
  controller_->AddListener([&]() { ++broadcasts; });
  ASSERT_TRUE(controller_->Reset({{"name", "Name", true}}));
  EXPECT_EQ(broadcasts, 1);
  EXPECT_EQ(controller_->GetColumns().size(), 1U);
  EXPECT_FALSE(controller_->GetSortModel().has_value());

  queue_.RunUntilIdle();
  ASSERT_EQ(source_->PendingCount(), 1U);
  EXPECT_FALSE(source_->LastRequest().page_token.has_value());
}

TEST_F(TableControllerLifecycleTest, ResetRejectsBadColumns) {
  LoadFirstPage({"A"});
  auto result = controller_->Reset({});
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kInvalidArgument);
  EXPECT_EQ(controller_->GetColumns().size(), Columns().size());
  EXPECT_TRUE(queue_.Empty());
}

// ---------------------------------------------------------------------------
// Pagination
// ---------------------------------------------------------------------------

TEST_F(TableControllerPagingTest, FirstPageLands) {
  LoadFirstPage({"A", "B"}, std::string("t1"));

  EXPECT_EQ(controller_->GetItems(), (std::vector<std::string>{"A", "B"}));
  EXPECT_EQ(controller_->TotalItems(), 2);
  EXPECT_EQ(controller_->GetCurrentPageIndex(), 0);
  EXPECT_TRUE(controller_->HasNextPage());
  EXPECT_FALSE(controller_->HasPreviousPage());
  EXPECT_FALSE(controller_->GetCurrentError().has_value());
}

TEST_F(TableControllerPagingTest, NextPageSendsCachedToken) {
  LoadFirstPage({"A", "B"}, std::string("t1"));

  ASSERT_TRUE(controller_->NextPage());
  EXPECT_EQ(source_->LastRequest().page_token, std::optional<std::string>("t1"));
  EXPECT_TRUE(controller_->IsFetching());

  source_->CompleteLatest({"C", "D"});
  EXPECT_EQ(controller_->GetItems(), (std::vector<std::string>{"C", "D"}));
  EXPECT_EQ(controller_->GetCurrentPageIndex(), 1);
  EXPECT_FALSE(controller_->HasNextPage());
  EXPECT_TRUE(controller_->HasPreviousPage());

  auto last = controller_->NextPage();
  ASSERT_FALSE(last);
  EXPECT_EQ(last.error().code(), ErrorCode::kTableNoNextPage);
}

TEST_F(TableControllerPagingTest, PreviousPageReusesRecordedTokens) {
  LoadFirstPage({"A"}, std::string("t1"));
  ASSERT_TRUE(controller_->NextPage());
  source_->CompleteLatest({"B"}, std::string("t2"));
  ASSERT_TRUE(controller_->NextPage());
  EXPECT_EQ(source_->LastRequest().page_token, std::optional<std::string>("t2"));
  source_->CompleteLatest({"C"});

  ASSERT_TRUE(controller_->PreviousPage());
  EXPECT_EQ(source_->LastRequest().page_token, std::optional<std::string>("t1"));
  source_->CompleteLatest({"B"}, std::string("t2"));
  EXPECT_EQ(controller_->GetCurrentPageIndex(), 1);

  ASSERT_TRUE(controller_->PreviousPage());
  EXPECT_FALSE(source_->LastRequest().page_token.has_value());
  source_->CompleteLatest({"A"}, std::string("t1"));
  EXPECT_EQ(controller_->GetCurrentPageIndex(), 0);

  auto first = controller_->PreviousPage();
  ASSERT_FALSE(first);
  EXPECT_EQ(first.error().code(), ErrorCode::kTableNoPreviousPage);
}

TEST_F(TableControllerPagingTest, RefreshRefetchesCurrentPage) {
  LoadFirstPage({"A"}, std::string("t1"));
  ASSERT_TRUE(controller_->NextPage());
  source_->CompleteLatest({"B"});

  ASSERT_TRUE(controller_->Refresh());
  EXPECT_EQ(source_->LastRequest().page_token, std::optional<std::string>("t1"));
  EXPECT_EQ(controller_->GetItems(), (std::vector<std::string>{"B"}));
  source_->CompleteLatest({"B2"});
  EXPECT_EQ(controller_->GetItems(), (std::vector<std::string>{"B2"}));
  EXPECT_EQ(controller_->GetCurrentPageIndex(), 1);
}

TEST_F(TableControllerPagingTest, RefreshFromStartClearsCacheAndWindow) {
  LoadFirstPage({"A"}, std::string("t1"));
  ASSERT_TRUE(controller_->NextPage());
  source_->CompleteLatest({"B"}, std::string("t2"));

  ASSERT_TRUE(controller_->Refresh(true));
  EXPECT_EQ(controller_->TotalItems(), 0);
  EXPECT_FALSE(source_->LastRequest().page_token.has_value());

  auto snapshot = nlohmann::json::parse(controller_->DebugString());
  EXPECT_TRUE(snapshot["pagination_keys"].empty());

  source_->CompleteLatest({"A"}, std::string("t1"));
  EXPECT_EQ(controller_->GetCurrentPageIndex(), 0);
}

TEST_F(TableControllerPagingTest, MissingTokenFetchesWithoutToken) {
  LoadFirstPage({"A"}, std::string("t1"));
  ASSERT_TRUE(controller_->NextPage());
  source_->CompleteLatest({"B"});
  ASSERT_EQ(controller_->GetCurrentPageIndex(), 1);

  // Clears the cache; page 1 is still current until page 0 lands
  ASSERT_TRUE(controller_->SetSortModel(SortModel::Ascending("name")));
  ASSERT_TRUE(controller_->Refresh());
  EXPECT_FALSE(source_->LastRequest().page_token.has_value());

  source_->CompleteLatest({"Z"});
  EXPECT_EQ(controller_->GetItems(), (std::vector<std::string>{"Z"}));
  EXPECT_EQ(controller_->GetCurrentPageIndex(), 1);
}

TEST_F(TableControllerPagingTest, BroadcastOnFetchStartAndLanding) {
  LoadFirstPage({"A"});
  int broadcasts = 0;
  controller_->AddListener([&]() { ++broadcasts; });

  ASSERT_TRUE(controller_->Refresh());
  EXPECT_EQ(broadcasts, 1);
  source_->CompleteLatest({"A"});
  EXPECT_EQ(broadcasts, 2);
}

TEST_F(TableControllerPagingTest, MovedItemsLandTheSame) {
  config::TableConfig config;
  config.copy_items = false;
  LoadFirstPage({"A", "B", "C"}, std::nullopt, config);
  EXPECT_EQ(controller_->GetItems(), (std::vector<std::string>{"A", "B", "C"}));

  ASSERT_TRUE(controller_->Refresh());
  source_->CompleteLatest({"X"});
  EXPECT_EQ(controller_->GetItems(), (std::vector<std::string>{"X"}));
}

// ---------------------------------------------------------------------------
// Fetch errors and sequencing
// ---------------------------------------------------------------------------

TEST_F(TableControllerSequencingTest, FailureMovesToErrorState) {
  LoadFirstPage({"A", "B"}, std::string("t1"));
  int broadcasts = 0;
  controller_->AddListener([&]() { ++broadcasts; });

  ASSERT_TRUE(controller_->NextPage());
  source_->FailLatest(utils::MakeError(ErrorCode::kSourceUnavailable, "backend down"));

  EXPECT_EQ(controller_->GetState(), TableState::kError);
  ASSERT_TRUE(controller_->GetCurrentError().has_value());
  EXPECT_EQ(controller_->GetCurrentError()->code(), ErrorCode::kSourceUnavailable);
  EXPECT_EQ(controller_->TotalItems(), 0);
  EXPECT_EQ(controller_->GetCurrentPageIndex(), 0);
  EXPECT_TRUE(controller_->HasNextPage());
  EXPECT_EQ(broadcasts, 2);

  auto snapshot = nlohmann::json::parse(controller_->DebugString());
  EXPECT_EQ(snapshot["pagination_keys"], nlohmann::json::array({1}));

  ASSERT_TRUE(controller_->NextPage());
  EXPECT_EQ(source_->LastRequest().page_token, std::optional<std::string>("t1"));
}

TEST_F(TableControllerSequencingTest, SuccessClearsPreviousError) {
  InitTable();
  source_->FailLatest(utils::MakeError(ErrorCode::kSourceUnavailable, "backend down"));
  ASSERT_EQ(controller_->GetState(), TableState::kError);

  ASSERT_TRUE(controller_->Refresh());
  source_->CompleteLatest({"A"});
  EXPECT_EQ(controller_->GetState(), TableState::kIdle);
  EXPECT_FALSE(controller_->GetCurrentError().has_value());
}

TEST_F(TableControllerSequencingTest, ThrowingSourceBecomesFetchError) {
  LoadFirstPage({"A"});
  source_->ThrowOnNextFetch("connection reset");

  ASSERT_TRUE(controller_->Refresh());
  EXPECT_EQ(controller_->GetState(), TableState::kError);
  ASSERT_TRUE(controller_->GetCurrentError().has_value());
  EXPECT_EQ(controller_->GetCurrentError()->code(), ErrorCode::kTableFetchFailed);
  EXPECT_EQ(controller_->GetCurrentError()->message(), "connection reset");
  EXPECT_EQ(source_->PendingCount(), 0U);
}

TEST_F(TableControllerSequencingTest, InlineCompletionLandsBeforeCallReturns) {
  LoadFirstPage({"A"});
  source_->CompleteNextFetchInline({"B", "C"}, std::string("t1"));

  ASSERT_TRUE(controller_->Refresh());
  EXPECT_EQ(controller_->GetState(), TableState::kIdle);
  EXPECT_EQ(controller_->GetItems(), (std::vector<std::string>{"B", "C"}));
  EXPECT_TRUE(controller_->HasNextPage());
}

TEST_F(TableControllerSequencingTest, ListenerExceptionDuringInlineCompletionPropagates) {
  LoadFirstPage({"A"});
  int calls = 0;
  controller_->AddListener([&]() {
    ++calls;
    if (controller_->GetState() == TableState::kIdle) {
      throw std::runtime_error("listener failed");
    }
  });
  source_->CompleteNextFetchInline({"B"});

  EXPECT_THROW((void)controller_->Refresh(), std::runtime_error);
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(controller_->GetItems(), (std::vector<std::string>{"B"}));
  EXPECT_FALSE(controller_->GetCurrentError().has_value());
}

TEST_F(TableControllerSequencingTest, ListenerExceptionDuringQueuedCompletionPropagates) {
  LoadFirstPage({"A"});
  controller_->AddListener([&]() {
    if (controller_->GetState() == TableState::kIdle) {
      throw std::runtime_error("listener failed");
    }
  });

  ASSERT_TRUE(controller_->Refresh());
  EXPECT_THROW(source_->CompleteLatest({"B"}), std::runtime_error);
  EXPECT_EQ(controller_->GetItems(), (std::vector<std::string>{"B"}));
}

TEST_F(TableControllerSequencingTest, SupersededCompletionIsDropped) {
  LoadFirstPage({"A"}, std::string("t1"));
  ASSERT_TRUE(controller_->NextPage());
  ASSERT_TRUE(controller_->Refresh());
  ASSERT_EQ(source_->PendingCount(), 2U);

  // Oldest first: the NextPage() fetch is stale
  source_->Complete(0, {"STALE"});
  EXPECT_TRUE(controller_->IsFetching());
  EXPECT_EQ(controller_->GetItems(), (std::vector<std::string>{"A"}));

  source_->Complete(0, {"FRESH"});
  EXPECT_EQ(controller_->GetState(), TableState::kIdle);
  EXPECT_EQ(controller_->GetItems(), (std::vector<std::string>{"FRESH"}));
  EXPECT_EQ(controller_->GetCurrentPageIndex(), 0);
}

TEST_F(TableControllerSequencingTest, LateStaleCompletionAfterLatestIsDropped) {
  LoadFirstPage({"A"}, std::string("t1"));
  ASSERT_TRUE(controller_->NextPage());
  ASSERT_TRUE(controller_->Refresh());

  source_->Complete(1, {"FRESH"});
  source_->Complete(0, {"STALE"});
  EXPECT_EQ(controller_->GetItems(), (std::vector<std::string>{"FRESH"}));
  EXPECT_EQ(controller_->GetCurrentPageIndex(), 0);
}

TEST_F(TableControllerSequencingTest, DuplicateCompletionIsDropped) {
  InitTable();
  auto callback = source_->LatestCallback();
  source_->CompleteLatest({"A"});

  FetchResult<std::string, std::string> again;
  again.items = {"DUPLICATE"};
  callback(std::move(again));
  EXPECT_EQ(controller_->GetItems(), (std::vector<std::string>{"A"}));
}

TEST_F(TableControllerSequencingTest, GenerationAdvancesPerFetch) {
  InitTable();
  EXPECT_EQ(controller_->GetFetchGeneration(), 1U);
  source_->CompleteLatest({"A"});
  ASSERT_TRUE(controller_->Refresh());
  EXPECT_EQ(controller_->GetFetchGeneration(), 2U);
}

TEST_F(TableControllerSequencingTest, SelectionClearedOnLandingWhenConfigured) {
  config::TableConfig config;
  config.keep_selection_across_pages = false;
  LoadFirstPage({"A", "B", "C"}, std::nullopt, config);
  ASSERT_TRUE(controller_->SelectRow(0));
  ASSERT_TRUE(controller_->ExpandRow(2));

  std::vector<int> notified;
  for (int index = 0; index < 3; ++index) {
    controller_->AddRowChangeListener(index, [&](int row, const std::string*) { notified.push_back(row); });
  }

  ASSERT_TRUE(controller_->Refresh());
  source_->CompleteLatest({"D", "E", "F"});
  EXPECT_TRUE(controller_->GetSelectedRows().empty());
  EXPECT_TRUE(controller_->GetExpandedRows().empty());
  EXPECT_EQ(notified, (std::vector<int>{0, 2}));
}

TEST_F(TableControllerSequencingTest, SelectionIsPositionalByDefault) {
  LoadFirstPage({"A", "B", "C"}, std::string("t1"));
  ASSERT_TRUE(controller_->SelectRow(1));

  ASSERT_TRUE(controller_->NextPage());
  source_->CompleteLatest({"D", "E", "F"});
  EXPECT_TRUE(controller_->IsRowSelected(1));
  EXPECT_EQ(*controller_->FindItem(1), "E");
}

TEST_F(TableControllerSequencingTest, DebugStringSnapshot) {
  LoadFirstPage({"A", "B"}, std::string("t1"));
  ASSERT_TRUE(controller_->SelectRow(1));

  auto snapshot = nlohmann::json::parse(controller_->DebugString());
  EXPECT_EQ(snapshot["current_page_index"], 0);
  EXPECT_EQ(snapshot["pagination_keys"], nlohmann::json::array({1}));
  EXPECT_TRUE(snapshot["error"].is_null());
  EXPECT_EQ(snapshot["page_size"], config::defaults::kInitialPageSize);
  EXPECT_EQ(snapshot["total_items"], 2);
  EXPECT_EQ(snapshot["has_next_page"], true);
  EXPECT_TRUE(snapshot["sort"].is_null());
  EXPECT_EQ(snapshot["selected_rows"], nlohmann::json::array({1}));
  EXPECT_EQ(snapshot["state"], "idle");
  controller_->LogDebugState();
}
