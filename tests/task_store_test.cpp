#include <gtest/gtest.h>
#include <cstdio>
#include <memory>
#include "sqlite_task_store.hpp"
#include "task_store.hpp"

using namespace pcex;

namespace {

TransferTask make_task(const std::string& id, int64_t created_at,
                       TransferState state = TransferState::Pending) {
    TransferTask t;
    t.id = id;
    t.file_name = id + ".bin";
    t.source_path = "C:\\data\\" + t.file_name;
    t.destination_path = "/tmp/" + t.file_name;
    t.direction = TransferDirection::Download;
    t.total_bytes = 1000;
    t.state = state;
    t.created_at = created_at;
    return t;
}

template <typename Store>
std::unique_ptr<TaskStore> make_store();

template <>
std::unique_ptr<TaskStore> make_store<MemoryTaskStore>() {
    return std::unique_ptr<TaskStore>(new MemoryTaskStore());
}

template <>
std::unique_ptr<TaskStore> make_store<SqliteTaskStore>() {
    auto r = SqliteTaskStore::open(":memory:");
    if (!r)
        return nullptr;
    return std::move(r.value());
}

} // namespace

template <typename Store>
class TaskStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = make_store<Store>();
        ASSERT_NE(store_, nullptr);
    }

    std::unique_ptr<TaskStore> store_;
};

using StoreTypes = ::testing::Types<MemoryTaskStore, SqliteTaskStore>;
TYPED_TEST_SUITE(TaskStoreTest, StoreTypes);

TYPED_TEST(TaskStoreTest, MissingTaskIsEmpty) {
    auto r = this->store_->get_task("nope");
    ASSERT_TRUE(r.ok());
    EXPECT_FALSE(r.value().has_value());
}

TYPED_TEST(TaskStoreTest, UpsertThenGet) {
    auto t = make_task("a", 100);
    t.direction = TransferDirection::Upload;
    t.error = std::string("boom");
    ASSERT_TRUE(this->store_->upsert_task(t).ok());

    auto got = this->store_->get_task("a");
    ASSERT_TRUE(got.ok());
    ASSERT_TRUE(got.value().has_value());
    const auto& g = *got.value();
    EXPECT_EQ(g.file_name, "a.bin");
    EXPECT_EQ(g.source_path, "C:\\data\\a.bin");
    EXPECT_EQ(g.direction, TransferDirection::Upload);
    EXPECT_EQ(g.total_bytes, 1000u);
    EXPECT_EQ(g.state, TransferState::Pending);
    EXPECT_FALSE(g.completed_at.has_value());
    ASSERT_TRUE(g.error.has_value());
    EXPECT_EQ(*g.error, "boom");
}

TYPED_TEST(TaskStoreTest, UpsertReplacesActiveRow) {
    ASSERT_TRUE(this->store_->upsert_task(make_task("a", 100)).ok());
    auto t = make_task("a", 100, TransferState::Completed);
    t.transferred_bytes = 1000;
    t.completed_at = 200;
    ASSERT_TRUE(this->store_->upsert_task(t).ok());

    auto got = this->store_->get_task("a").value();
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->state, TransferState::Completed);
    ASSERT_TRUE(got->completed_at.has_value());
    EXPECT_EQ(*got->completed_at, 200);
    EXPECT_EQ(this->store_->list_tasks(nullptr).value().size(), 1u);
}

TYPED_TEST(TaskStoreTest, TerminalRowsAreImmutable) {
    auto done = make_task("a", 100, TransferState::Cancelled);
    ASSERT_TRUE(this->store_->upsert_task(done).ok());

    ASSERT_TRUE(this->store_->update_progress("a", 500, TransferState::InProgress).ok());
    auto late = make_task("a", 100, TransferState::Completed);
    late.transferred_bytes = 1000;
    ASSERT_TRUE(this->store_->upsert_task(late).ok());

    auto got = this->store_->get_task("a").value();
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->state, TransferState::Cancelled);
    EXPECT_EQ(got->transferred_bytes, 0u);
}

TYPED_TEST(TaskStoreTest, UpdateProgress) {
    ASSERT_TRUE(this->store_->upsert_task(make_task("a", 100)).ok());
    ASSERT_TRUE(this->store_->update_progress("a", 250, TransferState::InProgress).ok());
    auto got = this->store_->get_task("a").value();
    EXPECT_EQ(got->transferred_bytes, 250u);
    EXPECT_EQ(got->state, TransferState::InProgress);
    EXPECT_DOUBLE_EQ(got->progress(), 0.25);

    // Unknown ids are ignored.
    EXPECT_TRUE(this->store_->update_progress("zzz", 1, TransferState::InProgress).ok());
}

TYPED_TEST(TaskStoreTest, ListIsNewestFirstAndFiltered) {
    ASSERT_TRUE(this->store_->upsert_task(make_task("old", 100, TransferState::Completed)).ok());
    ASSERT_TRUE(this->store_->upsert_task(make_task("new", 300)).ok());
    ASSERT_TRUE(this->store_->upsert_task(make_task("mid", 200, TransferState::Failed)).ok());

    auto all = this->store_->list_tasks(nullptr);
    ASSERT_TRUE(all.ok());
    ASSERT_EQ(all.value().size(), 3u);
    EXPECT_EQ(all.value()[0].id, "new");
    EXPECT_EQ(all.value()[1].id, "mid");
    EXPECT_EQ(all.value()[2].id, "old");

    auto active = this->store_->list_tasks([](const TransferTask& t) { return t.is_active(); });
    ASSERT_TRUE(active.ok());
    ASSERT_EQ(active.value().size(), 1u);
    EXPECT_EQ(active.value()[0].id, "new");
}

TYPED_TEST(TaskStoreTest, DeleteByPredicate) {
    ASSERT_TRUE(this->store_->upsert_task(make_task("a", 100, TransferState::Completed)).ok());
    ASSERT_TRUE(this->store_->upsert_task(make_task("b", 200, TransferState::InProgress)).ok());
    ASSERT_TRUE(this->store_->upsert_task(make_task("c", 300, TransferState::Failed)).ok());

    auto n = this->store_->delete_tasks([](const TransferTask& t) { return is_terminal(t.state); });
    ASSERT_TRUE(n.ok());
    EXPECT_EQ(n.value(), 2u);
    auto left = this->store_->list_tasks(nullptr).value();
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].id, "b");
}

TEST(TaskNames, RoundTripThroughText) {
    for (auto s : {TransferState::Pending, TransferState::InProgress, TransferState::Completed,
                   TransferState::Failed, TransferState::Cancelled}) {
        TransferState back;
        ASSERT_TRUE(parse_transfer_state(transfer_state_name(s), back));
        EXPECT_EQ(back, s);
    }
    TransferDirection d;
    EXPECT_TRUE(parse_direction("Upload", d));
    EXPECT_EQ(d, TransferDirection::Upload);
    EXPECT_FALSE(parse_direction("sideways", d));
}

TEST(TaskProgress, UnknownSizeIsZero) {
    TransferTask t;
    t.transferred_bytes = 10;
    EXPECT_DOUBLE_EQ(t.progress(), 0.0);
}

TEST(SqliteTaskStore, PersistsAcrossReopen) {
    std::string path = "/tmp/pcex_store_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + ".db";
    std::remove(path.c_str());
    {
        auto s = SqliteTaskStore::open(path);
        ASSERT_TRUE(s.ok()) << s.error().describe();
        ASSERT_TRUE(s.value()->upsert_task(make_task("keep", 100, TransferState::Completed)).ok());
    }
    auto s = SqliteTaskStore::open(path);
    ASSERT_TRUE(s.ok());
    auto got = s.value()->get_task("keep");
    ASSERT_TRUE(got.ok());
    ASSERT_TRUE(got.value().has_value());
    EXPECT_EQ(got.value()->state, TransferState::Completed);
    std::remove(path.c_str());
}

TEST(SqliteTaskStore, UnopenablePathFails) {
    auto s = SqliteTaskStore::open("/nonexistent-dir/x/y.db");
    ASSERT_FALSE(s.ok());
    EXPECT_EQ(s.error().code, TransferErrc::store_failure);
}
