#include <gtest/gtest.h>
#include "todo/todo_store.hpp"
#include <atomic>
#include <set>
#include <thread>
#include <vector>

using namespace todo;
using namespace std::chrono;

class TodoStoreTest : public ::testing::Test {
protected:
    TodoStore store;
};

// Store whose clock advances one second per reading
class TickingStoreTest : public ::testing::Test {
protected:
    std::atomic<int> ticks{0};
    TodoStore store{[this] {
        return Timestamp{seconds{1700000000 + ticks++}};
    }};
};


TEST_F(TodoStoreTest, StartsEmpty) {
    EXPECT_TRUE(store.list().empty());
    EXPECT_EQ(store.size(), 0);
}

TEST_F(TodoStoreTest, InsertReturnsFullList) {
    store.insert("first", false);
    auto items = store.insert("second", true);
    ASSERT_EQ(items.size(), 2);
    EXPECT_EQ(items[0].title, "first");
    EXPECT_EQ(items[1].title, "second");
    EXPECT_TRUE(items[1].completed);
}

TEST_F(TodoStoreTest, InsertSetsCreatedAtOnly) {
    auto before = system_clock::now();
    store.insert("buy milk", false);
    auto after = system_clock::now();

    auto items = store.list();
    ASSERT_EQ(items.size(), 1);
    EXPECT_GE(items[0].created_at, before);
    EXPECT_LE(items[0].created_at, after);
    EXPECT_FALSE(items[0].updated_at.has_value());
    EXPECT_EQ(items[0].id.version(), 4);
}

TEST_F(TodoStoreTest, InsertAcceptsEmptyTitle) {
    auto items = store.insert("", false);
    ASSERT_EQ(items.size(), 1);
    EXPECT_EQ(items[0].title, "");
}

TEST_F(TodoStoreTest, ListKeepsInsertionOrderAndUniqueIds) {
    for (int i = 0; i < 50; i++)
        store.insert("item " + std::to_string(i), i % 2 == 0);

    auto items = store.list();
    ASSERT_EQ(items.size(), 50);
    std::set<std::string> ids;
    for (size_t i = 0; i < items.size(); i++) {
        EXPECT_EQ(items[i].title, "item " + std::to_string(i));
        ids.insert(items[i].id.to_string());
    }
    EXPECT_EQ(ids.size(), 50);
}

TEST_F(TodoStoreTest, ListIsASnapshot) {
    store.insert("a", false);
    auto snapshot = store.list();
    store.insert("b", false);
    EXPECT_EQ(snapshot.size(), 1);
    EXPECT_EQ(store.size(), 2);
}

TEST_F(TodoStoreTest, UpdateAppliesProvidedFields) {
    auto id = store.insert("buy milk", false)[0].id;

    auto updated = store.update(id, TodoPatch{.title = std::nullopt, .completed = true});
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->title, "buy milk");
    EXPECT_TRUE(updated->completed);
    EXPECT_TRUE(updated->updated_at.has_value());

    updated = store.update(id, TodoPatch{.title = "buy oat milk", .completed = std::nullopt});
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->title, "buy oat milk");
    EXPECT_TRUE(updated->completed);
}

TEST_F(TodoStoreTest, UpdateWithEmptyPatchRefreshesTimestamp) {
    auto id = store.insert("buy milk", true)[0].id;
    auto updated = store.update(id, TodoPatch{});
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->title, "buy milk");
    EXPECT_TRUE(updated->completed);
    EXPECT_TRUE(updated->updated_at.has_value());
}

TEST_F(TodoStoreTest, UpdateKeepsPosition) {
    store.insert("a", false);
    auto id = store.insert("b", false)[1].id;
    store.insert("c", false);

    store.update(id, TodoPatch{.title = "B", .completed = std::nullopt});
    auto items = store.list();
    ASSERT_EQ(items.size(), 3);
    EXPECT_EQ(items[1].title, "B");
    EXPECT_EQ(items[1].id, id);
}

TEST_F(TickingStoreTest, UpdatedAtNotBeforeCreatedAt) {
    auto created = store.insert("buy milk", false)[0];
    auto updated = store.update(created.id, TodoPatch{});
    ASSERT_TRUE(updated.has_value());
    ASSERT_TRUE(updated->updated_at.has_value());
    EXPECT_GE(*updated->updated_at, updated->created_at);
    EXPECT_EQ(updated->created_at, created.created_at);

    auto again = store.update(created.id, TodoPatch{});
    EXPECT_GT(*again->updated_at, *updated->updated_at);
}

TEST_F(TodoStoreTest, UpdateUnknownIdIsNotFound) {
    store.insert("buy milk", false);
    auto before = store.list();

    auto result = store.update(Uuid::generate(), TodoPatch{.title = "x", .completed = true});
    EXPECT_FALSE(result.has_value());

    auto after = store.list();
    ASSERT_EQ(after.size(), 1);
    EXPECT_EQ(after[0].title, before[0].title);
    EXPECT_FALSE(after[0].completed);
    EXPECT_FALSE(after[0].updated_at.has_value());
}

TEST_F(TodoStoreTest, RemoveDeletesOnlyMatchingItem) {
    store.insert("a", false);
    auto items = store.insert("b", true);
    store.insert("c", false);

    auto remaining = store.remove(items[1].id);
    ASSERT_TRUE(remaining.has_value());
    ASSERT_EQ(remaining->size(), 2);
    EXPECT_EQ((*remaining)[0].title, "a");
    EXPECT_EQ((*remaining)[0].id, items[0].id);
    EXPECT_EQ((*remaining)[1].title, "c");
}

TEST_F(TodoStoreTest, RemoveUnknownIdIsNotFound) {
    store.insert("a", false);
    EXPECT_FALSE(store.remove(Uuid::generate()).has_value());
    EXPECT_EQ(store.size(), 1);
}

TEST_F(TodoStoreTest, RemoveTwiceIsNotFoundSecondTime) {
    auto id = store.insert("a", false)[0].id;
    store.insert("b", false);

    auto first = store.remove(id);
    ASSERT_TRUE(first.has_value());
    auto after_first = store.list();

    EXPECT_FALSE(store.remove(id).has_value());
    auto after_second = store.list();
    ASSERT_EQ(after_first.size(), after_second.size());
    EXPECT_EQ(after_first[0].id, after_second[0].id);
}

TEST_F(TodoStoreTest, ConcurrentInsertUpdateRemove) {
    const int num_threads = 8;
    const int ops_per_thread = 100;
    std::vector<std::thread> threads;
    threads.reserve(num_threads);

    for (int i = 0; i < num_threads; i++) {
        threads.emplace_back([this, i]() {
            for (int j = 0; j < ops_per_thread; j++) {
                std::string title = std::to_string(i) + ":" + std::to_string(j);
                auto items = store.insert(title, false);
                // Our item is in the snapshot we got back
                const TodoItem* mine = nullptr;
                for (const auto& item : items) {
                    if (item.title == title)
                        mine = &item;
                }
                ASSERT_NE(mine, nullptr);
                auto updated = store.update(mine->id, TodoPatch{.title = std::nullopt, .completed = true});
                ASSERT_TRUE(updated.has_value());
                if (j % 2 == 0)
                    ASSERT_TRUE(store.remove(mine->id).has_value());
            }
        });
    }
    for (auto& t : threads)
        t.join();

    auto items = store.list();
    EXPECT_EQ(items.size(), num_threads * ops_per_thread / 2);
    for (const auto& item : items) {
        EXPECT_TRUE(item.completed);
        EXPECT_TRUE(item.updated_at.has_value());
    }
}
