#pragma once

#include "todo/todo_item.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>


namespace todo {

/*
 * Thread-safe in-memory to-do list.
 * Items keep insertion order. Every operation holds the lock end to end
 * and hands back copies, never references into the collection.
 */
class TodoStore {
public:
    using Clock = std::function<Timestamp()>;

    TodoStore();
    explicit TodoStore(Clock clock);

    std::vector<TodoItem> list() const;

    // Appends a new item, returns the full list afterwards
    std::vector<TodoItem> insert(const std::string& title, bool completed);

    // Returns the updated item, std::nullopt if id is unknown
    std::optional<TodoItem> update(const Uuid& id, const TodoPatch& patch);

    // Returns the remaining items, std::nullopt if id is unknown
    std::optional<std::vector<TodoItem>> remove(const Uuid& id);

    size_t size() const;

private:
    std::vector<TodoItem> items_;
    mutable std::mutex mutex_;
    Clock clock_;
};

} // namespace todo
