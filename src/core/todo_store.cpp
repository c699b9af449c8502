#include "todo/todo_store.hpp"

#include <algorithm>

namespace todo {

TodoStore::TodoStore()
    : clock_([] { return std::chrono::system_clock::now(); }) {}

TodoStore::TodoStore(Clock clock) : clock_(std::move(clock)) {}

std::vector<TodoItem> TodoStore::list() const {
    std::lock_guard lock(mutex_);
    return items_;
}

std::vector<TodoItem> TodoStore::insert(const std::string& title, bool completed) {
    std::lock_guard lock(mutex_);
    items_.push_back(TodoItem{
        .id = Uuid::generate(),
        .title = title,
        .completed = completed,
        .created_at = clock_(),
        .updated_at = std::nullopt,
    });
    return items_;
}

std::optional<TodoItem> TodoStore::update(const Uuid& id, const TodoPatch& patch) {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(items_.begin(), items_.end(), [&](const TodoItem& item) {
        return item.id == id;
    });
    if (it == items_.end())
        return std::nullopt;

    if (patch.title)
        it->title = *patch.title;
    if (patch.completed)
        it->completed = *patch.completed;
    it->updated_at = clock_();
    return *it;
}

std::optional<std::vector<TodoItem>> TodoStore::remove(const Uuid& id) {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(items_.begin(), items_.end(), [&](const TodoItem& item) {
        return item.id == id;
    });
    if (it == items_.end())
        return std::nullopt;

    items_.erase(it);
    return items_;
}

size_t TodoStore::size() const {
    std::lock_guard lock(mutex_);
    return items_.size();
}

} // namespace todo
