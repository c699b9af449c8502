#pragma once

#include "todo/uuid.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace todo {

using Timestamp = std::chrono::system_clock::time_point;

// ISO-8601 UTC with microseconds, e.g. 2024-03-01T09:15:02.123456Z
std::string format_timestamp(Timestamp ts);

struct TodoItem {
    Uuid id;
    std::string title;
    bool completed{false};
    Timestamp created_at;
    std::optional<Timestamp> updated_at;
};

// POST /todos payload. Both fields required.
struct NewTodo {
    std::string title;
    bool completed{false};
};

// PUT /todos/{id} payload. Absent or null fields are left untouched.
struct TodoPatch {
    std::optional<std::string> title;
    std::optional<bool> completed;
};

void to_json(nlohmann::json& j, const Uuid& id);
void to_json(nlohmann::json& j, const TodoItem& item);

// Throw nlohmann::json::exception on missing fields or type mismatch.
// Callers check that j is an object first.
void from_json(const nlohmann::json& j, NewTodo& todo);
void from_json(const nlohmann::json& j, TodoPatch& patch);

} // namespace todo
