#include "todo/todo_item.hpp"

#include <cstdio>
#include <ctime>

namespace todo {

std::string format_timestamp(Timestamp ts) {
    using namespace std::chrono;

    auto secs = time_point_cast<seconds>(ts);
    if (secs > ts) // floor for times before the epoch
        secs -= seconds{1};
    auto micros = duration_cast<microseconds>(ts - secs).count();

    std::time_t tt = system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<long long>(micros));
    return buf;
}

void to_json(nlohmann::json& j, const Uuid& id) {
    j = id.to_string();
}

void to_json(nlohmann::json& j, const TodoItem& item) {
    j = nlohmann::json{
        {"id", item.id},
        {"title", item.title},
        {"completed", item.completed},
        {"created_at", format_timestamp(item.created_at)},
        {"updated_at", nullptr},
    };
    if (item.updated_at)
        j["updated_at"] = format_timestamp(*item.updated_at);
}

void from_json(const nlohmann::json& j, NewTodo& todo) {
    j.at("title").get_to(todo.title);
    j.at("completed").get_to(todo.completed);
}

void from_json(const nlohmann::json& j, TodoPatch& patch) {
    patch = TodoPatch{};
    if (auto it = j.find("title"); it != j.end() && !it->is_null())
        patch.title = it->get<std::string>();
    if (auto it = j.find("completed"); it != j.end() && !it->is_null())
        patch.completed = it->get<bool>();
}

} // namespace todo
