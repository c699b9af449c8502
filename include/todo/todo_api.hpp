#pragma once

#include "todo/http.hpp"
#include "todo/todo_store.hpp"

#include <memory>
#include <stdexcept>
#include <string_view>

namespace todo {

// Request body could not be decoded into the expected payload
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {}
};

/*
 * Handlers for the /todos resource.
 * Each translates one request into one TodoStore call.
 */
class TodoApi {
public:
    static constexpr std::string_view NOT_FOUND_MESSAGE = "Todo item not found";

    explicit TodoApi(std::shared_ptr<TodoStore> store) : store_(std::move(store)) {}

    // GET /todos
    HttpResponse list() const;

    // POST /todos
    HttpResponse create(const HttpRequest& request) const;

    // PUT /todos/{id}
    HttpResponse update(std::string_view id, const HttpRequest& request) const;

    // DELETE /todos/{id}
    HttpResponse remove(std::string_view id) const;

private:
    std::shared_ptr<TodoStore> store_;

    static HttpResponse not_found();
    static HttpResponse decode_failure(const DecodeError& e);
};

} // namespace todo
