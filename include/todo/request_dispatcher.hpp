#pragma once

#include "todo/cors.hpp"
#include "todo/http.hpp"
#include "todo/todo_api.hpp"
#include "todo/todo_store.hpp"

#include <memory>

namespace todo {

/*
 * Routes a parsed request to its handler and applies the CORS policy.
 * Stateless apart from the shared store, safe to call from any worker.
 */
class RequestDispatcher {
public:
    explicit RequestDispatcher(std::shared_ptr<TodoStore> store, Cors cors = Cors{})
        : api_(std::move(store)), cors_(cors) {}

    HttpResponse execute(const HttpRequest& request) const;

private:
    TodoApi api_;
    Cors cors_;

    HttpResponse route(const HttpRequest& request) const;
};

} // namespace todo
