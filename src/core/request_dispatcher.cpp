#include "todo/request_dispatcher.hpp"

#include <string_view>
#include <vector>

namespace todo {

namespace {

std::vector<std::string_view> split_path(std::string_view path) {
    std::vector<std::string_view> segments;
    if (!path.empty() && path.front() == '/')
        path.remove_prefix(1);

    size_t pos = 0;
    while (true) {
        size_t slash = path.find('/', pos);
        segments.push_back(path.substr(pos, slash - pos));
        if (slash == std::string_view::npos)
            break;
        pos = slash + 1;
    }
    return segments;
}

HttpResponse method_not_allowed(std::string allow) {
    auto response = HttpResponse::empty(405);
    response.set_header("allow", std::move(allow));
    return response;
}

} // namespace


HttpResponse RequestDispatcher::execute(const HttpRequest& request) const {
    if (Cors::is_preflight(request))
        return cors_.preflight(request);

    HttpResponse response = route(request);
    cors_.decorate(request, response);
    return response;
}

HttpResponse RequestDispatcher::route(const HttpRequest& request) const {
    auto segments = split_path(request.path);
    if (segments.empty() || segments[0] != "todos")
        return HttpResponse::empty(404);

    // /todos
    if (segments.size() == 1) {
        if (request.method == "GET")
            return api_.list();
        if (request.method == "POST")
            return api_.create(request);
        return method_not_allowed("GET, POST");
    }

    // /todos/{id}
    if (segments.size() == 2 && !segments[1].empty()) {
        if (request.method == "PUT")
            return api_.update(segments[1], request);
        if (request.method == "DELETE")
            return api_.remove(segments[1]);
        return method_not_allowed("PUT, DELETE");
    }

    return HttpResponse::empty(404);
}

} // namespace todo
