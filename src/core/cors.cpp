#include "todo/cors.hpp"

namespace todo {

bool Cors::is_preflight(const HttpRequest& request) {
    return request.method == "OPTIONS" && request.header("origin").has_value();
}

HttpResponse Cors::preflight(const HttpRequest& request) const {
    if (!request.header("access-control-request-method")) {
        auto response = HttpResponse::text(400, "Access-Control-Request-Method header is missing");
        decorate(request, response);
        return response;
    }

    auto response = HttpResponse::empty(200);
    decorate(request, response);
    response.set_header("access-control-allow-methods", std::string{ALLOWED_METHODS});
    if (auto requested = request.header("access-control-request-headers"); requested && !requested->empty())
        response.set_header("access-control-allow-headers", *requested);
    response.set_header("access-control-max-age", std::to_string(max_age_.count()));
    return response;
}

void Cors::decorate(const HttpRequest& request, HttpResponse& response) const {
    auto origin = request.header("origin");
    if (!origin)
        return;
    response.set_header("access-control-allow-origin", *origin);
    response.set_header("vary", "Origin");
}

} // namespace todo
