#pragma once

#include "todo/http.hpp"

#include <chrono>

namespace todo {

/*
 * Permissive cross-origin policy: any origin, any method, any header.
 */
class Cors {
public:
    static constexpr std::string_view ALLOWED_METHODS =
        "DELETE, GET, HEAD, OPTIONS, PATCH, POST, PUT";

    explicit Cors(std::chrono::seconds max_age = std::chrono::seconds{3600})
        : max_age_(max_age) {}

    // OPTIONS carrying an Origin header
    static bool is_preflight(const HttpRequest& request);

    // Answer to a preflight, 400 if Access-Control-Request-Method is missing
    HttpResponse preflight(const HttpRequest& request) const;

    // Adds the allow-origin headers to a response for a cross-origin request
    void decorate(const HttpRequest& request, HttpResponse& response) const;

private:
    std::chrono::seconds max_age_;
};

} // namespace todo
