#include "todo/todo_api.hpp"

#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

namespace todo {

namespace {

// application/json, with or without parameters, or any +json subtype
bool is_json_content_type(const HttpRequest& request) {
    auto content_type = request.header("content-type");
    if (!content_type)
        return false;

    std::string mime = content_type->substr(0, content_type->find(';'));
    while (!mime.empty() && std::isspace(static_cast<unsigned char>(mime.back())))
        mime.pop_back();
    std::transform(mime.begin(), mime.end(), mime.begin(), [](unsigned char c) {
        return std::tolower(c);
    });

    if (mime == "application/json")
        return true;
    return mime.size() > 5 && mime.compare(mime.size() - 5, 5, "+json") == 0;
}

template <typename Payload>
Payload decode_body(const HttpRequest& request) {
    if (!is_json_content_type(request))
        throw DecodeError{"Content type error"};

    try {
        auto j = nlohmann::json::parse(request.body);
        if (!j.is_object())
            throw DecodeError{"Json deserialize error: expected an object, got " + std::string{j.type_name()}};
        return j.get<Payload>();
    } catch (const nlohmann::json::exception& e) {
        throw DecodeError{std::string{"Json deserialize error: "} + e.what()};
    }
}

HttpResponse json_response(const nlohmann::json& body) {
    return HttpResponse::json(200, body.dump());
}

} // namespace


HttpResponse TodoApi::list() const {
    return json_response(store_->list());
}

HttpResponse TodoApi::create(const HttpRequest& request) const {
    try {
        auto payload = decode_body<NewTodo>(request);
        return json_response(store_->insert(payload.title, payload.completed));
    } catch (const DecodeError& e) {
        return decode_failure(e);
    }
}

HttpResponse TodoApi::update(std::string_view id, const HttpRequest& request) const {
    auto uuid = Uuid::parse(id);
    if (!uuid)
        return not_found();

    TodoPatch patch;
    try {
        patch = decode_body<TodoPatch>(request);
    } catch (const DecodeError& e) {
        return decode_failure(e);
    }

    auto item = store_->update(*uuid, patch);
    if (!item)
        return not_found();
    return json_response(*item);
}

HttpResponse TodoApi::remove(std::string_view id) const {
    auto uuid = Uuid::parse(id);
    if (!uuid)
        return not_found();

    auto remaining = store_->remove(*uuid);
    if (!remaining)
        return not_found();
    return json_response(*remaining);
}

HttpResponse TodoApi::not_found() {
    return HttpResponse::text(404, std::string{NOT_FOUND_MESSAGE});
}

HttpResponse TodoApi::decode_failure(const DecodeError& e) {
    return HttpResponse::text(400, e.what());
}

} // namespace todo
