#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace todo {

/*
 * Malformed request bytes. Carries the status code the client
 * should be answered with before the connection is closed.
 */
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(int status, const std::string& msg)
        : std::runtime_error(msg), status_(status) {}

    int status() const noexcept { return status_; }

private:
    int status_;
};

struct HttpRequest {
    std::string method;
    std::string path;     // request target without the query
    int version_minor{1}; // HTTP/1.<minor>
    std::map<std::string, std::string> headers; // names lowercased
    std::string body;

    std::optional<std::string> header(std::string_view name) const;

    // Whether the connection stays open after the response
    bool keep_alive() const;
};

struct HttpResponse {
    int status{200};
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    static HttpResponse json(int status, std::string body);
    static HttpResponse text(int status, std::string body);
    static HttpResponse empty(int status);

    void set_header(std::string name, std::string value);
    std::optional<std::string> header(std::string_view name) const;

    // Status line, headers, content-length and body
    std::string serialize(bool keep_alive) const;
};

std::string_view reason_phrase(int status);

/*
 * Incremental HTTP/1.x request parser.
 * Bodies are framed by Content-Length only.
 */
class HttpParser {
public:
    static constexpr size_t MAX_HEADER_SIZE = 16 * 1024;
    static constexpr size_t MAX_BODY_SIZE = 1024 * 1024;

    // Consumes one complete request from the front of buffer.
    // Returns std::nullopt if more bytes are needed.
    // Throws ProtocolError if the bytes can never form a request.
    static std::optional<HttpRequest> try_parse(std::string& buffer);

private:
    static void parse_request_line(std::string_view line, HttpRequest& request);
    static void parse_header_line(std::string_view line, HttpRequest& request);
    static size_t content_length(const HttpRequest& request);
};

} // namespace todo
