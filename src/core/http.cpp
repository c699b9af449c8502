#include "todo/http.hpp"

#include <algorithm>
#include <cctype>

namespace todo {

namespace {

std::string to_lower(std::string_view s) {
    std::string out{s};
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return std::tolower(c);
    });
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
        s.remove_suffix(1);
    return s;
}

bool is_token_char(unsigned char c) {
    if (std::isalnum(c))
        return true;
    return std::string_view{"!#$%&'*+-.^_`|~"}.find(static_cast<char>(c)) != std::string_view::npos;
}

// Finds the blank line ending the header section.
// Returns {end of headers, start of body} or npos.
std::pair<size_t, size_t> find_header_end(const std::string& buffer) {
    auto crlf = buffer.find("\r\n\r\n");
    auto lf = buffer.find("\n\n");
    if (crlf == std::string::npos && lf == std::string::npos)
        return {std::string::npos, std::string::npos};
    if (lf < crlf)
        return {lf, lf + 2};
    return {crlf, crlf + 4};
}

} // namespace


std::optional<std::string> HttpRequest::header(std::string_view name) const {
    auto it = headers.find(to_lower(name));
    if (it == headers.end())
        return std::nullopt;
    return it->second;
}

bool HttpRequest::keep_alive() const {
    auto connection = header("connection");
    std::string value = connection ? to_lower(*connection) : std::string{};
    if (version_minor == 0)
        return value.find("keep-alive") != std::string::npos;
    return value.find("close") == std::string::npos;
}


HttpResponse HttpResponse::json(int status, std::string body) {
    HttpResponse response{status, {}, std::move(body)};
    response.set_header("content-type", "application/json");
    return response;
}

HttpResponse HttpResponse::text(int status, std::string body) {
    HttpResponse response{status, {}, std::move(body)};
    response.set_header("content-type", "text/plain; charset=utf-8");
    return response;
}

HttpResponse HttpResponse::empty(int status) {
    return HttpResponse{status, {}, {}};
}

void HttpResponse::set_header(std::string name, std::string value) {
    name = to_lower(name);
    for (auto& [key, existing] : headers) {
        if (key == name) {
            existing = std::move(value);
            return;
        }
    }
    headers.emplace_back(std::move(name), std::move(value));
}

std::optional<std::string> HttpResponse::header(std::string_view name) const {
    std::string key = to_lower(name);
    for (const auto& [existing, value] : headers) {
        if (existing == key)
            return value;
    }
    return std::nullopt;
}

std::string HttpResponse::serialize(bool keep_alive) const {
    std::string out;
    out.reserve(128 + body.size());
    out += "HTTP/1.1 " + std::to_string(status) + " ";
    out += reason_phrase(status);
    out += "\r\n";
    for (const auto& [name, value] : headers) {
        if (name == "content-length" || name == "connection")
            continue;
        out += name + ": " + value + "\r\n";
    }
    out += "content-length: " + std::to_string(body.size()) + "\r\n";
    if (!keep_alive)
        out += "connection: close\r\n";
    out += "\r\n";
    out += body;
    return out;
}

std::string_view reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 505: return "HTTP Version Not Supported";
        default:  return "Unknown";
    }
}


std::optional<HttpRequest> HttpParser::try_parse(std::string& buffer) {
    // Tolerate stray line breaks between pipelined requests
    size_t skip = 0;
    while (skip < buffer.size() && (buffer[skip] == '\r' || buffer[skip] == '\n'))
        ++skip;
    if (skip > 0)
        buffer.erase(0, skip);

    auto [header_end, body_start] = find_header_end(buffer);
    if (header_end == std::string::npos) {
        if (buffer.size() > MAX_HEADER_SIZE)
            throw ProtocolError{431, "request header too large"};
        return std::nullopt;
    }
    if (header_end > MAX_HEADER_SIZE)
        throw ProtocolError{431, "request header too large"};

    HttpRequest request;
    std::string_view head{buffer.data(), header_end};
    bool first = true;
    size_t pos = 0;
    while (pos <= head.size()) {
        size_t eol = head.find('\n', pos);
        if (eol == std::string_view::npos)
            eol = head.size();
        std::string_view line = head.substr(pos, eol - pos);
        // CRLF tolerance
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);

        if (first) {
            parse_request_line(line, request);
            first = false;
        } else if (!line.empty()) {
            parse_header_line(line, request);
        }
        pos = eol + 1;
    }

    if (request.headers.count("transfer-encoding"))
        throw ProtocolError{501, "transfer-encoding is not supported"};

    size_t length = content_length(request);
    if (buffer.size() - body_start < length)
        return std::nullopt; // body not fully received yet

    request.body = buffer.substr(body_start, length);
    buffer.erase(0, body_start + length);
    return request;
}

void HttpParser::parse_request_line(std::string_view line, HttpRequest& request) {
    auto first_space = line.find(' ');
    auto last_space = line.rfind(' ');
    if (first_space == std::string_view::npos || first_space == last_space)
        throw ProtocolError{400, "malformed request line"};

    std::string_view method = line.substr(0, first_space);
    std::string_view target = trim(line.substr(first_space + 1, last_space - first_space - 1));
    std::string_view version = line.substr(last_space + 1);

    if (method.empty() || !std::all_of(method.begin(), method.end(), is_token_char))
        throw ProtocolError{400, "malformed request method"};
    if (target.empty() || target.find(' ') != std::string_view::npos)
        throw ProtocolError{400, "malformed request target"};
    if (version.substr(0, 5) != "HTTP/")
        throw ProtocolError{400, "malformed http version"};
    if (version == "HTTP/1.1")
        request.version_minor = 1;
    else if (version == "HTTP/1.0")
        request.version_minor = 0;
    else
        throw ProtocolError{505, "unsupported http version"};

    request.method = std::string{method};
    request.path = std::string{target.substr(0, target.find('?'))};
}

void HttpParser::parse_header_line(std::string_view line, HttpRequest& request) {
    auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0)
        throw ProtocolError{400, "malformed header line"};

    std::string_view name = line.substr(0, colon);
    if (!std::all_of(name.begin(), name.end(), is_token_char))
        throw ProtocolError{400, "malformed header name"};

    std::string key = to_lower(name);
    std::string value{trim(line.substr(colon + 1))};

    auto [it, inserted] = request.headers.emplace(key, value);
    if (!inserted) {
        if (key == "content-length") {
            if (it->second != value)
                throw ProtocolError{400, "conflicting content-length headers"};
            return;
        }
        it->second += ", " + value;
    }
}

size_t HttpParser::content_length(const HttpRequest& request) {
    auto it = request.headers.find("content-length");
    if (it == request.headers.end())
        return 0;

    const std::string& value = it->second;
    if (value.empty() || value.size() > 12 ||
        !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); }))
        throw ProtocolError{400, "invalid content-length"};

    size_t length = std::stoull(value);
    if (length > MAX_BODY_SIZE)
        throw ProtocolError{413, "request body too large"};
    return length;
}

} // namespace todo
