/**
 * @file http_message.cpp
 * @brief HTTP/1.1 parsing and serialization.
 */

#include "server/http_message.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>

namespace archetype {

namespace {

std::string to_lower(std::string_view text) {
    std::string out{text};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim_ows(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);
    return text;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// HttpRequest
// ─────────────────────────────────────────────

std::optional<std::string> HttpRequest::header(std::string_view name) const {
    auto it = headers.find(to_lower(name));
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> HttpRequest::query_param(std::string_view name) const {
    auto it = query.find(std::string{name});
    if (it == query.end()) return std::nullopt;
    return it->second;
}

Result<nlohmann::json> HttpRequest::json_body() const {
    if (body.empty()) return nlohmann::json::object();
    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return Error{ErrorCode::InvalidArgument, std::string{"Malformed JSON body: "} + e.what()};
    }
}

// ─────────────────────────────────────────────
// HttpResponse
// ─────────────────────────────────────────────

HttpResponse HttpResponse::json(int status, const nlohmann::json& body) {
    HttpResponse response;
    response.status = status;
    response.body = dump_json(body);
    return response;
}

HttpResponse HttpResponse::error(int status, std::string_view code, std::string_view message) {
    return json(status, nlohmann::json{{"error", code}, {"message", message}});
}

HttpResponse HttpResponse::from_error(const Error& err) {
    return error(status_for(err.code), to_string(err.code), err.message);
}

HttpResponse HttpResponse::stream(Streamer streamer, std::string content_type) {
    HttpResponse response;
    response.content_type = std::move(content_type);
    response.streamer = std::move(streamer);
    return response;
}

// ─────────────────────────────────────────────
// Parsing
// ─────────────────────────────────────────────

std::optional<size_t> find_head_end(std::string_view buffer) {
    auto pos = buffer.find("\r\n\r\n");
    if (pos == std::string_view::npos) return std::nullopt;
    return pos + 4;
}

Result<HttpRequest> parse_request_head(std::string_view head) {
    HttpRequest request;

    auto line_end = head.find("\r\n");
    if (line_end == std::string_view::npos) {
        return Error{ErrorCode::InvalidArgument, "Missing request line"};
    }
    auto line = head.substr(0, line_end);

    auto sp1 = line.find(' ');
    auto sp2 = sp1 == std::string_view::npos ? sp1 : line.find(' ', sp1 + 1);
    if (sp1 == std::string_view::npos || sp2 == std::string_view::npos) {
        return Error{ErrorCode::InvalidArgument, "Malformed request line"};
    }
    request.method = std::string{line.substr(0, sp1)};
    request.target = std::string{line.substr(sp1 + 1, sp2 - sp1 - 1)};
    auto version = line.substr(sp2 + 1);
    if (version.substr(0, 5) != "HTTP/") {
        return Error{ErrorCode::InvalidArgument, "Unsupported protocol: " + std::string{version}};
    }
    if (request.target.empty() || request.target.front() != '/') {
        return Error{ErrorCode::InvalidArgument, "Request target must be an absolute path"};
    }

    std::string_view target = request.target;
    auto qpos = target.find('?');
    request.path = url_decode(target.substr(0, qpos));
    if (qpos != std::string_view::npos) {
        request.query = parse_query(target.substr(qpos + 1));
    }

    size_t pos = line_end + 2;
    while (pos < head.size()) {
        auto end = head.find("\r\n", pos);
        if (end == std::string_view::npos) end = head.size();
        auto field = head.substr(pos, end - pos);
        pos = end + 2;
        if (field.empty()) break;

        auto colon = field.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return Error{ErrorCode::InvalidArgument, "Malformed header: " + std::string{field}};
        }
        request.headers[to_lower(trim_ows(field.substr(0, colon)))] =
            std::string{trim_ows(field.substr(colon + 1))};
    }

    if (auto te = request.header("transfer-encoding"); te && to_lower(*te) != "identity") {
        return Error{ErrorCode::InvalidArgument, "Chunked request bodies are not supported"};
    }
    return request;
}

Result<size_t> content_length(const HttpRequest& request) {
    auto value = request.header("content-length");
    if (!value) return size_t{0};
    size_t length = 0;
    auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), length);
    if (ec != std::errc{} || ptr != value->data() + value->size()) {
        return Error{ErrorCode::InvalidArgument, "Invalid Content-Length: " + *value};
    }
    return length;
}

std::string url_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi < 0 || lo < 0) {
                out.push_back(c);
                continue;
            }
            out.push_back(static_cast<char>(hi * 16 + lo));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::map<std::string, std::string> parse_query(std::string_view query) {
    std::map<std::string, std::string> out;
    while (!query.empty()) {
        auto amp = query.find('&');
        auto pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
        if (pair.empty()) continue;

        auto eq = pair.find('=');
        auto key = url_decode(pair.substr(0, eq));
        auto value = eq == std::string_view::npos ? std::string{} : url_decode(pair.substr(eq + 1));
        out.emplace(std::move(key), std::move(value));
    }
    return out;
}

// ─────────────────────────────────────────────
// Serialization
// ─────────────────────────────────────────────

std::string_view reason_phrase(int status) noexcept {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

int status_for(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NotFound:
        case ErrorCode::DeviceNotFound:
            return 404;
        case ErrorCode::UnsupportedType:
        case ErrorCode::UnsupportedFormat:
        case ErrorCode::PreferenceUnsatisfiable:
        case ErrorCode::InvalidArgument:
            return 400;
        case ErrorCode::InvalidState:
            return 409;
        case ErrorCode::Unavailable:
            return 503;
        case ErrorCode::Io:
        case ErrorCode::Internal:
        case ErrorCode::BackendProbeFailure:
            return 500;
    }
    return 500;
}

namespace {

void append_head(std::string& out, const HttpResponse& response) {
    out += "HTTP/1.1 " + std::to_string(response.status) + " ";
    out += reason_phrase(response.status);
    out += "\r\nContent-Type: " + response.content_type + "\r\n";
    for (const auto& [name, value] : response.headers) {
        out += name + ": " + value + "\r\n";
    }
    out += "Connection: close\r\n";
}

}  // anonymous namespace

std::string serialize_response(const HttpResponse& response) {
    std::string out;
    out.reserve(response.body.size() + 128);
    append_head(out, response);
    out += "Content-Length: " + std::to_string(response.body.size()) + "\r\n\r\n";
    out += response.body;
    return out;
}

std::string serialize_stream_head(const HttpResponse& response) {
    std::string out;
    append_head(out, response);
    out += "Cache-Control: no-cache\r\nTransfer-Encoding: chunked\r\n\r\n";
    return out;
}

std::string encode_chunk(std::string_view payload) {
    char size[20];
    int n = std::snprintf(size, sizeof(size), "%zx\r\n", payload.size());
    std::string out(size, static_cast<size_t>(n));
    out += payload;
    out += "\r\n";
    return out;
}

std::string dump_json(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace archetype
