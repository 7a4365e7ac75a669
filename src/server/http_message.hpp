/**
 * @file http_message.hpp
 * @brief HTTP/1.1 request parsing and response serialization.
 *
 * Only what the service needs: a request line, headers, and a body sized by
 * Content-Length. Chunked request bodies are rejected. Responses are either
 * complete (Content-Length) or streamed with chunked transfer encoding.
 */

#pragma once

#include "core/result.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace archetype {

class ChunkedStream;

struct HttpRequest {
    std::string method;
    std::string target;                               ///< raw request-target
    std::string path;                                 ///< decoded, without the query
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;       ///< lower-cased names
    std::string body;

    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
    [[nodiscard]] std::optional<std::string> query_param(std::string_view name) const;

    /// Body as JSON; an empty body reads as an empty object.
    [[nodiscard]] Result<nlohmann::json> json_body() const;
};

struct HttpResponse {
    using Streamer = std::function<void(ChunkedStream&)>;

    int status = 200;
    std::string content_type = "application/json";
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;

    /// Set for streaming responses; the body is then produced by the streamer.
    Streamer streamer;

    [[nodiscard]] bool is_stream() const noexcept { return static_cast<bool>(streamer); }

    static HttpResponse json(int status, const nlohmann::json& body);
    static HttpResponse error(int status, std::string_view code, std::string_view message);
    static HttpResponse from_error(const Error& err);
    static HttpResponse stream(Streamer streamer, std::string content_type = "application/x-ndjson");
};

// ── Parsing ───────────────────────────────────

/// Offset just past the blank line ending the head, or nullopt if not yet complete.
[[nodiscard]] std::optional<size_t> find_head_end(std::string_view buffer);

/**
 * @brief Parse the request line and headers of @p head (terminator included).
 *
 * The body is left empty; the caller reads Content-Length bytes after it.
 */
Result<HttpRequest> parse_request_head(std::string_view head);

/// Content-Length of a parsed head; 0 when absent.
Result<size_t> content_length(const HttpRequest& request);

[[nodiscard]] std::string url_decode(std::string_view text);
[[nodiscard]] std::map<std::string, std::string> parse_query(std::string_view query);

// ── Serialization ─────────────────────────────

[[nodiscard]] std::string_view reason_phrase(int status) noexcept;
[[nodiscard]] int status_for(ErrorCode code) noexcept;

/// Full response with Content-Length and Connection: close.
[[nodiscard]] std::string serialize_response(const HttpResponse& response);

/// Status line and headers announcing a chunked body.
[[nodiscard]] std::string serialize_stream_head(const HttpResponse& response);

/// One chunk of a chunked body; an empty payload yields the terminating chunk.
[[nodiscard]] std::string encode_chunk(std::string_view payload);

/// JSON dump that replaces invalid UTF-8 instead of throwing.
[[nodiscard]] std::string dump_json(const nlohmann::json& value);

}  // namespace archetype
