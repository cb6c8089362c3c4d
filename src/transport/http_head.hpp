// src/transport/http_head.hpp
#pragma once

#include <cstddef>
#include <string>

#include "socket_stream.hpp"

namespace transport
{

    // Upper bound for a request or response head.
    constexpr size_t kMaxHeadBytes = 16u * 1024u;

    constexpr const char *kEventStreamContentType = "text/event-stream";

    struct RequestHead
    {
        std::string method;
        std::string path; // request target without query string
    };

    // Reads until the blank line that ends an HTTP head.
    // Bytes received after it are returned in body.
    // Returns false on EOF before the head ends, oversize head, or I/O error (err set).
    bool read_head(Connection &conn, std::string &head, std::string &body, std::string &err);

    // Parses "METHOD target HTTP/1.x". Returns false and sets err when malformed.
    bool parse_request_head(const std::string &head, RequestHead &out, std::string &err);

    // Parses the status code out of "HTTP/1.x NNN reason". Returns false and sets err when malformed.
    bool parse_status_code(const std::string &head, int &status, std::string &err);

    // Client: GET request asking for an event stream.
    bool write_request(Connection &conn, const std::string &host, const std::string &path, std::string &err);

    // Server: 200 head opening a close-delimited, uncacheable event stream.
    bool write_event_stream_head(Connection &conn, std::string &err);

    // Server: complete error response with a short text body.
    bool write_error_response(Connection &conn, int status, const std::string &reason, std::string &err);

} // namespace transport
