// src/transport/http_head.cpp
#include "http_head.hpp"

#include <array>
#include <cctype>
#include <sstream>

namespace transport
{

    static constexpr const char *kHeadTerminator = "\r\n\r\n";

    static inline std::string first_line(const std::string &head)
    {
        const size_t eol = head.find("\r\n");
        return eol == std::string::npos ? head : head.substr(0, eol);
    }

    static inline bool write_text(Connection &conn, const std::string &text, std::string &err)
    {
        return conn.write_all(text.data(), text.size(), err);
    }

    bool read_head(Connection &conn, std::string &head, std::string &body, std::string &err)
    {
        err.clear();
        head.clear();
        body.clear();

        std::string acc;
        std::array<char, 1024> buf;

        while (true)
        {
            const size_t end = acc.find(kHeadTerminator);
            if (end != std::string::npos)
            {
                head = acc.substr(0, end);
                body = acc.substr(end + 4);
                return true;
            }
            if (acc.size() > kMaxHeadBytes)
            {
                err = "HTTP head exceeds max";
                return false;
            }

            const long r = conn.read_some(buf.data(), buf.size(), err);
            if (r > 0)
            {
                acc.append(buf.data(), static_cast<size_t>(r));
                continue;
            }
            if (r == 0)
            {
                err = "unexpected EOF while reading HTTP head";
            }
            return false;
        }
    }

    bool parse_request_head(const std::string &head, RequestHead &out, std::string &err)
    {
        err.clear();

        std::istringstream line(first_line(head));
        std::string method, target, version;
        if (!(line >> method >> target >> version))
        {
            err = "malformed request line";
            return false;
        }
        if (version.rfind("HTTP/1.", 0) != 0)
        {
            err = "unsupported HTTP version: " + version;
            return false;
        }
        if (target.empty() || target.front() != '/')
        {
            err = "malformed request target";
            return false;
        }

        out.method = method;
        out.path = target.substr(0, target.find('?'));
        return true;
    }

    bool parse_status_code(const std::string &head, int &status, std::string &err)
    {
        err.clear();

        std::istringstream line(first_line(head));
        std::string version, code;
        if (!(line >> version >> code) || version.rfind("HTTP/1.", 0) != 0)
        {
            err = "malformed status line";
            return false;
        }
        if (code.size() != 3 || !std::isdigit(static_cast<unsigned char>(code[0])) ||
            !std::isdigit(static_cast<unsigned char>(code[1])) || !std::isdigit(static_cast<unsigned char>(code[2])))
        {
            err = "malformed status code: " + code;
            return false;
        }

        status = std::stoi(code);
        return true;
    }

    bool write_request(Connection &conn, const std::string &host, const std::string &path, std::string &err)
    {
        std::string req;
        req += "GET " + path + " HTTP/1.1\r\n";
        req += "Host: " + host + "\r\n";
        req += "Accept: " + std::string(kEventStreamContentType) + "\r\n";
        req += "Cache-Control: no-cache\r\n";
        req += "\r\n";
        return write_text(conn, req, err);
    }

    bool write_event_stream_head(Connection &conn, std::string &err)
    {
        std::string resp;
        resp += "HTTP/1.1 200 OK\r\n";
        resp += "Content-Type: " + std::string(kEventStreamContentType) + "\r\n";
        resp += "Cache-Control: no-cache\r\n";
        // Body is close-delimited: the server closes after the terminal event.
        resp += "Connection: close\r\n";
        resp += "\r\n";
        return write_text(conn, resp, err);
    }

    bool write_error_response(Connection &conn, int status, const std::string &reason, std::string &err)
    {
        const std::string body = reason + "\n";

        std::string resp;
        resp += "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n";
        resp += "Content-Type: text/plain\r\n";
        resp += "Content-Length: " + std::to_string(body.size()) + "\r\n";
        resp += "Connection: close\r\n";
        resp += "\r\n";
        resp += body;
        return write_text(conn, resp, err);
    }

} // namespace transport
