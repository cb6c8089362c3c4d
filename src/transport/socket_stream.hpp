// src/transport/socket_stream.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace transport
{

    // Duplex byte stream carrying one task's request and event stream.
    class Connection
    {
    public:
        virtual ~Connection() = default;

        // Reads up to n bytes into buf.
        // Returns:
        //  - > 0 => bytes read
        //  - 0   => orderly EOF (peer closed its side, or local abort)
        //  - < 0 => I/O error (err set)
        virtual long read_some(char *buf, size_t n, std::string &err) = 0;

        // Writes all len bytes without buffering. Returns false on error and sets err.
        virtual bool write_all(const char *data, size_t len, std::string &err) = 0;

        // Half-close: the peer reads EOF once buffered data is delivered.
        virtual void shutdown_write() = 0;

        // Shuts both directions down. A read_some blocked in another thread returns promptly.
        virtual void abort() = 0;

        // Releases the descriptor. Must not race with read_some/write_all.
        virtual void close() = 0;
    };

    class SocketConnection : public Connection
    {
    public:
        explicit SocketConnection(int fd);
        ~SocketConnection() override;

        SocketConnection(const SocketConnection &) = delete;
        SocketConnection &operator=(const SocketConnection &) = delete;

        long read_some(char *buf, size_t n, std::string &err) override;
        bool write_all(const char *data, size_t len, std::string &err) override;
        void shutdown_write() override;
        void abort() override;
        void close() override;

    private:
        int current_fd() const;

        mutable std::mutex mutex_; // guards fd_ against close() vs shutdown
        int fd_;
    };

    class Listener
    {
    public:
        Listener() = default;
        ~Listener();

        Listener(const Listener &) = delete;
        Listener &operator=(const Listener &) = delete;

        // Binds and listens. Port 0 lets the OS choose; see port().
        bool listen(const std::string &address, uint16_t port, int backlog, std::string &err);

        // Waits up to timeout for one connection.
        // Returns nullptr on timeout (err empty) or failure (err non-empty).
        std::unique_ptr<SocketConnection> accept(std::chrono::milliseconds timeout, std::string &err);

        uint16_t port() const { return port_; }
        bool is_open() const { return fd_ >= 0; }
        void close();

    private:
        int fd_ = -1;
        uint16_t port_ = 0;
    };

    // Opens a TCP connection with Nagle disabled so every frame leaves immediately.
    std::unique_ptr<SocketConnection> connect_tcp(const std::string &host, uint16_t port, std::string &err);

    // Connected AF_UNIX stream pair, for in-process use.
    bool make_socket_pair(std::unique_ptr<SocketConnection> &a, std::unique_ptr<SocketConnection> &b,
                          std::string &err);

} // namespace transport
