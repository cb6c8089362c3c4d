// src/transport/socket_stream.cpp
#include "socket_stream.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace transport
{

    static inline std::string errno_message(const char *what)
    {
        return std::string(what) + ": " + std::strerror(errno);
    }

    static inline void set_no_delay(int fd)
    {
        int one = 1;
        // Best effort: AF_UNIX sockets reject TCP options.
        (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    }

    static inline void set_cloexec(int fd)
    {
        const int flags = ::fcntl(fd, F_GETFD);
        if (flags >= 0)
        {
            (void)::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
        }
    }

    // -----------------------------
    // SocketConnection
    // -----------------------------

    SocketConnection::SocketConnection(int fd) : fd_(fd) {}

    SocketConnection::~SocketConnection()
    {
        close();
    }

    int SocketConnection::current_fd() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return fd_;
    }

    long SocketConnection::read_some(char *buf, size_t n, std::string &err)
    {
        err.clear();

        const int fd = current_fd();
        if (fd < 0)
        {
            err = "connection closed";
            return -1;
        }

        while (true)
        {
            const ssize_t r = ::recv(fd, buf, n, 0);
            if (r >= 0)
            {
                return static_cast<long>(r);
            }
            if (errno == EINTR)
            {
                continue;
            }
            err = errno_message("recv failed");
            return -1;
        }
    }

    bool SocketConnection::write_all(const char *data, size_t len, std::string &err)
    {
        err.clear();

        const int fd = current_fd();
        if (fd < 0)
        {
            err = "connection closed";
            return false;
        }

        size_t sent = 0;
        while (sent < len)
        {
            // MSG_NOSIGNAL: a vanished peer surfaces as EPIPE, not SIGPIPE.
            const ssize_t w = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
            if (w > 0)
            {
                sent += static_cast<size_t>(w);
                continue;
            }
            if (w < 0 && errno == EINTR)
            {
                continue;
            }
            err = errno_message("send failed");
            return false;
        }
        return true;
    }

    void SocketConnection::shutdown_write()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fd_ >= 0)
        {
            (void)::shutdown(fd_, SHUT_WR);
        }
    }

    void SocketConnection::abort()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fd_ >= 0)
        {
            (void)::shutdown(fd_, SHUT_RDWR);
        }
    }

    void SocketConnection::close()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fd_ >= 0)
        {
            ::close(fd_);
            fd_ = -1;
        }
    }

    // -----------------------------
    // Listener
    // -----------------------------

    Listener::~Listener()
    {
        close();
    }

    bool Listener::listen(const std::string &address, uint16_t port, int backlog, std::string &err)
    {
        err.clear();
        close();

        addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

        addrinfo *res = nullptr;
        const std::string service = std::to_string(port);
        const int rc = ::getaddrinfo(address.empty() ? nullptr : address.c_str(), service.c_str(), &hints, &res);
        if (rc != 0)
        {
            err = std::string("cannot resolve bind address '") + address + "': " + ::gai_strerror(rc);
            return false;
        }

        for (addrinfo *ai = res; ai != nullptr; ai = ai->ai_next)
        {
            const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0)
            {
                err = errno_message("socket failed");
                continue;
            }
            set_cloexec(fd);

            int one = 1;
            (void)::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

            if (::bind(fd, ai->ai_addr, ai->ai_addrlen) != 0)
            {
                err = errno_message("bind failed");
                ::close(fd);
                continue;
            }
            if (::listen(fd, backlog) != 0)
            {
                err = errno_message("listen failed");
                ::close(fd);
                continue;
            }

            sockaddr_storage bound;
            socklen_t bound_len = sizeof(bound);
            if (::getsockname(fd, reinterpret_cast<sockaddr *>(&bound), &bound_len) == 0)
            {
                if (bound.ss_family == AF_INET)
                {
                    port_ = ntohs(reinterpret_cast<sockaddr_in *>(&bound)->sin_port);
                }
                else if (bound.ss_family == AF_INET6)
                {
                    port_ = ntohs(reinterpret_cast<sockaddr_in6 *>(&bound)->sin6_port);
                }
            }

            fd_ = fd;
            err.clear();
            break;
        }

        ::freeaddrinfo(res);
        if (fd_ < 0 && err.empty())
        {
            err = "no usable bind address";
        }
        return fd_ >= 0;
    }

    std::unique_ptr<SocketConnection> Listener::accept(std::chrono::milliseconds timeout, std::string &err)
    {
        err.clear();

        if (fd_ < 0)
        {
            err = "listener not open";
            return nullptr;
        }

        pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (ready == 0)
        {
            return nullptr;
        }
        if (ready < 0)
        {
            if (errno == EINTR)
            {
                return nullptr;
            }
            err = errno_message("poll failed");
            return nullptr;
        }

        const int fd = ::accept(fd_, nullptr, nullptr);
        if (fd < 0)
        {
            // Peer gave up between poll and accept; not a listener failure.
            if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED)
            {
                return nullptr;
            }
            err = errno_message("accept failed");
            return nullptr;
        }

        set_cloexec(fd);
        set_no_delay(fd);
        return std::make_unique<SocketConnection>(fd);
    }

    void Listener::close()
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
            fd_ = -1;
        }
    }

    // -----------------------------
    // Client side
    // -----------------------------

    std::unique_ptr<SocketConnection> connect_tcp(const std::string &host, uint16_t port, std::string &err)
    {
        err.clear();

        addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_flags = AI_NUMERICSERV;

        addrinfo *res = nullptr;
        const std::string service = std::to_string(port);
        const int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
        if (rc != 0)
        {
            err = "cannot resolve '" + host + "': " + ::gai_strerror(rc);
            return nullptr;
        }

        int connected = -1;
        for (addrinfo *ai = res; ai != nullptr; ai = ai->ai_next)
        {
            const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0)
            {
                err = errno_message("socket failed");
                continue;
            }
            set_cloexec(fd);

            if (::connect(fd, ai->ai_addr, ai->ai_addrlen) != 0)
            {
                err = errno_message("connect failed");
                ::close(fd);
                continue;
            }

            connected = fd;
            break;
        }
        ::freeaddrinfo(res);

        if (connected < 0)
        {
            if (err.empty())
            {
                err = "no usable address for '" + host + "'";
            }
            return nullptr;
        }

        err.clear();
        set_no_delay(connected);
        return std::make_unique<SocketConnection>(connected);
    }

    bool make_socket_pair(std::unique_ptr<SocketConnection> &a, std::unique_ptr<SocketConnection> &b,
                          std::string &err)
    {
        err.clear();

        int fds[2] = {-1, -1};
        if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0)
        {
            err = errno_message("socketpair failed");
            return false;
        }

        a = std::make_unique<SocketConnection>(fds[0]);
        b = std::make_unique<SocketConnection>(fds[1]);
        return true;
    }

} // namespace transport
