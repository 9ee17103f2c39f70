#include "transport.hpp"

#include "codec.hpp"

#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace vesper::ipc
{

// Waits until `fd` is readable.  False on timeout or error.
static bool wait_readable(int fd, std::chrono::milliseconds timeout)
{
    struct pollfd pfd
    {
    };
    pfd.fd     = fd;
    pfd.events = POLLIN;

    int rc = 0;
    do
    {
        rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while (rc < 0 && errno == EINTR);
    return rc > 0;
}

// ─── Connection ──────────────────────────────────────────────────────────────

Connection::Connection(int fd)
    : fd_(fd)
{
}

Connection::~Connection()
{
    close();
}

Connection::Connection(Connection&& other) noexcept
    : fd_(other.fd_)
{
    other.fd_ = -1;
}

Connection& Connection::operator=(Connection&& other) noexcept
{
    if (this != &other)
    {
        close();
        fd_       = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

bool Connection::read_exact(uint8_t* buf, size_t len)
{
    size_t total = 0;
    while (total < len)
    {
        auto n = ::read(fd_, buf + total, len - total);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return false;   // EOF or error
        total += static_cast<size_t>(n);
    }
    return true;
}

bool Connection::write_exact(const uint8_t* buf, size_t len)
{
    size_t total = 0;
    while (total < len)
    {
        auto n = ::send(fd_, buf + total, len - total, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

bool Connection::send(const Message& msg)
{
    if (fd_ < 0)
        return false;
    if (msg.payload.size() > MAX_PAYLOAD_SIZE)
        return false;
    auto wire = encode_message(msg);
    return write_exact(wire.data(), wire.size());
}

std::optional<Message> Connection::recv()
{
    if (fd_ < 0)
        return std::nullopt;

    // Read fixed header
    uint8_t hdr_buf[HEADER_SIZE];
    if (!read_exact(hdr_buf, HEADER_SIZE))
        return std::nullopt;

    auto hdr_opt = decode_header(std::span<const uint8_t>(hdr_buf, HEADER_SIZE));
    if (!hdr_opt)
        return std::nullopt;

    auto& hdr = *hdr_opt;
    if (hdr.payload_len > MAX_PAYLOAD_SIZE)
        return std::nullopt;

    Message msg;
    msg.header = hdr;
    msg.payload.resize(hdr.payload_len);

    if (hdr.payload_len > 0)
    {
        if (!read_exact(msg.payload.data(), hdr.payload_len))
            return std::nullopt;
    }

    return msg;
}

std::optional<Message> Connection::recv_for(std::chrono::milliseconds timeout)
{
    if (fd_ < 0 || !wait_readable(fd_, timeout))
        return std::nullopt;
    return recv();
}

void Connection::shutdown()
{
    if (fd_ >= 0)
        ::shutdown(fd_, SHUT_RDWR);
}

void Connection::close()
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

// ─── Server ──────────────────────────────────────────────────────────────────

Server::Server() = default;

Server::~Server()
{
    close();
}

bool Server::listen(const std::string& path)
{
    // Remove stale socket file
    ::unlink(path.c_str());

    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0)
        return false;

    struct sockaddr_un addr
    {
    };
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path))
    {
        ::close(fd);
        return false;
    }
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0)
    {
        ::close(fd);
        return false;
    }

    // Set socket file permissions to owner-only
    ::chmod(path.c_str(), 0700);

    if (::listen(fd, 4) < 0)
    {
        ::close(fd);
        ::unlink(path.c_str());
        return false;
    }

    listen_fd_ = fd;
    path_      = path;
    return true;
}

std::unique_ptr<Connection> Server::accept()
{
    if (listen_fd_ < 0)
        return nullptr;

    struct sockaddr_un client_addr
    {
    };
    socklen_t client_len = sizeof(client_addr);
    int       client_fd =
        ::accept(listen_fd_, reinterpret_cast<struct sockaddr*>(&client_addr), &client_len);
    if (client_fd < 0)
        return nullptr;

    return std::make_unique<Connection>(client_fd);
}

std::unique_ptr<Connection> Server::accept_for(std::chrono::milliseconds timeout)
{
    if (listen_fd_ < 0 || !wait_readable(listen_fd_, timeout))
        return nullptr;
    return accept();
}

void Server::close()
{
    if (listen_fd_ >= 0)
    {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    if (!path_.empty())
    {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

// ─── Client ──────────────────────────────────────────────────────────────────

std::unique_ptr<Connection> Client::connect(const std::string& path)
{
    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0)
        return nullptr;

    struct sockaddr_un addr
    {
    };
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path))
    {
        ::close(fd);
        return nullptr;
    }
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0)
    {
        ::close(fd);
        return nullptr;
    }

    return std::make_unique<Connection>(fd);
}

// ─── Utility ─────────────────────────────────────────────────────────────────

std::string engine_socket_path()
{
    static std::atomic<uint32_t> counter{0};

    std::string dir;
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && xdg[0] != '\0')
        dir = xdg;
    else
        dir = "/tmp";

    return dir + "/vesper-" + std::to_string(::getpid()) + "-"
           + std::to_string(counter.fetch_add(1)) + ".sock";
}

}   // namespace vesper::ipc
