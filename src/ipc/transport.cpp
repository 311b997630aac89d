#include "transport.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>

#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace loom::ipc
{

// ─── Connection ──────────────────────────────────────────────────────────────

Connection::Connection(int fd) : fd_(fd) {}

Connection::~Connection()
{
    close();
}

Connection::Connection(Connection&& other) noexcept : fd_(other.fd_)
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

std::pair<std::unique_ptr<Connection>, std::unique_ptr<Connection>> Connection::pair()
{
    int fds[2] = {-1, -1};
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) < 0)
        return {nullptr, nullptr};
    return {std::make_unique<Connection>(fds[0]), std::make_unique<Connection>(fds[1])};
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
        // MSG_NOSIGNAL: a dead peer must surface as an error, not SIGPIPE
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
    auto wire = encode_message(msg);
    if (wire.empty())
        return false;
    return write_exact(wire.data(), wire.size());
}

RecvResult Connection::recv()
{
    RecvResult result;
    if (fd_ < 0)
        return result;

    // Read fixed header
    std::vector<uint8_t> frame(HEADER_SIZE);
    if (!read_exact(frame.data(), HEADER_SIZE))
        return result;

    size_t     frame_len = 0;
    CodecError framing   = peek_frame_length(frame, frame_len);
    if (framing != CodecError::None)
    {
        result.status = RecvStatus::FramingError;
        result.error  = framing;
        return result;
    }

    frame.resize(frame_len);
    if (frame_len > HEADER_SIZE && !read_exact(frame.data() + HEADER_SIZE, frame_len - HEADER_SIZE))
        return result;

    auto decoded = decode_message(frame);
    if (!decoded.ok())
    {
        result.status = RecvStatus::CodecError;
        result.error  = decoded.error;
        return result;
    }

    result.status  = RecvStatus::Ok;
    result.message = std::move(decoded.message);
    return result;
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

int Connection::release()
{
    int fd = fd_;
    fd_    = -1;
    return fd;
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

    // Non-blocking listen socket: try_accept() is called from the control loop
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
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

    if (::listen(fd, 8) < 0)
    {
        ::close(fd);
        ::unlink(path.c_str());
        return false;
    }

    listen_fd_ = fd;
    path_      = path;
    return true;
}

std::unique_ptr<Connection> Server::try_accept()
{
    if (listen_fd_ < 0)
        return nullptr;

    struct sockaddr_un client_addr
    {
    };
    socklen_t client_len = sizeof(client_addr);
    int       client_fd  = ::accept4(listen_fd_,
                              reinterpret_cast<struct sockaddr*>(&client_addr),
                              &client_len,
                              SOCK_CLOEXEC);
    if (client_fd < 0)
        return nullptr;   // EAGAIN or error, no pending connection

    return std::make_unique<Connection>(client_fd);
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
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
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

std::string default_socket_path()
{
    std::string dir;
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && xdg[0] != '\0')
        dir = xdg;
    else
        dir = "/tmp";

    return dir + "/loom-" + std::to_string(::getpid()) + ".sock";
}

}   // namespace loom::ipc
