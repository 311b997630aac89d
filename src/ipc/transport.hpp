#pragma once

#include "codec.hpp"
#include "message.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace loom::ipc
{

// ─── Connection ──────────────────────────────────────────────────────────────
// Wraps a connected stream socket fd. Provides send/recv of framed Messages.
// One reader thread and one writer thread may use it concurrently; close()
// must only be called once both are done (use shutdown() to unblock them).

enum class RecvStatus : uint8_t
{
    Ok,
    CodecError,    // a whole frame was read but could not be decoded; keep reading
    FramingError,  // frame boundary lost (bad magic / oversized); the channel is unusable
    Closed,        // EOF or I/O error
};

struct RecvResult
{
    RecvStatus status = RecvStatus::Closed;
    CodecError error  = CodecError::None;
    Message    message;
};

class Connection
{
   public:
    explicit Connection(int fd);
    ~Connection();

    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;

    // Creates a connected pair of stream sockets (socketpair).
    // Both ends are close-on-exec. Returns {nullptr, nullptr} on failure.
    static std::pair<std::unique_ptr<Connection>, std::unique_ptr<Connection>> pair();

    // Returns true if the underlying fd is valid.
    bool is_open() const { return fd_ >= 0; }

    // Send a complete message. Returns false on I/O error or if the message
    // type cannot be encoded.
    bool send(const Message& msg);

    // Receive one frame (blocking) and decode it.
    RecvResult recv();

    // Wakes up a thread blocked in recv()/send() without releasing the fd.
    void shutdown();

    // Close the connection.
    void close();

    int fd() const { return fd_; }

    // Gives up ownership of the fd without closing it.
    int release();

   private:
    int fd_ = -1;

    // Internal: read exactly `len` bytes into `buf`. Returns false on error/EOF.
    bool read_exact(uint8_t* buf, size_t len);
    // Internal: write exactly `len` bytes from `buf`. Returns false on error.
    bool write_exact(const uint8_t* buf, size_t len);
};

// ─── Server ──────────────────────────────────────────────────────────────────
// Listens on a Unix domain socket for content producers.

class Server
{
   public:
    Server();
    ~Server();

    Server(const Server&)            = delete;
    Server& operator=(const Server&) = delete;

    // Bind and listen on the given socket path.
    // Returns true on success. Removes stale socket file if present.
    bool listen(const std::string& path);

    // Accept a new connection (non-blocking).
    // Returns nullptr immediately if no pending connection.
    std::unique_ptr<Connection> try_accept();

    // Close the listening socket and remove the socket file.
    void close();

    bool               is_listening() const { return listen_fd_ >= 0; }
    int                listen_fd() const { return listen_fd_; }
    const std::string& path() const { return path_; }

   private:
    int         listen_fd_ = -1;
    std::string path_;
};

// ─── Client ──────────────────────────────────────────────────────────────────

class Client
{
   public:
    // Connect to the server at the given socket path.
    // Returns a Connection on success, nullptr on failure.
    static std::unique_ptr<Connection> connect(const std::string& path);
};

// ─── Utility ─────────────────────────────────────────────────────────────────

// Returns the default producer socket path for this process:
//   $XDG_RUNTIME_DIR/loom-<pid>.sock
// Falls back to /tmp/loom-<pid>.sock if XDG_RUNTIME_DIR is not set.
std::string default_socket_path();

}   // namespace loom::ipc
