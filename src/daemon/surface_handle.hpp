#pragma once

#include "../ipc/codec.hpp"
#include "../ipc/message.hpp"
#include "../ipc/transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>

namespace loom::daemon
{

class SurfaceLauncher;

enum class SendError : uint8_t
{
    None = 0,
    Backpressure,   // outbound queue full; batch or retry
    Closed,         // handle is closing or its channel is gone
    Unencodable,    // type not in the registry, or payload over MAX_PAYLOAD_SIZE
};

std::string_view send_error_name(SendError err);

// Callbacks run on the handle's reader thread. They must only hand the event
// over to the control loop, never touch coordination state directly.
struct ChannelCallbacks
{
    std::function<void(ipc::SurfaceId, ipc::Message)>    on_message;
    std::function<void(ipc::SurfaceId, ipc::CodecError)> on_codec_error;
    // Channel hit EOF, a read or write error, or lost framing. Fires at most
    // once per handle. `framing_error` is set only for lost framing.
    std::function<void(ipc::SurfaceId, bool framing_error)> on_channel_closed;
};

// Owns one surface's channel: a bounded outbound queue drained by a writer
// thread, and a reader thread that decodes inbound frames.
//
// send() never blocks. All sends for the surface go through this queue, so
// the channel has exactly one writer and per-channel FIFO order holds.
class SurfaceHandle
{
   public:
    SurfaceHandle(ipc::SurfaceId                   id,
                  ipc::SurfaceRole                 role,
                  ipc::ProcessId                   pid,
                  std::unique_ptr<ipc::Connection> channel,
                  size_t                           queue_capacity,
                  SurfaceLauncher*                 launcher = nullptr);
    ~SurfaceHandle();

    SurfaceHandle(const SurfaceHandle&)            = delete;
    SurfaceHandle& operator=(const SurfaceHandle&) = delete;

    // Start the reader and writer threads.
    void start(ChannelCallbacks callbacks);

    // Stamp the next outbound sequence number and enqueue. A message the
    // codec would refuse is rejected here and never reaches the channel.
    SendError send(ipc::Message msg);

    // Last-known liveness; updated by the liveness monitor, not polled.
    bool is_alive() const { return alive_.load(std::memory_order_acquire); }
    void set_alive(bool alive) { alive_.store(alive, std::memory_order_release); }

    // ── Close ────────────────────────────────────────────────────────────
    // Non-blocking pair for the control loop:
    //   begin_close()  stop accepting sends; the writer keeps draining
    //   drained()      queue is empty and nothing is mid-write
    //   finish_close() drop what is left, terminate the process, release the channel
    void begin_close();
    bool drained() const;
    void finish_close();

    // Blocking convenience: begin_close, wait for drained() up to
    // `drain_timeout`, finish_close.
    void close(std::chrono::milliseconds drain_timeout);

    bool is_closing() const { return closing_.load(std::memory_order_acquire); }
    bool is_finished() const { return finished_; }

    ipc::SurfaceId   id() const { return id_; }
    ipc::SurfaceRole role() const { return role_; }
    ipc::ProcessId   pid() const { return pid_; }
    size_t           queue_capacity() const { return capacity_; }
    size_t           queued() const;

    // Number of messages dropped by finish_close().
    size_t dropped() const { return dropped_; }

   private:
    void reader_loop();
    void writer_loop();
    void report_closed(bool framing_error);

    const ipc::SurfaceId   id_;
    const ipc::SurfaceRole role_;
    const ipc::ProcessId   pid_;
    const size_t           capacity_;

    std::unique_ptr<ipc::Connection> channel_;
    SurfaceLauncher*                 launcher_ = nullptr;
    ChannelCallbacks                 callbacks_;

    mutable std::mutex       mu_;
    std::condition_variable  cv_;
    std::deque<ipc::Message> queue_;
    ipc::Sequence            next_seq_  = 1;
    bool                     writing_   = false;
    bool                     stop_      = false;
    bool                     write_failed_ = false;
    bool                     close_reported_ = false;

    std::atomic<bool> alive_{true};
    std::atomic<bool> closing_{false};
    bool              finished_ = false;
    size_t            dropped_  = 0;

    std::thread reader_;
    std::thread writer_;
};

}   // namespace loom::daemon
