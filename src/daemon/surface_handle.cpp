#include "surface_handle.hpp"

#include "process_manager.hpp"

#include <loom/logger.hpp>

namespace loom::daemon
{

std::string_view send_error_name(SendError err)
{
    switch (err)
    {
        case SendError::None:
            return "none";
        case SendError::Backpressure:
            return "backpressure";
        case SendError::Closed:
            return "closed";
        case SendError::Unencodable:
            return "unencodable";
    }
    return "unknown";
}

SurfaceHandle::SurfaceHandle(ipc::SurfaceId                   id,
                             ipc::SurfaceRole                 role,
                             ipc::ProcessId                   pid,
                             std::unique_ptr<ipc::Connection> channel,
                             size_t                           queue_capacity,
                             SurfaceLauncher*                 launcher)
    : id_(id),
      role_(role),
      pid_(pid),
      capacity_(queue_capacity > 0 ? queue_capacity : 1),
      channel_(std::move(channel)),
      launcher_(launcher)
{
}

SurfaceHandle::~SurfaceHandle()
{
    finish_close();
}

void SurfaceHandle::start(ChannelCallbacks callbacks)
{
    callbacks_ = std::move(callbacks);
    if (!channel_ || !channel_->is_open())
    {
        set_alive(false);
        return;
    }
    reader_ = std::thread([this] { reader_loop(); });
    writer_ = std::thread([this] { writer_loop(); });
}

SendError SurfaceHandle::send(ipc::Message msg)
{
    if (!ipc::find_type(msg.type))
        return SendError::Unencodable;
    if (msg.payload.size() > ipc::MAX_PAYLOAD_SIZE)
    {
        LOOM_LOG_WARN("surface",
                      "Surface {}: refusing {} with {} byte payload",
                      id_,
                      msg.type,
                      msg.payload.size());
        return SendError::Unencodable;
    }

    {
        std::lock_guard lock(mu_);
        if (stop_ || write_failed_ || closing_.load(std::memory_order_acquire))
            return SendError::Closed;
        if (queue_.size() >= capacity_)
            return SendError::Backpressure;

        msg.seq = next_seq_++;
        queue_.push_back(std::move(msg));
    }
    cv_.notify_all();
    return SendError::None;
}

size_t SurfaceHandle::queued() const
{
    std::lock_guard lock(mu_);
    return queue_.size();
}

// ─── Close ───────────────────────────────────────────────────────────────────

void SurfaceHandle::begin_close()
{
    closing_.store(true, std::memory_order_release);
}

bool SurfaceHandle::drained() const
{
    std::lock_guard lock(mu_);
    // A broken channel will never drain; report it as done
    return write_failed_ || (queue_.empty() && !writing_);
}

void SurfaceHandle::finish_close()
{
    if (finished_)
        return;
    finished_ = true;
    closing_.store(true, std::memory_order_release);

    {
        std::lock_guard lock(mu_);
        stop_    = true;
        dropped_ = queue_.size();
        queue_.clear();
    }
    cv_.notify_all();

    if (dropped_ > 0)
        LOOM_LOG_WARN("surface", "Surface {} closed with {} undelivered messages", id_, dropped_);

    if (launcher_ && pid_ > 0)
        launcher_->terminate(pid_);

    if (channel_)
        channel_->shutdown();
    if (reader_.joinable())
        reader_.join();
    if (writer_.joinable())
        writer_.join();
    if (channel_)
        channel_->close();

    set_alive(false);
}

void SurfaceHandle::close(std::chrono::milliseconds drain_timeout)
{
    begin_close();
    {
        std::unique_lock lock(mu_);
        cv_.wait_for(lock,
                     drain_timeout,
                     [this] { return write_failed_ || (queue_.empty() && !writing_); });
    }
    finish_close();
}

// ─── Threads ─────────────────────────────────────────────────────────────────

void SurfaceHandle::reader_loop()
{
    for (;;)
    {
        auto result = channel_->recv();
        switch (result.status)
        {
            case ipc::RecvStatus::Ok:
                if (callbacks_.on_message)
                    callbacks_.on_message(id_, std::move(result.message));
                break;

            case ipc::RecvStatus::CodecError:
                LOOM_LOG_WARN("codec",
                              "Surface {}: dropped frame ({})",
                              id_,
                              ipc::codec_error_name(result.error));
                if (callbacks_.on_codec_error)
                    callbacks_.on_codec_error(id_, result.error);
                break;

            case ipc::RecvStatus::FramingError:
            case ipc::RecvStatus::Closed:
            {
                bool framing = result.status == ipc::RecvStatus::FramingError;
                if (framing)
                    LOOM_LOG_ERROR("codec",
                                   "Surface {}: framing lost ({}), closing channel",
                                   id_,
                                   ipc::codec_error_name(result.error));
                else
                    LOOM_LOG_DEBUG("surface", "Surface {}: channel EOF", id_);
                report_closed(framing);
                return;
            }
        }
    }
}

void SurfaceHandle::writer_loop()
{
    std::unique_lock lock(mu_);
    for (;;)
    {
        cv_.wait(lock, [this] { return stop_ || !queue_.empty(); });
        if (stop_)
            return;

        ipc::Message msg = std::move(queue_.front());
        queue_.pop_front();
        writing_ = true;

        lock.unlock();
        bool ok = channel_->send(msg);
        lock.lock();

        writing_ = false;
        if (!ok)
        {
            // send() only queues encodable messages, so this is an I/O error
            write_failed_ = true;
            queue_.clear();
            cv_.notify_all();
            lock.unlock();
            LOOM_LOG_WARN("surface", "Surface {}: write failed, channel broken", id_);
            report_closed(false);
            return;
        }
        cv_.notify_all();
    }
}

void SurfaceHandle::report_closed(bool framing_error)
{
    {
        std::lock_guard lock(mu_);
        if (stop_ || close_reported_)
            return;   // our own shutdown, or the other thread got here first
        close_reported_ = true;
    }
    set_alive(false);
    if (callbacks_.on_channel_closed)
        callbacks_.on_channel_closed(id_, framing_error);
}

}   // namespace loom::daemon
