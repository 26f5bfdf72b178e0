#include "chunkvault/server/streaming_sink.hpp"

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "chunkvault/error_codes.hpp"

namespace chunkvault::server
{

    namespace
    {

        std::exception_ptr as_storage_failure(std::string_view operation)
        {
            try
            {
                throw;
            }
            catch (const UploadError &)
            {
                return std::current_exception();
            }
            catch (const std::exception &ex)
            {
                return std::make_exception_ptr(
                    UploadError(ErrorCode::StorageFailure, std::string(operation) + " failed: " + ex.what()));
            }
            catch (...)
            {
                return std::make_exception_ptr(
                    UploadError(ErrorCode::StorageFailure, std::string(operation) + " failed"));
            }
        }

    } // namespace

    std::string_view to_string(StreamingSink::State state) noexcept
    {
        switch (state)
        {
        case StreamingSink::State::Open:
            return "open";
        case StreamingSink::State::Ending:
            return "ending";
        case StreamingSink::State::Finished:
            return "finished";
        case StreamingSink::State::Failed:
            return "failed";
        case StreamingSink::State::Aborted:
            return "aborted";
        }
        return "unknown";
    }

    StreamingSink::StreamingSink(std::unique_ptr<BlobSink> sink, StreamingSinkOptions options)
        : sink_(std::move(sink)), options_(options)
    {
        if (!sink_)
        {
            throw std::invalid_argument("StreamingSink requires a blob sink");
        }
        if (options_.write_size == 0 || options_.high_water_mark < options_.write_size)
        {
            throw std::invalid_argument("StreamingSink high-water mark must be at least the write size");
        }
        worker_ = std::thread([this]
                              { pump(); });
    }

    StreamingSink::~StreamingSink()
    {
        try
        {
            abort("sink destroyed");
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to stop streaming sink: {}", ex.what());
        }
    }

    bool StreamingSink::write(std::span<const std::byte> data)
    {
        if (data.size() > options_.write_size)
        {
            throw std::invalid_argument("StreamingSink write exceeds the configured write size");
        }
        std::unique_lock lock(mutex_);
        // Only a producer that ignored a false return ever waits here.
        space_available_.wait(lock, [&]
                              { return state_ != State::Open || buffered_ + data.size() <= options_.high_water_mark; });
        if (state_ == State::Failed)
        {
            // The store error itself goes to await_drain(), end() and failure().
            throw UploadError(ErrorCode::SinkClosed, "Upload sink failed; no further writes accepted");
        }
        if (state_ != State::Open)
        {
            throw_closed_locked();
        }
        if (!data.empty())
        {
            queue_.emplace_back(data.begin(), data.end());
            buffered_ += data.size();
            peak_buffered_ = std::max(peak_buffered_, buffered_);
            data_ready_.notify_one();
        }
        return has_room_locked();
    }

    void StreamingSink::await_drain()
    {
        std::unique_lock lock(mutex_);
        space_available_.wait(lock, [&]
                              { return state_ == State::Failed || state_ == State::Aborted || has_room_locked(); });
        if (state_ == State::Failed || state_ == State::Aborted)
        {
            throw_closed_locked();
        }
    }

    ObjectHandle StreamingSink::end()
    {
        {
            std::unique_lock lock(mutex_);
            if (state_ == State::Open)
            {
                state_ = State::Ending;
                data_ready_.notify_one();
            }
            settled_.wait(lock, [&]
                          { return settled_locked(); });
        }
        join_worker();

        std::lock_guard lock(mutex_);
        if (state_ == State::Finished && handle_)
        {
            return *handle_;
        }
        throw_closed_locked();
    }

    void StreamingSink::abort(const std::string &reason)
    {
        {
            std::lock_guard lock(mutex_);
            if (!settled_locked())
            {
                state_ = State::Aborted;
                abort_reason_ = reason;
                queue_.clear();
                buffered_ = 0;
            }
            data_ready_.notify_all();
            space_available_.notify_all();
            settled_.notify_all();
        }
        join_worker();
    }

    std::size_t StreamingSink::buffered_bytes() const
    {
        std::lock_guard lock(mutex_);
        return buffered_;
    }

    std::size_t StreamingSink::peak_buffered_bytes() const
    {
        std::lock_guard lock(mutex_);
        return peak_buffered_;
    }

    std::uint64_t StreamingSink::bytes_forwarded() const
    {
        std::lock_guard lock(mutex_);
        return forwarded_;
    }

    StreamingSink::State StreamingSink::state() const
    {
        std::lock_guard lock(mutex_);
        return state_;
    }

    std::exception_ptr StreamingSink::failure() const
    {
        std::lock_guard lock(mutex_);
        return state_ == State::Failed ? error_ : nullptr;
    }

    void StreamingSink::pump()
    {
        while (true)
        {
            std::vector<std::byte> piece;
            {
                std::unique_lock lock(mutex_);
                data_ready_.wait(lock, [&]
                                 { return !queue_.empty() || state_ != State::Open; });
                if (state_ == State::Aborted)
                {
                    break;
                }
                if (queue_.empty())
                {
                    lock.unlock();
                    release_writer(true);
                    return;
                }
                // The piece stays counted in buffered_ until the writer has taken it.
                piece = std::move(queue_.front());
                queue_.pop_front();
            }

            try
            {
                sink_->write(piece);
            }
            catch (...)
            {
                auto error = as_storage_failure("Blob write");
                std::lock_guard lock(mutex_);
                if (state_ != State::Aborted)
                {
                    error_ = std::move(error);
                    state_ = State::Failed;
                }
                queue_.clear();
                buffered_ = 0;
                space_available_.notify_all();
                settled_.notify_all();
                break;
            }

            std::lock_guard lock(mutex_);
            if (state_ == State::Open || state_ == State::Ending)
            {
                buffered_ -= piece.size();
                forwarded_ += piece.size();
                space_available_.notify_all();
            }
        }
        release_writer(false);
    }

    void StreamingSink::release_writer(bool finalize)
    {
        if (!finalize)
        {
            sink_->abort();
            return;
        }

        try
        {
            auto handle = sink_->finalize();
            std::lock_guard lock(mutex_);
            if (state_ == State::Aborted)
            {
                spdlog::warn("Object {} finalized after its upload was aborted", handle.id);
            }
            else
            {
                state_ = State::Finished;
            }
            handle_ = std::move(handle);
            settled_.notify_all();
        }
        catch (...)
        {
            auto error = as_storage_failure("Blob finalize");
            {
                std::lock_guard lock(mutex_);
                if (state_ != State::Aborted)
                {
                    error_ = std::move(error);
                    state_ = State::Failed;
                }
                space_available_.notify_all();
                settled_.notify_all();
            }
            sink_->abort();
        }
    }

    bool StreamingSink::has_room_locked() const
    {
        return buffered_ + options_.write_size <= options_.high_water_mark;
    }

    bool StreamingSink::settled_locked() const
    {
        return state_ == State::Finished || state_ == State::Failed || state_ == State::Aborted;
    }

    void StreamingSink::throw_closed_locked() const
    {
        if (state_ == State::Failed && error_)
        {
            std::rethrow_exception(error_);
        }
        if (state_ == State::Aborted)
        {
            throw UploadError(ErrorCode::SinkClosed, "Upload sink aborted: " + abort_reason_);
        }
        throw UploadError(ErrorCode::SinkClosed, "Upload sink is closed");
    }

    void StreamingSink::join_worker()
    {
        std::lock_guard lock(join_mutex_);
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

} // namespace chunkvault::server
