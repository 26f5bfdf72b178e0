#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include "chunkvault/server/blob_store.hpp"

namespace chunkvault::server
{

    struct StreamingSinkOptions
    {
        std::size_t high_water_mark{256 * 1024};
        std::size_t write_size{64 * 1024};
    };

    /**
     * Bounded pipe in front of a BlobSink. A dedicated pump thread forwards queued pieces to the
     * underlying sink; producers see backpressure through write() returning false and await_drain().
     * The buffered byte count, including the piece currently being written, never exceeds the
     * high-water mark.
     */
    class StreamingSink
    {
    public:
        enum class State
        {
            Open,
            Ending,
            Finished,
            Failed,
            Aborted
        };

        StreamingSink(std::unique_ptr<BlobSink> sink, StreamingSinkOptions options = {});
        ~StreamingSink();

        StreamingSink(const StreamingSink &) = delete;
        StreamingSink &operator=(const StreamingSink &) = delete;

        // At most write_size() bytes. Returns false when the caller must await_drain() before the next write.
        bool write(std::span<const std::byte> data);

        void await_drain();

        // Flushes everything, finalizes the underlying sink and returns its handle.
        ObjectHandle end();

        void abort(const std::string &reason);

        std::size_t buffered_bytes() const;
        std::size_t peak_buffered_bytes() const;
        std::uint64_t bytes_forwarded() const;
        State state() const;
        // The backing-store error that moved the sink to Failed, if any.
        std::exception_ptr failure() const;

        std::size_t high_water_mark() const noexcept { return options_.high_water_mark; }
        std::size_t write_size() const noexcept { return options_.write_size; }

    private:
        void pump();
        void release_writer(bool finalize);
        bool has_room_locked() const;
        bool settled_locked() const;
        [[noreturn]] void throw_closed_locked() const;
        void join_worker();

        std::unique_ptr<BlobSink> sink_;
        StreamingSinkOptions options_;

        mutable std::mutex mutex_;
        std::condition_variable data_ready_;
        std::condition_variable space_available_;
        std::condition_variable settled_;
        std::deque<std::vector<std::byte>> queue_;
        std::size_t buffered_{};
        std::size_t peak_buffered_{};
        std::uint64_t forwarded_{};
        State state_{State::Open};
        std::exception_ptr error_;
        std::string abort_reason_;
        std::optional<ObjectHandle> handle_;

        std::mutex join_mutex_;
        std::thread worker_;
    };

    std::string_view to_string(StreamingSink::State state) noexcept;

} // namespace chunkvault::server
