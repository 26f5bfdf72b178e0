#include "chunkvault/server/upload_engine.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <vector>

#include <spdlog/spdlog.h>

#include "chunkvault/content_range.hpp"
#include "chunkvault/error_codes.hpp"

namespace chunkvault::server
{

    namespace
    {

        using protocol::UploadStatus;

        template <typename Operation>
        auto call_store(std::string_view what, Operation &&operation)
        {
            try
            {
                return operation();
            }
            catch (const UploadError &)
            {
                throw;
            }
            catch (const std::exception &ex)
            {
                throw UploadError(ErrorCode::StorageFailure, std::string(what) + " failed: " + ex.what());
            }
        }

    } // namespace

    UploadEngine::UploadEngine(BlobStore &store, UploadEngineOptions options, SessionRegistry::ClockFunction clock)
        : store_(store), options_(options), registry_(std::move(clock))
    {
    }

    UploadEngine::~UploadEngine()
    {
        const auto aborted = registry_.abort_all("engine shutting down");
        if (aborted > 0)
        {
            spdlog::warn("Aborted {} unfinished uploads", aborted);
        }
    }

    std::string UploadEngine::init_upload(const std::string &owner_id, std::uint64_t total_size,
                                          ObjectMetadata metadata)
    {
        if (total_size == 0)
        {
            throw UploadError(ErrorCode::InvalidSize, "Declared size must be positive");
        }
        if (total_size > options_.max_upload_size)
        {
            throw UploadError(ErrorCode::InvalidSize,
                              "Declared size exceeds the limit of " + std::to_string(options_.max_upload_size) +
                                  " bytes");
        }

        metadata.total_size = total_size;
        metadata.owner_id = owner_id;
        auto blob_sink = call_store("Opening blob sink", [&]
                                    { return store_.open_sink(metadata); });
        auto sink = std::make_unique<StreamingSink>(std::move(blob_sink), options_.sink);

        auto session = registry_.create(owner_id, total_size, std::move(sink), std::move(metadata));
        spdlog::info("Upload {} started by {} ({} bytes, '{}')", session->session_id, owner_id, total_size,
                     session->metadata.filename);
        return session->session_id;
    }

    protocol::ChunkResult UploadEngine::append_chunk(const std::string &session_id, const std::string &owner_id,
                                                     std::string_view range_header, ByteStream &body,
                                                     std::optional<std::uint64_t> declared_length)
    {
        auto session = acquire(session_id, owner_id);
        std::unique_lock lock(session->mutex);
        if (protocol::is_terminal(session->status))
        {
            // Reaped or cancelled while this request waited for the session.
            throw UploadError(ErrorCode::NotFound, "Unknown upload session");
        }

        if (!declared_length || *declared_length == 0)
        {
            throw UploadError(ErrorCode::InvalidContentLength, "Chunk requires a positive Content-Length");
        }
        const auto range = protocol::parse_content_range(range_header);
        if (range.total != session->total_size)
        {
            throw UploadError(ErrorCode::TotalMismatch,
                              "Range total " + std::to_string(range.total) + " does not match declared size " +
                                  std::to_string(session->total_size));
        }
        const std::uint64_t received = session->received_size;
        if (range.start != received)
        {
            throw UploadError(ErrorCode::OutOfOrderChunk,
                              "Expected chunk at offset " + std::to_string(received) + ", got " +
                                  std::to_string(range.start),
                              received);
        }
        if (*declared_length != range.length())
        {
            throw UploadError(ErrorCode::InvalidContentLength,
                              "Content-Length " + std::to_string(*declared_length) + " does not match range length " +
                                  std::to_string(range.length()));
        }

        if (session->status == UploadStatus::Pending)
        {
            session->status = UploadStatus::Uploading;
        }

        auto &sink = *session->sink;
        std::vector<std::byte> buffer(sink.write_size());
        std::uint64_t remaining = range.length();
        bool body_ended = false;
        while (remaining > 0)
        {
            const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
            std::size_t count = 0;
            try
            {
                count = body.read(std::span(buffer).first(want));
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Upload {}: request body interrupted: {}", session_id, ex.what());
                body_ended = true;
                break;
            }
            if (count == 0)
            {
                body_ended = true;
                break;
            }

            try
            {
                if (!sink.write(std::span<const std::byte>(buffer).first(count)))
                {
                    sink.await_drain();
                }
            }
            catch (const UploadError &ex)
            {
                // A write after an asynchronous store failure only sees SinkClosed.
                const auto failure = sink.failure();
                spdlog::error("Upload {} failed while writing: {}", session_id, ex.what());
                fail_session(*session, ex.what());
                if (failure)
                {
                    std::rethrow_exception(failure);
                }
                throw;
            }
            session->received_size += count;
            remaining -= count;
        }

        session->last_activity = registry_.now();
        const std::uint64_t now_received = session->received_size;

        if (body_ended && remaining > 0)
        {
            throw UploadError(ErrorCode::IncompleteChunk,
                              "Chunk ended after " + std::to_string(range.length() - remaining) + " of " +
                                  std::to_string(range.length()) + " bytes",
                              now_received);
        }

        spdlog::debug("Upload {}: accepted bytes {}-{}, {}/{} received", session_id, range.start, range.end,
                      now_received, session->total_size);

        if (now_received < session->total_size)
        {
            return {.complete = false, .received_size = now_received};
        }

        ObjectHandle handle;
        try
        {
            handle = sink.end();
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Upload {} failed to finalize: {}", session_id, ex.what());
            fail_session(*session, ex.what());
            throw UploadError(ErrorCode::StorageFailure, std::string("Finalize failed: ") + ex.what(), now_received);
        }

        session->status = UploadStatus::Completed;
        session->sink.reset();
        registry_.remove(session_id);
        spdlog::info("Upload {} completed as {}/{} ({} bytes)", session_id, handle.provider, handle.id, handle.size);
        return {.complete = true, .received_size = now_received, .object = handle};
    }

    void UploadEngine::cancel_upload(const std::string &session_id, const std::string &owner_id)
    {
        auto session = registry_.find(session_id);
        if (!session)
        {
            return;
        }
        if (session->owner_id != owner_id)
        {
            throw UploadError(ErrorCode::Forbidden, "Upload belongs to another owner");
        }

        std::lock_guard lock(session->mutex);
        if (protocol::is_terminal(session->status))
        {
            return;
        }
        session->status = UploadStatus::Cancelled;
        session->sink->abort("cancelled by owner");
        session->sink.reset();
        registry_.remove(session_id);
        spdlog::info("Upload {} cancelled at {}/{} bytes", session_id, session->received_size.load(),
                     session->total_size);
    }

    protocol::UploadProgress UploadEngine::query_upload(const std::string &session_id,
                                                        const std::string &owner_id) const
    {
        auto session = acquire(session_id, owner_id);
        const auto status = session->status.load();
        if (protocol::is_terminal(status))
        {
            throw UploadError(ErrorCode::NotFound, "Unknown upload session");
        }
        return {
            .session_id = session_id,
            .status = status,
            .received_size = session->received_size,
            .total_size = session->total_size,
        };
    }

    std::unique_ptr<ByteStream> UploadEngine::open_download(const ObjectHandle &handle)
    {
        return call_store("Opening object", [&]
                          { return store_.open_read_stream(handle); });
    }

    void UploadEngine::delete_object(const ObjectHandle &handle)
    {
        call_store("Deleting object", [&]
                   { store_.remove(handle); });
        spdlog::info("Deleted object {}/{}", handle.provider, handle.id);
    }

    std::size_t UploadEngine::reap_idle()
    {
        return registry_.reap_idle(options_.idle_timeout);
    }

    std::size_t UploadEngine::shutdown(const std::string &reason)
    {
        return registry_.abort_all(reason);
    }

    std::shared_ptr<UploadSession> UploadEngine::acquire(const std::string &session_id,
                                                         const std::string &owner_id) const
    {
        auto session = registry_.get(session_id);
        if (session->owner_id != owner_id)
        {
            throw UploadError(ErrorCode::Forbidden, "Upload belongs to another owner");
        }
        return session;
    }

    void UploadEngine::fail_session(UploadSession &session, const std::string &reason)
    {
        session.status = UploadStatus::Failed;
        if (session.sink)
        {
            session.sink->abort(reason);
            session.sink.reset();
        }
        registry_.remove(session.session_id);
    }

} // namespace chunkvault::server
