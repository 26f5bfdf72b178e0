#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "chunkvault/protocol.hpp"
#include "chunkvault/server/blob_store.hpp"
#include "chunkvault/server/session_registry.hpp"
#include "chunkvault/server/streaming_sink.hpp"

namespace chunkvault::server
{

    struct UploadEngineOptions
    {
        StreamingSinkOptions sink{};
        std::chrono::seconds idle_timeout{std::chrono::seconds{3600}};
        std::uint64_t max_upload_size{5ULL * 1024 * 1024 * 1024};
    };

    class UploadEngine
    {
    public:
        UploadEngine(BlobStore &store, UploadEngineOptions options = {},
                     SessionRegistry::ClockFunction clock = {});
        ~UploadEngine();

        UploadEngine(const UploadEngine &) = delete;
        UploadEngine &operator=(const UploadEngine &) = delete;

        std::string init_upload(const std::string &owner_id, std::uint64_t total_size, ObjectMetadata metadata);

        // declared_length is the request's Content-Length, if it had one.
        protocol::ChunkResult append_chunk(const std::string &session_id, const std::string &owner_id,
                                           std::string_view range_header, ByteStream &body,
                                           std::optional<std::uint64_t> declared_length);

        void cancel_upload(const std::string &session_id, const std::string &owner_id);

        protocol::UploadProgress query_upload(const std::string &session_id, const std::string &owner_id) const;

        std::unique_ptr<ByteStream> open_download(const ObjectHandle &handle);

        void delete_object(const ObjectHandle &handle);

        std::size_t reap_idle();

        // Aborts every live upload; used on shutdown.
        std::size_t shutdown(const std::string &reason);

        SessionRegistry &registry() noexcept { return registry_; }
        const SessionRegistry &registry() const noexcept { return registry_; }
        const UploadEngineOptions &options() const noexcept { return options_; }

    private:
        std::shared_ptr<UploadSession> acquire(const std::string &session_id, const std::string &owner_id) const;
        void fail_session(UploadSession &session, const std::string &reason);

        BlobStore &store_;
        UploadEngineOptions options_;
        SessionRegistry registry_;
    };

} // namespace chunkvault::server
