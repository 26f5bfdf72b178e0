#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

#include "chunkvault/server/blob_store.hpp"

namespace chunkvault::server
{

    // Picks a backend per upload and sends handle operations to the backend named by the handle.
    class RoutingBlobStore : public BlobStore
    {
    public:
        static constexpr std::uint64_t kDefaultRemoteThreshold = 50ULL * 1024 * 1024;

        // remote may be null when no remote backend is configured.
        RoutingBlobStore(BlobStore &local, BlobStore *remote,
                         std::uint64_t remote_threshold = kDefaultRemoteThreshold);

        std::string_view provider() const noexcept override { return "routing"; }

        std::unique_ptr<BlobSink> open_sink(const ObjectMetadata &metadata) override;

        std::unique_ptr<ByteStream> open_read_stream(const ObjectHandle &handle) override;

        void remove(const ObjectHandle &handle) override;

        // Backend that open_sink would use for metadata. Throws UploadError(Unsupported).
        BlobStore &select(const ObjectMetadata &metadata) const;

    private:
        BlobStore &backend_for(std::string_view provider) const;

        BlobStore &local_;
        BlobStore *remote_;
        std::uint64_t remote_threshold_;
    };

} // namespace chunkvault::server
