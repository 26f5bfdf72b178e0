#include "chunkvault/server/routing_blob_store.hpp"

#include <string>

#include <spdlog/spdlog.h>

#include "chunkvault/error_codes.hpp"

namespace chunkvault::server
{

    RoutingBlobStore::RoutingBlobStore(BlobStore &local, BlobStore *remote, std::uint64_t remote_threshold)
        : local_(local), remote_(remote), remote_threshold_(remote_threshold)
    {
    }

    std::unique_ptr<BlobSink> RoutingBlobStore::open_sink(const ObjectMetadata &metadata)
    {
        auto &backend = select(metadata);
        spdlog::debug("Routing '{}' ({} bytes) to {}", metadata.filename, metadata.total_size, backend.provider());
        return backend.open_sink(metadata);
    }

    std::unique_ptr<ByteStream> RoutingBlobStore::open_read_stream(const ObjectHandle &handle)
    {
        return backend_for(handle.provider).open_read_stream(handle);
    }

    void RoutingBlobStore::remove(const ObjectHandle &handle)
    {
        backend_for(handle.provider).remove(handle);
    }

    BlobStore &RoutingBlobStore::select(const ObjectMetadata &metadata) const
    {
        if (metadata.provider && !metadata.provider->empty())
        {
            return backend_for(*metadata.provider);
        }
        if (remote_ && metadata.total_size > remote_threshold_)
        {
            return *remote_;
        }
        return local_;
    }

    BlobStore &RoutingBlobStore::backend_for(std::string_view provider) const
    {
        if (provider == local_.provider())
        {
            return local_;
        }
        if (remote_ && provider == remote_->provider())
        {
            return *remote_;
        }
        throw UploadError(ErrorCode::Unsupported, "Storage provider '" + std::string(provider) + "' is not available");
    }

} // namespace chunkvault::server
