#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "chunkvault/server/blob_store.hpp"

namespace chunkvault::server
{

    // Content-addressed store on the local filesystem. Sinks write into staging/ and
    // finalize into objects/<2 hex>/<hash>; identical content is stored once.
    class LocalBlobStore : public BlobStore
    {
    public:
        static constexpr std::string_view kProvider = "local";

        explicit LocalBlobStore(std::filesystem::path root);

        std::string_view provider() const noexcept override { return kProvider; }

        std::unique_ptr<BlobSink> open_sink(const ObjectMetadata &metadata) override;

        std::unique_ptr<ByteStream> open_read_stream(const ObjectHandle &handle) override;

        void remove(const ObjectHandle &handle) override;

        // Deletes staging files older than max_age. Returns how many were removed.
        std::size_t cleanup_staging(std::chrono::seconds max_age);

        std::filesystem::path object_path(const std::string &id) const;

        const std::filesystem::path &root() const noexcept { return root_; }
        const std::filesystem::path &staging_dir() const noexcept { return staging_dir_; }
        const std::filesystem::path &objects_dir() const noexcept { return objects_dir_; }

    private:
        std::filesystem::path checked_object_path(const ObjectHandle &handle) const;

        std::filesystem::path root_;
        std::filesystem::path staging_dir_;
        std::filesystem::path objects_dir_;
    };

} // namespace chunkvault::server
