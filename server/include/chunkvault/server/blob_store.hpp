#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "chunkvault/protocol.hpp"

namespace chunkvault::server
{

    using ObjectHandle = chunkvault::protocol::ObjectHandle;

    // Pull-based byte source: request bodies on the way in, stored objects on the way out.
    class ByteStream
    {
    public:
        virtual ~ByteStream() = default;

        // Returns 0 only at end of stream.
        virtual std::size_t read(std::span<std::byte> buffer) = 0;
    };

    struct ObjectMetadata
    {
        std::string filename;
        std::string content_type{"application/octet-stream"};
        std::uint64_t total_size{};
        std::string owner_id;
        std::optional<std::string> provider;
    };

    // Write side of one object. Exactly one of finalize or abort releases it.
    class BlobSink
    {
    public:
        virtual ~BlobSink() = default;

        virtual void write(std::span<const std::byte> data) = 0;

        virtual ObjectHandle finalize() = 0;

        virtual void abort() noexcept = 0;
    };

    class BlobStore
    {
    public:
        virtual ~BlobStore() = default;

        virtual std::string_view provider() const noexcept = 0;

        virtual std::unique_ptr<BlobSink> open_sink(const ObjectMetadata &metadata) = 0;

        virtual std::unique_ptr<ByteStream> open_read_stream(const ObjectHandle &handle) = 0;

        virtual void remove(const ObjectHandle &handle) = 0;
    };

} // namespace chunkvault::server
